#include <gtest/gtest.h>
#include "preview_builder.hpp"
#include "test_helpers.hpp"

using namespace faceflat;
using namespace faceflat::test;

TEST(Round3Test, RoundsToThreeDecimals) {
    EXPECT_DOUBLE_EQ(round3(1.23456), 1.235);
    EXPECT_DOUBLE_EQ(round3(-7.77777), -7.778);
    EXPECT_DOUBLE_EQ(round3(2.0), 2.0);
}

TEST(PreviewTest, SquareMeshBoundary) {
    auto face = planar_face({}, square_mesh(2.0));
    PreviewPayload preview = build_preview(3, *face);

    EXPECT_EQ(preview.face_id, 3u);
    EXPECT_EQ(preview.face_type, "Plane");
    EXPECT_FALSE(preview.placeholder);
    EXPECT_EQ(preview.entity_count, 1u);
    EXPECT_TRUE(preview.holes.empty());

    EXPECT_EQ(preview.boundary.type, PreviewShape::Polyline);
    EXPECT_TRUE(preview.boundary.closed);
    ASSERT_EQ(preview.boundary.points.size(), 5u);
    EXPECT_EQ(preview.boundary.points.front(), preview.boundary.points.back());

    EXPECT_DOUBLE_EQ(preview.dimensions.width, 2.0);
    EXPECT_DOUBLE_EQ(preview.dimensions.height, 2.0);
    EXPECT_DOUBLE_EQ(preview.dimensions.x_min, 0.0);
    EXPECT_DOUBLE_EQ(preview.dimensions.y_max, 2.0);
}

TEST(PreviewTest, OpenMeshWalkIsClosed) {
    PreviewPayload preview = build_preview(0, *planar_face({}, open_walk_mesh()));

    EXPECT_FALSE(preview.placeholder);
    EXPECT_TRUE(preview.boundary.closed);
    ASSERT_EQ(preview.boundary.points.size(), 4u);
    EXPECT_EQ(preview.boundary.points.front(), preview.boundary.points.back());
    EXPECT_EQ(preview.boundary.points[1], Vec2(4, 0));
}

TEST(PreviewTest, NoMeshGivesPlaceholder) {
    auto face = planar_face({rectangle_wire(0, 0, 1, 1)});
    PreviewPayload preview = build_preview(0, *face);

    EXPECT_TRUE(preview.placeholder);
    EXPECT_EQ(preview.entity_count, 1u);
    ASSERT_EQ(preview.boundary.points.size(), 5u);
    EXPECT_EQ(preview.boundary.points[2], Vec2(10, 10));
    EXPECT_EQ(preview.boundary.points[4], Vec2(0, 0));
    EXPECT_DOUBLE_EQ(preview.dimensions.width, 10.0);
    EXPECT_DOUBLE_EQ(preview.dimensions.height, 10.0);
}

TEST(PreviewTest, CollinearMeshGivesPlaceholder) {
    Mesh mesh;
    mesh.vertices = {Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(2, 0, 0)};
    auto face = planar_face({}, mesh);

    EXPECT_TRUE(build_preview(0, *face).placeholder);
}

TEST(PreviewTest, TriangulationFailureGivesPlaceholder) {
    class NoMeshFace : public MeshOnlyFace {
    public:
        NoMeshFace() : MeshOnlyFace(Mesh{}) {}
        Mesh triangulation() const override { throw KernelError("mesher failed"); }
    };

    NoMeshFace face;
    PreviewPayload preview = build_preview(1, face);
    EXPECT_TRUE(preview.placeholder);
    EXPECT_EQ(preview.face_type, "Unknown");
}

TEST(PreviewTest, DetectsCircularHole) {
    Mesh mesh = square_mesh(40.0);
    for (const auto& p : ring_points(Vec2(20, 20), 3.0, 12)) {
        mesh.vertices.push_back(Vec3(p.x, p.y, 0.0));
    }
    mesh.vertices.push_back(Vec3(20, 20, 0));
    auto face = planar_face({}, mesh);

    ExportConfig config;
    config.holes.min_radius = 2.5;
    config.holes.max_radius = 3.5;
    PreviewPayload preview = build_preview(0, *face, config);

    EXPECT_FALSE(preview.placeholder);
    ASSERT_EQ(preview.holes.size(), 1u);
    EXPECT_EQ(preview.entity_count, 2u);
    EXPECT_EQ(preview.holes[0].type, PreviewShape::Circle);
    EXPECT_DOUBLE_EQ(preview.holes[0].center.x, 20.0);
    EXPECT_DOUBLE_EQ(preview.holes[0].center.y, 20.0);
    EXPECT_DOUBLE_EQ(preview.holes[0].radius, 3.0);
    EXPECT_DOUBLE_EQ(preview.dimensions.width, 40.0);
}

TEST(PreviewTest, ShapeNames) {
    EXPECT_STREQ(preview_shape_name(PreviewShape::Polyline), "polyline");
    EXPECT_STREQ(preview_shape_name(PreviewShape::Circle), "circle");
}

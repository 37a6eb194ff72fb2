#include <gtest/gtest.h>
#include "memory_kernel.hpp"
#include "test_helpers.hpp"

using namespace faceflat;
using namespace faceflat::test;

// ============================================
// MemoryEdge Tests
// ============================================

TEST(MemoryEdgeTest, LineDomainIsLength) {
    auto edge = MemoryEdge::line(Vec3(0, 0, 0), Vec3(3, 4, 0));
    EXPECT_EQ(edge->curve_kind(), CurveKind::Line);

    auto [first, last] = edge->domain();
    EXPECT_DOUBLE_EQ(first, 0.0);
    EXPECT_DOUBLE_EQ(last, 5.0);
    EXPECT_DOUBLE_EQ(edge->length(), 5.0);

    Vec3 end = edge->value_at(last);
    EXPECT_NEAR(end.x, 3.0, 1e-12);
    EXPECT_NEAR(end.y, 4.0, 1e-12);
}

TEST(MemoryEdgeTest, DegenerateLineThrows) {
    EXPECT_THROW(MemoryEdge::line(Vec3(1, 1, 1), Vec3(1, 1, 1)), KernelError);
}

TEST(MemoryEdgeTest, CircleEvaluation) {
    auto edge = MemoryEdge::circle(Vec3(1, 2, 0), vec3::unit_z(), vec3::unit_x(), 2.0, 0.0, PI);
    EXPECT_EQ(edge->curve_kind(), CurveKind::Circle);

    Vec3 start = edge->value_at(0.0);
    Vec3 quarter = edge->value_at(PI / 2.0);
    EXPECT_NEAR(start.x, 3.0, 1e-12);
    EXPECT_NEAR(start.y, 2.0, 1e-12);
    EXPECT_NEAR(quarter.x, 1.0, 1e-12);
    EXPECT_NEAR(quarter.y, 4.0, 1e-12);

    CircleData data = edge->circle();
    EXPECT_DOUBLE_EQ(data.radius, 2.0);
    EXPECT_DOUBLE_EQ(data.center.y, 2.0);
    EXPECT_NEAR(edge->length(), 2.0 * PI, 1e-12);
}

TEST(MemoryEdgeTest, WrongAccessorThrows) {
    auto line = MemoryEdge::line(Vec3(0, 0, 0), Vec3(1, 0, 0));
    EXPECT_THROW(line->circle(), KernelError);
    EXPECT_THROW(line->ellipse(), KernelError);
}

TEST(MemoryEdgeTest, EllipseValidation) {
    EXPECT_THROW(MemoryEdge::ellipse(Vec3(0, 0, 0), vec3::unit_z(), vec3::unit_x(), 1.0, 2.0, 0.0, PI),
                 KernelError);
    EXPECT_THROW(MemoryEdge::circle(Vec3(0, 0, 0), vec3::unit_z(), vec3::unit_x(), 0.0, 0.0, PI),
                 KernelError);

    auto edge = MemoryEdge::ellipse(Vec3(0, 0, 0), vec3::unit_z(), vec3::unit_x(), 4.0, 2.0, 0.0, 2.0 * PI);
    EXPECT_EQ(edge->curve_kind(), CurveKind::Ellipse);
    Vec3 top = edge->value_at(PI / 2.0);
    EXPECT_NEAR(top.y, 2.0, 1e-12);
    EllipseData data = edge->ellipse();
    EXPECT_DOUBLE_EQ(data.major_radius, 4.0);
    EXPECT_DOUBLE_EQ(data.minor_radius, 2.0);
}

TEST(MemoryEdgeTest, SplineIsOtherKind) {
    auto edge = MemoryEdge::spline({Vec3(0, 0, 0), Vec3(1, 1, 0), Vec3(2, 0, 0)});
    EXPECT_EQ(edge->curve_kind(), CurveKind::Other);
    EXPECT_DOUBLE_EQ(edge->domain().second, 2.0);
    EXPECT_GT(edge->length(), 2.0);

    EXPECT_THROW(MemoryEdge::spline({Vec3(0, 0, 0)}), KernelError);
}

// ============================================
// MemoryWire / MemoryFace Tests
// ============================================

TEST(MemoryWireTest, LengthSumsEdges) {
    auto wire = rectangle_wire(0, 0, 4, 2);
    EXPECT_EQ(wire->edges().size(), 4u);
    EXPECT_NEAR(wire->length(), 12.0, 1e-12);
}

TEST(MemoryFaceTest, MissingNormalThrows) {
    auto face = planar_face({rectangle_wire(0, 0, 1, 1)}, Mesh{}, std::nullopt);
    EXPECT_THROW(face->normal(), KernelError);
    EXPECT_EQ(face->surface_kind(), SurfaceKind::Plane);
    EXPECT_EQ(face->wires().size(), 1u);
}

TEST(KernelNamesTest, KindNames) {
    EXPECT_STREQ(surface_kind_name(SurfaceKind::Plane), "Plane");
    EXPECT_STREQ(curve_kind_name(CurveKind::Ellipse), "Ellipse");
}

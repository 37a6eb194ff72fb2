#include <gtest/gtest.h>
#include "normal_resolver.hpp"
#include "test_helpers.hpp"

using namespace faceflat;
using namespace faceflat::test;

TEST(NormalResolverTest, UsesKernelNormal) {
    auto face = planar_face({rectangle_wire(0, 0, 1, 1)}, Mesh{}, Vec3(0, 2, 0));
    Vec3 n = resolve_face_normal(*face);
    EXPECT_NEAR(n.y, 1.0, 1e-12);
    EXPECT_NEAR(n.length(), 1.0, 1e-12);
}

TEST(NormalResolverTest, FallsBackToMesh) {
    Mesh mesh;
    mesh.vertices = {Vec3(0, 0, 0), Vec3(0, 1, 0), Vec3(1, 0, 0)};
    mesh.triangles = {{0, 1, 2}};
    auto face = planar_face({}, mesh, std::nullopt);

    Vec3 n = resolve_face_normal(*face);
    EXPECT_NEAR(n.z, -1.0, 1e-12);
}

TEST(NormalResolverTest, ZeroKernelNormalFallsBackToMesh) {
    auto face = planar_face({}, square_mesh(2.0), vec3::zero());
    Vec3 n = resolve_face_normal(*face);
    EXPECT_NEAR(n.z, 1.0, 1e-12);
}

TEST(NormalResolverTest, DefaultsToZ) {
    auto face = planar_face({}, Mesh{}, std::nullopt);
    Vec3 n = resolve_face_normal(*face);
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
    EXPECT_DOUBLE_EQ(n.z, 1.0);
}

TEST(MeshNormalTest, RejectsBadTriangles) {
    Mesh collinear;
    collinear.vertices = {Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(2, 0, 0)};
    collinear.triangles = {{0, 1, 2}};
    EXPECT_FALSE(mesh_normal(collinear).has_value());

    Mesh out_of_range;
    out_of_range.vertices = {Vec3(0, 0, 0), Vec3(1, 0, 0), Vec3(0, 1, 0)};
    out_of_range.triangles = {{0, 1, 7}};
    EXPECT_FALSE(mesh_normal(out_of_range).has_value());

    EXPECT_FALSE(mesh_normal(Mesh{}).has_value());
}

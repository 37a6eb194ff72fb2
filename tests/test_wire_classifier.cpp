#include <gtest/gtest.h>
#include "wire_classifier.hpp"
#include "test_helpers.hpp"

using namespace faceflat;
using namespace faceflat::test;

TEST(WireClassifierTest, LongestIsBoundary) {
    auto roles = classify_wire_lengths({40.0, 10.0, 8.0});
    ASSERT_EQ(roles.size(), 3u);
    EXPECT_EQ(roles[0].role, PrimitiveClass::Boundary);
    EXPECT_EQ(roles[1].role, PrimitiveClass::Hole);
    EXPECT_EQ(roles[2].role, PrimitiveClass::Hole);
    EXPECT_EQ(roles[2].index, 2u);
    EXPECT_DOUBLE_EQ(roles[1].length, 10.0);
}

TEST(WireClassifierTest, BoundaryNeedNotBeFirst) {
    auto roles = classify_wire_lengths({5.0, 12.0, 3.0});
    EXPECT_EQ(roles[0].role, PrimitiveClass::Hole);
    EXPECT_EQ(roles[1].role, PrimitiveClass::Boundary);
    EXPECT_EQ(roles[2].role, PrimitiveClass::Hole);
}

TEST(WireClassifierTest, TieGoesToFirst) {
    auto roles = classify_wire_lengths({7.0, 7.0});
    EXPECT_EQ(roles[0].role, PrimitiveClass::Boundary);
    EXPECT_EQ(roles[1].role, PrimitiveClass::Hole);
}

TEST(WireClassifierTest, ExactlyOneBoundary) {
    auto roles = classify_wire_lengths({1.0, 2.0, 3.0, 3.5, 0.5});
    int boundaries = 0;
    for (const auto& r : roles) {
        if (r.role == PrimitiveClass::Boundary) ++boundaries;
    }
    EXPECT_EQ(boundaries, 1);
    EXPECT_EQ(roles[3].role, PrimitiveClass::Boundary);
}

TEST(WireClassifierTest, EmptyInput) {
    EXPECT_TRUE(classify_wire_lengths({}).empty());
}

TEST(WireClassifierTest, UsesKernelLengths) {
    WireList wires = {
        circle_wire(Vec3(5, 5, 0), 1.0),
        rectangle_wire(0, 0, 10, 10),
        circle_wire(Vec3(2, 2, 0), 0.5),
    };
    auto roles = classify_wires(wires);
    ASSERT_EQ(roles.size(), 3u);
    EXPECT_EQ(roles[1].role, PrimitiveClass::Boundary);
    EXPECT_NEAR(roles[1].length, 40.0, 1e-9);
    EXPECT_EQ(roles[0].role, PrimitiveClass::Hole);
}

TEST(WireClassifierTest, FailingLengthRanksAsZero) {
    WireList wires = {
        std::make_shared<FailingWire>(),
        rectangle_wire(0, 0, 1, 1),
    };
    auto roles = classify_wires(wires);
    ASSERT_EQ(roles.size(), 2u);
    EXPECT_DOUBLE_EQ(roles[0].length, 0.0);
    EXPECT_EQ(roles[0].role, PrimitiveClass::Hole);
    EXPECT_EQ(roles[1].role, PrimitiveClass::Boundary);
}

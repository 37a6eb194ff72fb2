#include <gtest/gtest.h>
#include "convex_hull.hpp"

using namespace faceflat;

TEST(ConvexHullTest, SquareWithInteriorPoint) {
    std::vector<Vec2> points = {
        Vec2(0.5, 0.5), Vec2(1, 1), Vec2(0, 0), Vec2(0, 1), Vec2(1, 0),
    };

    auto hull = convex_hull(points);
    ASSERT_EQ(hull.size(), 4u);
    EXPECT_EQ(hull[0], Vec2(0, 0));
    EXPECT_EQ(hull[1], Vec2(1, 0));
    EXPECT_EQ(hull[2], Vec2(1, 1));
    EXPECT_EQ(hull[3], Vec2(0, 1));
}

TEST(ConvexHullTest, CollinearPointsDropped) {
    std::vector<Vec2> points = {
        Vec2(0, 0), Vec2(1, 0), Vec2(2, 0), Vec2(2, 2), Vec2(0, 2), Vec2(0, 1),
    };
    auto hull = convex_hull(points);
    EXPECT_EQ(hull.size(), 4u);
}

TEST(ConvexHullTest, HullIsCounterClockwise) {
    std::vector<Vec2> points = {
        Vec2(3, 1), Vec2(-2, 4), Vec2(0, -3), Vec2(1, 1), Vec2(5, 5), Vec2(-4, -1),
    };
    auto hull = convex_hull(points);
    ASSERT_GE(hull.size(), 3u);

    double area2 = 0.0;
    for (size_t i = 0; i < hull.size(); ++i) {
        area2 += hull[i].cross(hull[(i + 1) % hull.size()]);
    }
    EXPECT_GT(area2, 0.0);
}

TEST(ConvexHullTest, FewPointsReturnedSorted) {
    auto hull = convex_hull({Vec2(2, 2), Vec2(1, 1), Vec2(2, 2)});
    ASSERT_EQ(hull.size(), 2u);
    EXPECT_EQ(hull[0], Vec2(1, 1));
    EXPECT_EQ(hull[1], Vec2(2, 2));
}

TEST(DedupPointsTest, MergesWithinTolerance) {
    std::vector<Vec2> points = {
        Vec2(0, 0), Vec2(0.0005, 0.0005), Vec2(1, 0), Vec2(1.0002, 0.0), Vec2(0, 0.002),
    };
    auto unique = dedup_points(points, 0.001);
    ASSERT_EQ(unique.size(), 3u);
    EXPECT_EQ(unique[0], Vec2(0, 0));
    EXPECT_EQ(unique[1], Vec2(1, 0));
    EXPECT_EQ(unique[2], Vec2(0, 0.002));
}

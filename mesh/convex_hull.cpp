#include "convex_hull.hpp"
#include <algorithm>
#include <cmath>

namespace faceflat {

namespace {

// > 0 when o -> a -> b turns counter-clockwise
double turn(const Vec2& o, const Vec2& a, const Vec2& b) {
    return (a - o).cross(b - o);
}

}  // namespace

std::vector<Vec2> dedup_points(const std::vector<Vec2>& points, double tolerance) {
    std::vector<Vec2> unique;
    for (const auto& p : points) {
        bool duplicate = std::any_of(unique.begin(), unique.end(), [&](const Vec2& q) {
            return std::abs(p.x - q.x) < tolerance && std::abs(p.y - q.y) < tolerance;
        });
        if (!duplicate) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::vector<Vec2> convex_hull(const std::vector<Vec2>& points) {
    std::vector<Vec2> sorted = points;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    if (sorted.size() < 3) {
        return sorted;
    }

    std::vector<Vec2> lower;
    for (const auto& p : sorted) {
        while (lower.size() >= 2 && turn(lower[lower.size() - 2], lower.back(), p) <= 0.0) {
            lower.pop_back();
        }
        lower.push_back(p);
    }

    std::vector<Vec2> upper;
    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
        while (upper.size() >= 2 && turn(upper[upper.size() - 2], upper.back(), *it) <= 0.0) {
            upper.pop_back();
        }
        upper.push_back(*it);
    }

    // Each chain ends where the other begins
    lower.pop_back();
    upper.pop_back();
    lower.insert(lower.end(), upper.begin(), upper.end());
    return lower;
}

}  // namespace faceflat

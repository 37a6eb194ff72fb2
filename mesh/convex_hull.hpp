#ifndef FACEFLAT_MESH_CONVEX_HULL_HPP
#define FACEFLAT_MESH_CONVEX_HULL_HPP

#include <math/vec2.hpp>
#include <vector>

namespace faceflat {

// Points with no earlier point within tolerance on both axes, in input order
std::vector<Vec2> dedup_points(const std::vector<Vec2>& points, double tolerance);

// Monotone-chain hull, counter-clockwise from the lexicographically smallest
// point. Collinear points are dropped. Fewer than 3 distinct points are
// returned sorted.
std::vector<Vec2> convex_hull(const std::vector<Vec2>& points);

}  // namespace faceflat

#endif // FACEFLAT_MESH_CONVEX_HULL_HPP

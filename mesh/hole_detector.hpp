#ifndef FACEFLAT_MESH_HOLE_DETECTOR_HPP
#define FACEFLAT_MESH_HOLE_DETECTOR_HPP

#include <math/vec2.hpp>
#include <primitives/primitive.hpp>
#include <vector>

namespace faceflat {

// Thresholds for guessing circular holes from loose mesh points
struct HoleDetectionConfig {
    size_t min_points = 10;            // total points before detection runs
    size_t min_interior_points = 6;    // points inside the boundary

    // Distances from a candidate center that may be a hole radius
    double min_radius = 1.0;
    double max_radius = 10.0;

    // Points within this fraction of a radius belong to that ring
    double radius_tolerance_fraction = 0.2;
    size_t min_cluster_size = 6;

    // A cluster is a circle when this fraction of its points sits within
    // the tolerance fraction of the mean radial distance
    double circularity_tolerance_fraction = 0.25;
    double circularity_min_fraction = 0.75;
};

// Points hypothesized to lie on one hole boundary
using HoleCluster = std::vector<Vec2>;

struct CircleFit {
    Vec2 center;
    double radius = 0.0;
};

// Even-odd ray cast; points exactly on an edge may land either way
bool point_in_polygon(const Vec2& point, const std::vector<Vec2>& polygon);

// Greedy ring clustering. Candidates are visited in lexicographic order so
// the result does not depend on input order.
std::vector<HoleCluster> detect_circular_clusters(const std::vector<Vec2>& points,
                                                  const HoleDetectionConfig& config = HoleDetectionConfig{});

bool is_circle(const HoleCluster& cluster,
               const HoleDetectionConfig& config = HoleDetectionConfig{});

// Centroid and mean distance to it
CircleFit fit_circle(const HoleCluster& cluster);

// Clusters of points strictly inside the boundary polygon
std::vector<HoleCluster> find_holes(const std::vector<Vec2>& points,
                                    const std::vector<Vec2>& boundary,
                                    const HoleDetectionConfig& config = HoleDetectionConfig{});

// Hole primitives: a Circle per circular cluster, a closed Polyline for the
// rest. Clusters of fewer than 3 points are dropped.
std::vector<Primitive> detect_holes(const std::vector<Vec2>& points,
                                    const std::vector<Vec2>& boundary,
                                    const HoleDetectionConfig& config = HoleDetectionConfig{});

}  // namespace faceflat

#endif // FACEFLAT_MESH_HOLE_DETECTOR_HPP

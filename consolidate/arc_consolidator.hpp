#ifndef FACEFLAT_CONSOLIDATE_ARC_CONSOLIDATOR_HPP
#define FACEFLAT_CONSOLIDATE_ARC_CONSOLIDATOR_HPP

#include <primitives/primitive.hpp>
#include <vector>

namespace faceflat {

struct ArcConsolidationConfig {
    // Arcs are grouped by class and radius rounded to this many decimals
    int radius_decimals = 3;

    // Candidate centers within this distance on both axes share a cluster
    double center_tolerance = 0.1;

    // Coarse coverage estimate per arc (degrees) and the total that makes
    // a group a full circle
    double large_arc_coverage_deg = 180.0;
    double small_arc_coverage_deg = 90.0;
    double coverage_threshold_deg = 300.0;
};

// Up to two circle centers consistent with a chord of the given radius.
// Empty when the chord is longer than the diameter.
std::vector<Vec2> chord_center_candidates(const Vec2& start, const Vec2& end, double radius);

// Sum of per-arc coverage guesses; large arcs count 180, the rest 90.
// Not an exact angle sum.
double estimate_arc_coverage_deg(const std::vector<primitive::Arc>& arcs,
                                 const ArcConsolidationConfig& config = ArcConsolidationConfig{});

// Replaces groups of co-radius, co-center arcs that together look like a
// full circle with a single Circle. The circle takes the slot of the
// group's first arc; all other primitives keep their relative order.
std::vector<Primitive> consolidate_arcs(const std::vector<Primitive>& primitives,
                                        const ArcConsolidationConfig& config = ArcConsolidationConfig{});

}  // namespace faceflat

#endif // FACEFLAT_CONSOLIDATE_ARC_CONSOLIDATOR_HPP

#include "arc_consolidator.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <utility>

namespace faceflat {

namespace {

// Chords a hair longer than the diameter still count as diameters
constexpr double CHORD_EPSILON = 1e-6;

// Perpendicular offset falls back to +x below this chord x-extent
constexpr double VERTICAL_CHORD_EPSILON = 0.001;

struct ArcGroup {
    PrimitiveClass cls;
    double radius;
    std::vector<size_t> indices;  // positions in the primitive list
};

// Representative of a cluster is its first member
std::optional<Vec2> shared_center(const std::vector<primitive::Arc>& arcs,
                                  double radius,
                                  const ArcConsolidationConfig& config) {
    std::vector<std::vector<Vec2>> clusters;
    for (const auto& arc : arcs) {
        Vec2 start = arc_point(arc, arc.start_angle);
        Vec2 end = arc_point(arc, arc.end_angle);
        for (const Vec2& c : chord_center_candidates(start, end, radius)) {
            bool added = false;
            for (auto& cluster : clusters) {
                const Vec2& rep = cluster.front();
                if (std::abs(c.x - rep.x) < config.center_tolerance &&
                    std::abs(c.y - rep.y) < config.center_tolerance) {
                    cluster.push_back(c);
                    added = true;
                    break;
                }
            }
            if (!added) {
                clusters.push_back({c});
            }
        }
    }

    if (clusters.empty()) {
        return std::nullopt;
    }

    // First of the largest clusters
    auto largest = std::max_element(clusters.begin(), clusters.end(),
        [](const auto& a, const auto& b) { return a.size() < b.size(); });
    if (largest->size() < arcs.size()) {
        return std::nullopt;
    }

    Vec2 sum;
    for (const Vec2& c : *largest) {
        sum += c;
    }
    return sum / static_cast<double>(largest->size());
}

}  // namespace

std::vector<Vec2> chord_center_candidates(const Vec2& start, const Vec2& end, double radius) {
    std::vector<Vec2> centers;
    Vec2 chord = end - start;
    double chord_half = chord.length() / 2.0;
    if (chord_half > radius + CHORD_EPSILON) {
        return centers;
    }

    double center_distance = std::sqrt(std::max(0.0, radius * radius - chord_half * chord_half));

    Vec2 perp = std::abs(chord.x) > VERTICAL_CHORD_EPSILON ? Vec2(-chord.y, chord.x) : Vec2(1.0, 0.0);
    double perp_len = perp.length();
    if (perp_len > 0.0) {
        perp = perp / perp_len;
    }

    Vec2 mid = (start + end) / 2.0;
    centers.push_back(mid + perp * center_distance);
    centers.push_back(mid - perp * center_distance);
    return centers;
}

double estimate_arc_coverage_deg(const std::vector<primitive::Arc>& arcs,
                                 const ArcConsolidationConfig& config) {
    double total = 0.0;
    for (const auto& arc : arcs) {
        total += arc.large_arc_flag == 1 ? config.large_arc_coverage_deg
                                         : config.small_arc_coverage_deg;
    }
    return total;
}

std::vector<Primitive> consolidate_arcs(const std::vector<Primitive>& primitives,
                                        const ArcConsolidationConfig& config) {
    auto log = logging::get_logger();
    double scale = std::pow(10.0, config.radius_decimals);

    // Groups keep first-appearance order
    std::vector<ArcGroup> groups;
    std::map<std::pair<int, long long>, size_t> group_lookup;

    for (size_t i = 0; i < primitives.size(); ++i) {
        const auto* arc = std::get_if<primitive::Arc>(&primitives[i].shape);
        if (!arc) {
            continue;
        }
        long long radius_key = std::llround(arc->radius * scale);
        auto key = std::make_pair(static_cast<int>(primitives[i].cls), radius_key);
        auto it = group_lookup.find(key);
        if (it == group_lookup.end()) {
            group_lookup.emplace(key, groups.size());
            groups.push_back({primitives[i].cls, static_cast<double>(radius_key) / scale, {i}});
        } else {
            groups[it->second].indices.push_back(i);
        }
    }

    // Position of each consolidated group's first arc -> replacement circle
    std::map<size_t, primitive::Circle> replacements;
    std::vector<bool> dropped(primitives.size(), false);

    for (const auto& group : groups) {
        if (group.indices.size() < 2) {
            continue;
        }

        std::vector<primitive::Arc> arcs;
        arcs.reserve(group.indices.size());
        for (size_t idx : group.indices) {
            arcs.push_back(std::get<primitive::Arc>(primitives[idx].shape));
        }

        auto center = shared_center(arcs, group.radius, config);
        if (!center) {
            log->debug("Arcs r={:.3f} ({}) do not share a center", group.radius,
                       primitive_class_name(group.cls));
            continue;
        }

        double coverage = estimate_arc_coverage_deg(arcs, config);
        if (coverage < config.coverage_threshold_deg) {
            log->debug("Arcs r={:.3f} ({}) cover ~{:.0f} deg, kept as arcs",
                       group.radius, primitive_class_name(group.cls), coverage);
            continue;
        }

        log->info("Consolidating {} arcs into circle: center=({:.2f},{:.2f}), radius={:.2f}, class={}",
                  arcs.size(), center->x, center->y, group.radius,
                  primitive_class_name(group.cls));

        replacements.emplace(group.indices.front(), primitive::Circle{*center, group.radius});
        for (size_t idx : group.indices) {
            dropped[idx] = true;
        }
    }

    std::vector<Primitive> result;
    result.reserve(primitives.size());
    for (size_t i = 0; i < primitives.size(); ++i) {
        auto it = replacements.find(i);
        if (it != replacements.end()) {
            result.push_back(Primitive{it->second, primitives[i].cls});
        } else if (!dropped[i]) {
            result.push_back(primitives[i]);
        }
    }
    return result;
}

}  // namespace faceflat

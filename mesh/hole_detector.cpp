#include "hole_detector.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace faceflat {

bool point_in_polygon(const Vec2& point, const std::vector<Vec2>& polygon) {
    size_t n = polygon.size();
    if (n == 0) {
        return false;
    }

    bool inside = false;
    Vec2 p1 = polygon[0];
    for (size_t i = 1; i <= n; ++i) {
        Vec2 p2 = polygon[i % n];
        if (point.y > std::min(p1.y, p2.y) && point.y <= std::max(p1.y, p2.y) &&
            point.x <= std::max(p1.x, p2.x)) {
            // p1.y != p2.y here, the band test above excludes horizontal edges
            double x_cross = (point.y - p1.y) * (p2.x - p1.x) / (p2.y - p1.y) + p1.x;
            if (p1.x == p2.x || point.x <= x_cross) {
                inside = !inside;
            }
        }
        p1 = p2;
    }
    return inside;
}

std::vector<HoleCluster> detect_circular_clusters(const std::vector<Vec2>& points,
                                                  const HoleDetectionConfig& config) {
    std::vector<HoleCluster> clusters;
    if (points.size() < config.min_cluster_size) {
        return clusters;
    }

    std::vector<Vec2> sorted = points;
    std::sort(sorted.begin(), sorted.end());
    std::vector<bool> used(sorted.size(), false);

    struct Ring {
        size_t index;
        double distance;
    };

    for (size_t i = 0; i < sorted.size(); ++i) {
        if (used[i]) {
            continue;
        }
        const Vec2& center = sorted[i];

        std::vector<Ring> ring;
        for (size_t j = 0; j < sorted.size(); ++j) {
            if (used[j]) {
                continue;
            }
            double dist = sorted[j].distance_to(center);
            if (dist >= config.min_radius && dist <= config.max_radius) {
                ring.push_back({j, dist});
            }
        }
        if (ring.size() < config.min_cluster_size) {
            continue;
        }

        std::vector<double> distances;
        distances.reserve(ring.size());
        for (const auto& r : ring) {
            distances.push_back(r.distance);
        }
        std::sort(distances.begin(), distances.end());

        // Smallest radius that gathers enough points
        for (double d : distances) {
            double tolerance = d * config.radius_tolerance_fraction;
            HoleCluster cluster;
            std::vector<size_t> members;
            for (const auto& r : ring) {
                if (std::abs(r.distance - d) <= tolerance) {
                    cluster.push_back(sorted[r.index]);
                    members.push_back(r.index);
                }
            }
            if (cluster.size() >= config.min_cluster_size) {
                for (size_t m : members) {
                    used[m] = true;
                }
                logging::get_logger()->debug("Found potential hole with {} points at distance {:.2f}",
                                             cluster.size(), d);
                clusters.push_back(std::move(cluster));
                break;
            }
        }
    }
    return clusters;
}

CircleFit fit_circle(const HoleCluster& cluster) {
    CircleFit fit;
    if (cluster.empty()) {
        return fit;
    }

    Vec2 sum;
    for (const auto& p : cluster) {
        sum += p;
    }
    fit.center = sum / static_cast<double>(cluster.size());

    double total = 0.0;
    for (const auto& p : cluster) {
        total += p.distance_to(fit.center);
    }
    fit.radius = total / static_cast<double>(cluster.size());
    return fit;
}

bool is_circle(const HoleCluster& cluster, const HoleDetectionConfig& config) {
    if (cluster.size() < config.min_cluster_size) {
        return false;
    }

    CircleFit fit = fit_circle(cluster);
    double tolerance = fit.radius * config.circularity_tolerance_fraction;
    size_t similar = std::count_if(cluster.begin(), cluster.end(), [&](const Vec2& p) {
        return std::abs(p.distance_to(fit.center) - fit.radius) <= tolerance;
    });
    return static_cast<double>(similar) >=
           static_cast<double>(cluster.size()) * config.circularity_min_fraction;
}

std::vector<HoleCluster> find_holes(const std::vector<Vec2>& points,
                                    const std::vector<Vec2>& boundary,
                                    const HoleDetectionConfig& config) {
    if (points.size() < config.min_points) {
        return {};
    }

    std::vector<Vec2> inside;
    for (const auto& p : points) {
        if (point_in_polygon(p, boundary)) {
            inside.push_back(p);
        }
    }
    if (inside.size() < config.min_interior_points) {
        return {};
    }
    return detect_circular_clusters(inside, config);
}

std::vector<Primitive> detect_holes(const std::vector<Vec2>& points,
                                    const std::vector<Vec2>& boundary,
                                    const HoleDetectionConfig& config) {
    std::vector<Primitive> holes;
    for (auto& cluster : find_holes(points, boundary, config)) {
        if (cluster.size() < 3) {
            continue;
        }
        if (is_circle(cluster, config)) {
            CircleFit fit = fit_circle(cluster);
            holes.push_back({primitive::Circle{fit.center, fit.radius}, PrimitiveClass::Hole});
        } else {
            holes.push_back({primitive::Polyline{std::move(cluster), true}, PrimitiveClass::Hole});
        }
    }
    logging::get_logger()->debug("Detected {} hole(s)", holes.size());
    return holes;
}

}  // namespace faceflat

#include "edge_classifier.hpp"
#include "arc_direction.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <numbers>
#include <utility>

namespace faceflat {

bool is_full_turn(double first, double last, double tolerance) {
    double range = std::abs(last - first);
    return std::abs(range - 2.0 * std::numbers::pi) < tolerance;
}

EdgeClassifier::EdgeClassifier(const PlaneProjector& projector,
                               const EdgeClassifierConfig& config)
    : projector_(projector), config_(config) {}

std::optional<Primitive> EdgeClassifier::classify(const EdgeHandle& edge,
                                                  PrimitiveClass cls) const {
    switch (edge.curve_kind()) {
        case CurveKind::Line: {
            auto [first, last] = edge.domain();
            primitive::Line line{projector_.project(edge.value_at(first)),
                                 projector_.project(edge.value_at(last))};
            return Primitive{line, cls};
        }
        case CurveKind::Circle:
            return classify_circle(edge, cls);
        case CurveKind::Ellipse:
            return classify_ellipse(edge, cls);
        case CurveKind::Other:
            return as_polyline(edge, cls, config_.export_samples);
    }
    return std::nullopt;
}

std::optional<Primitive> EdgeClassifier::classify_circle(const EdgeHandle& edge,
                                                         PrimitiveClass cls) const {
    auto log = logging::get_logger();
    auto [first, last] = edge.domain();

    try {
        CircleData circle = edge.circle();
        Vec2 center = projector_.project(circle.center);

        if (is_full_turn(first, last, config_.full_turn_tolerance)) {
            log->trace("  circle: center=({:.3f},{:.3f}) r={:.3f}",
                       center.x, center.y, circle.radius);
            return Primitive{primitive::Circle{center, circle.radius}, cls};
        }

        Vec2 start = projector_.project(edge.value_at(first));
        Vec2 end = projector_.project(edge.value_at(last));
        Vec2 mid = projector_.project(edge.value_at((first + last) / 2.0));

        auto dir = resolve_arc_direction(center, start, end, mid);
        if (is_ok(dir)) {
            const ArcDirection& d = value(dir);
            log->trace("  arc: center=({:.3f},{:.3f}) r={:.3f} angles={:.1f}-{:.1f} diff={:.1f} sweep={} large={}",
                       center.x, center.y, circle.radius, d.start_angle, d.end_angle,
                       d.angle_diff, d.sweep_flag, d.large_arc_flag);
            primitive::Arc arc{center, circle.radius, d.start_angle, d.end_angle,
                               d.sweep_flag, d.large_arc_flag};
            return Primitive{arc, cls};
        }
        log->warn("Arc direction unresolved ({}), using polyline", error(dir).message);
    } catch (const KernelError& e) {
        log->warn("Circle data unavailable ({}), using polyline", e.what());
    }

    return as_polyline(edge, cls, config_.secondary_samples);
}

std::optional<Primitive> EdgeClassifier::classify_ellipse(const EdgeHandle& edge,
                                                          PrimitiveClass cls) const {
    auto [first, last] = edge.domain();
    if (!is_full_turn(first, last, config_.full_turn_tolerance)) {
        // No elliptical-arc primitive
        return as_polyline(edge, cls, config_.secondary_samples);
    }

    try {
        EllipseData ellipse = edge.ellipse();
        primitive::Ellipse e;
        e.center = projector_.project(ellipse.center);
        e.major_axis = projector_.project(ellipse.major_direction) * ellipse.major_radius;
        e.ratio = ellipse.minor_radius / ellipse.major_radius;
        return Primitive{e, cls};
    } catch (const KernelError& e) {
        logging::get_logger()->warn("Ellipse data unavailable ({}), using polyline", e.what());
    }
    return as_polyline(edge, cls, config_.secondary_samples);
}

std::optional<Primitive> EdgeClassifier::as_polyline(const EdgeHandle& edge,
                                                     PrimitiveClass cls,
                                                     int samples) const {
    std::vector<Vec2> points = sample_points(edge, samples);
    if (points.size() < 2) {
        return std::nullopt;
    }
    logging::get_logger()->trace("  polyline: {} points", points.size());
    return Primitive{primitive::Polyline{std::move(points), false}, cls};
}

std::vector<Vec2> EdgeClassifier::sample_points(const EdgeHandle& edge, int samples) const {
    auto [first, last] = edge.domain();
    std::vector<Vec2> points;
    if (samples < 1) {
        return points;
    }

    for (int i = 0; i <= samples; ++i) {
        double param = first + (last - first) * i / samples;
        Vec2 p = projector_.project(edge.value_at(param));
        if (!points.empty() && p.distance_to(points.back()) <= config_.min_segment_length) {
            continue;
        }
        points.push_back(p);
    }
    return points;
}

WireClassification EdgeClassifier::classify_wire(const WireHandle& wire,
                                                 PrimitiveClass cls) const {
    auto log = logging::get_logger();
    WireClassification result;

    for (const auto& edge : wire.edges()) {
        ++result.edge_count;
        try {
            if (auto prim = classify(*edge, cls)) {
                result.primitives.push_back(std::move(*prim));
            }
        } catch (const KernelError& e) {
            ++result.skipped_edges;
            log->warn("Skipping edge {} ({}): {}", result.edge_count,
                      error_kind_name(ErrorKind::CurveEvaluation), e.what());
        }
    }

    log->debug("Wire ({}): {} edges -> {} primitives, {} skipped",
               primitive_class_name(cls), result.edge_count,
               result.primitives.size(), result.skipped_edges);
    return result;
}

}  // namespace faceflat

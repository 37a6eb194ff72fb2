#include "memory_kernel.hpp"
#include <cmath>
#include <type_traits>
#include <utility>

namespace faceflat {

namespace {

// Samples used to integrate lengths of curves without a closed form
constexpr int kLengthSamples = 64;

Vec3 in_plane_y(const Vec3& axis, const Vec3& x_dir) {
    return axis.cross(x_dir).normalized();
}

}  // namespace

MemoryEdge::MemoryEdge(AnalyticCurve curve, double first, double last)
    : curve_(std::move(curve)), first_(first), last_(last) {}

std::shared_ptr<MemoryEdge> MemoryEdge::line(const Vec3& start, const Vec3& end) {
    Vec3 delta = end - start;
    double len = delta.length();
    if (len <= 0.0) {
        throw KernelError("Degenerate line edge: start and end coincide");
    }
    return std::make_shared<MemoryEdge>(LineCurve{start, delta / len}, 0.0, len);
}

std::shared_ptr<MemoryEdge> MemoryEdge::circle(const Vec3& center, const Vec3& axis,
                                               const Vec3& x_dir, double radius,
                                               double first, double last) {
    if (radius <= 0.0) {
        throw KernelError("Circle edge requires a positive radius");
    }
    Vec3 n = axis.normalized();
    // Re-orthogonalize the reference direction against the axis
    Vec3 x = (x_dir - n * x_dir.dot(n)).normalized();
    return std::make_shared<MemoryEdge>(CircleCurve{center, n, x, radius}, first, last);
}

std::shared_ptr<MemoryEdge> MemoryEdge::ellipse(const Vec3& center, const Vec3& axis,
                                                const Vec3& major_dir,
                                                double major_radius, double minor_radius,
                                                double first, double last) {
    if (major_radius <= 0.0 || minor_radius <= 0.0 || minor_radius > major_radius) {
        throw KernelError("Ellipse edge requires 0 < minor_radius <= major_radius");
    }
    Vec3 n = axis.normalized();
    Vec3 x = (major_dir - n * major_dir.dot(n)).normalized();
    return std::make_shared<MemoryEdge>(
        EllipseCurve{center, n, x, major_radius, minor_radius}, first, last);
}

std::shared_ptr<MemoryEdge> MemoryEdge::spline(const std::vector<Vec3>& through_points) {
    if (through_points.size() < 2) {
        throw KernelError("Spline edge requires at least two points");
    }
    BezierSpline spline = BezierSpline::through_points(through_points);
    double last = static_cast<double>(spline.segment_count());
    return std::make_shared<MemoryEdge>(std::move(spline), 0.0, last);
}

CurveKind MemoryEdge::curve_kind() const {
    return std::visit([](auto&& c) -> CurveKind {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, LineCurve>) return CurveKind::Line;
        else if constexpr (std::is_same_v<T, CircleCurve>) return CurveKind::Circle;
        else if constexpr (std::is_same_v<T, EllipseCurve>) return CurveKind::Ellipse;
        else return CurveKind::Other;
    }, curve_);
}

Vec3 MemoryEdge::value_at(double t) const {
    return std::visit([t](auto&& c) -> Vec3 {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, LineCurve>) {
            return c.origin + c.direction * t;
        } else if constexpr (std::is_same_v<T, CircleCurve>) {
            Vec3 y = in_plane_y(c.axis, c.x_dir);
            return c.center + (c.x_dir * std::cos(t) + y * std::sin(t)) * c.radius;
        } else if constexpr (std::is_same_v<T, EllipseCurve>) {
            Vec3 y = in_plane_y(c.axis, c.major_dir);
            return c.center + c.major_dir * (c.major_radius * std::cos(t)) +
                   y * (c.minor_radius * std::sin(t));
        } else {
            return c.evaluate(t);
        }
    }, curve_);
}

CircleData MemoryEdge::circle() const {
    const auto* c = std::get_if<CircleCurve>(&curve_);
    if (!c) {
        throw KernelError(std::string("Edge is not a circle: ") + curve_kind_name(curve_kind()));
    }
    return CircleData{c->center, c->radius};
}

EllipseData MemoryEdge::ellipse() const {
    const auto* e = std::get_if<EllipseCurve>(&curve_);
    if (!e) {
        throw KernelError(std::string("Edge is not an ellipse: ") + curve_kind_name(curve_kind()));
    }
    return EllipseData{e->center, e->major_dir, e->major_radius, e->minor_radius};
}

double MemoryEdge::length() const {
    if (const auto* c = std::get_if<CircleCurve>(&curve_)) {
        return c->radius * std::abs(last_ - first_);
    }
    if (std::holds_alternative<LineCurve>(curve_)) {
        return std::abs(last_ - first_);
    }

    double total = 0.0;
    Vec3 prev = value_at(first_);
    for (int i = 1; i <= kLengthSamples; ++i) {
        double t = first_ + (last_ - first_) * i / kLengthSamples;
        Vec3 curr = value_at(t);
        total += curr.distance_to(prev);
        prev = curr;
    }
    return total;
}

MemoryWire::MemoryWire(std::vector<std::shared_ptr<const EdgeHandle>> edges)
    : edges_(std::move(edges)) {}

double MemoryWire::length() const {
    double total = 0.0;
    for (const auto& edge : edges_) {
        total += edge->length();
    }
    return total;
}

MemoryFace::MemoryFace(SurfaceKind kind,
                       std::optional<Vec3> normal,
                       std::vector<std::shared_ptr<const WireHandle>> wires,
                       Mesh mesh)
    : kind_(kind), normal_(normal), wires_(std::move(wires)), mesh_(std::move(mesh)) {}

Vec3 MemoryFace::normal() const {
    if (!normal_) {
        throw KernelError("Normal is not defined for this face");
    }
    return *normal_;
}

}  // namespace faceflat

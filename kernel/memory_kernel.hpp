#ifndef FACEFLAT_KERNEL_MEMORY_KERNEL_HPP
#define FACEFLAT_KERNEL_MEMORY_KERNEL_HPP

// In-memory kernel collaborator backed by analytic curves.
//
// Used by the CLI (faces loaded from a JSON face-set document) and by the
// tests. Parameterizations follow the usual B-rep conventions:
//   line    P(t) = origin + t * direction,       t in [0, length]
//   circle  P(t) = C + r (cos t X + sin t Y),    Y = axis x X
//   ellipse P(t) = C + a cos t X + b sin t Y
//   spline  global Bezier parameter in [0, segment_count]

#include "kernel.hpp"
#include "cubic_bezier.hpp"
#include <optional>
#include <variant>

namespace faceflat {

struct LineCurve {
    Vec3 origin;
    Vec3 direction;  // unit
};

struct CircleCurve {
    Vec3 center;
    Vec3 axis;    // unit normal of the circle plane
    Vec3 x_dir;   // unit, perpendicular to axis
    double radius = 0.0;
};

struct EllipseCurve {
    Vec3 center;
    Vec3 axis;
    Vec3 major_dir;
    double major_radius = 0.0;
    double minor_radius = 0.0;
};

using AnalyticCurve = std::variant<LineCurve, CircleCurve, EllipseCurve, BezierSpline>;

class MemoryEdge : public EdgeHandle {
public:
    MemoryEdge(AnalyticCurve curve, double first, double last);

    static std::shared_ptr<MemoryEdge> line(const Vec3& start, const Vec3& end);
    static std::shared_ptr<MemoryEdge> circle(const Vec3& center, const Vec3& axis,
                                              const Vec3& x_dir, double radius,
                                              double first, double last);
    static std::shared_ptr<MemoryEdge> ellipse(const Vec3& center, const Vec3& axis,
                                               const Vec3& major_dir,
                                               double major_radius, double minor_radius,
                                               double first, double last);
    static std::shared_ptr<MemoryEdge> spline(const std::vector<Vec3>& through_points);

    CurveKind curve_kind() const override;
    std::pair<double, double> domain() const override { return {first_, last_}; }
    Vec3 value_at(double param) const override;
    CircleData circle() const override;
    EllipseData ellipse() const override;
    double length() const override;

    const AnalyticCurve& curve() const { return curve_; }

private:
    AnalyticCurve curve_;
    double first_;
    double last_;
};

class MemoryWire : public WireHandle {
public:
    explicit MemoryWire(std::vector<std::shared_ptr<const EdgeHandle>> edges);

    std::vector<std::shared_ptr<const EdgeHandle>> edges() const override { return edges_; }
    double length() const override;

private:
    std::vector<std::shared_ptr<const EdgeHandle>> edges_;
};

class MemoryFace : public FaceHandle {
public:
    // A face without a normal reports KernelError from normal()
    MemoryFace(SurfaceKind kind,
               std::optional<Vec3> normal,
               std::vector<std::shared_ptr<const WireHandle>> wires,
               Mesh mesh);

    SurfaceKind surface_kind() const override { return kind_; }
    Vec3 normal() const override;
    std::vector<std::shared_ptr<const WireHandle>> wires() const override { return wires_; }
    Mesh triangulation() const override { return mesh_; }

private:
    SurfaceKind kind_;
    std::optional<Vec3> normal_;
    std::vector<std::shared_ptr<const WireHandle>> wires_;
    Mesh mesh_;
};

}  // namespace faceflat

#endif // FACEFLAT_KERNEL_MEMORY_KERNEL_HPP

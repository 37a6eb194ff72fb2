#ifndef FACEFLAT_KERNEL_CUBIC_BEZIER_HPP
#define FACEFLAT_KERNEL_CUBIC_BEZIER_HPP

#include <math/vec3.hpp>
#include <array>
#include <vector>

namespace faceflat {

// A single cubic Bezier curve segment
struct CubicBezier {
    std::array<Vec3, 4> control_points;

    CubicBezier() = default;
    CubicBezier(const Vec3& p0, const Vec3& p1, const Vec3& p2, const Vec3& p3);

    // Evaluate position at parameter t in [0, 1]
    Vec3 evaluate(double t) const;

    // Approximate arc length (numerical integration)
    double arc_length(int samples = 20) const;

    static CubicBezier from_hermite(const Vec3& p0, const Vec3& tangent0,
                                    const Vec3& p1, const Vec3& tangent1);

    const Vec3& start() const { return control_points[0]; }
    const Vec3& end() const { return control_points[3]; }
};

// Free-form curve made of cubic segments; global parameter in [0, segment_count]
class BezierSpline {
public:
    BezierSpline() = default;
    explicit BezierSpline(std::vector<CubicBezier> segments);

    // Catmull-Rom style spline passing through every point
    static BezierSpline through_points(const std::vector<Vec3>& points);

    void add_segment(const CubicBezier& segment);

    const std::vector<CubicBezier>& segments() const { return segments_; }
    size_t segment_count() const { return segments_.size(); }
    bool empty() const { return segments_.empty(); }

    Vec3 evaluate(double t) const;

    double total_arc_length(int samples_per_segment = 20) const;

private:
    std::vector<CubicBezier> segments_;
};

}  // namespace faceflat

#endif // FACEFLAT_KERNEL_CUBIC_BEZIER_HPP

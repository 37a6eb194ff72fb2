#include "cubic_bezier.hpp"
#include <algorithm>
#include <utility>

namespace faceflat {

CubicBezier::CubicBezier(const Vec3& p0, const Vec3& p1, const Vec3& p2, const Vec3& p3)
    : control_points{p0, p1, p2, p3} {}

Vec3 CubicBezier::evaluate(double t) const {
    double u = 1.0 - t;
    double tt = t * t;
    double uu = u * u;

    return control_points[0] * (uu * u) +
           control_points[1] * (3.0 * uu * t) +
           control_points[2] * (3.0 * u * tt) +
           control_points[3] * (tt * t);
}

double CubicBezier::arc_length(int samples) const {
    double length = 0.0;
    Vec3 prev = control_points[0];

    for (int i = 1; i <= samples; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(samples);
        Vec3 curr = evaluate(t);
        length += (curr - prev).length();
        prev = curr;
    }
    return length;
}

CubicBezier CubicBezier::from_hermite(const Vec3& p0, const Vec3& tangent0,
                                      const Vec3& p1, const Vec3& tangent1) {
    // Hermite tangents map to control points at one third of their length
    return CubicBezier(p0, p0 + tangent0 / 3.0, p1 - tangent1 / 3.0, p1);
}

BezierSpline::BezierSpline(std::vector<CubicBezier> segments)
    : segments_(std::move(segments)) {}

BezierSpline BezierSpline::through_points(const std::vector<Vec3>& points) {
    BezierSpline spline;

    if (points.size() < 2) {
        return spline;
    }

    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const Vec3& p0 = points[i];
        const Vec3& p1 = points[i + 1];

        // Central differences at interior points, one-sided at the ends
        Vec3 tangent0 = (i == 0) ? (p1 - p0) : (points[i + 1] - points[i - 1]) * 0.5;
        Vec3 tangent1 = (i + 2 >= points.size()) ? (p1 - p0) : (points[i + 2] - points[i]) * 0.5;

        spline.add_segment(CubicBezier::from_hermite(p0, tangent0, p1, tangent1));
    }

    return spline;
}

void BezierSpline::add_segment(const CubicBezier& segment) {
    segments_.push_back(segment);
}

Vec3 BezierSpline::evaluate(double t) const {
    if (segments_.empty()) {
        return vec3::zero();
    }

    t = std::clamp(t, 0.0, static_cast<double>(segments_.size()));

    size_t segment_index = static_cast<size_t>(t);
    if (segment_index >= segments_.size()) {
        segment_index = segments_.size() - 1;
    }

    double local_t = t - static_cast<double>(segment_index);
    return segments_[segment_index].evaluate(local_t);
}

double BezierSpline::total_arc_length(int samples_per_segment) const {
    double total = 0.0;
    for (const auto& seg : segments_) {
        total += seg.arc_length(samples_per_segment);
    }
    return total;
}

}  // namespace faceflat

#include "arc_direction.hpp"
#include <cmath>
#include <utility>

namespace faceflat {

bool is_angle_between_ccw(double start, double end, double mid) {
    start = wrap_degrees(start);
    end = wrap_degrees(end);
    mid = wrap_degrees(mid);

    if (start <= end) {
        return start <= mid && mid <= end;
    }
    // Interval wraps past 0 degrees
    return mid >= start || mid <= end;
}

ArcDirection resolve_arc_direction(double start_deg, double end_deg, double mid_deg) {
    ArcDirection dir;
    double start = wrap_degrees(start_deg);
    double end = wrap_degrees(end_deg);

    if (is_angle_between_ccw(start, end, mid_deg)) {
        dir.sweep_flag = 1;
        dir.angle_diff = wrap_degrees(end - start);
    } else {
        dir.sweep_flag = 0;
        dir.angle_diff = wrap_degrees(start - end);
        std::swap(start, end);
    }

    dir.start_angle = start;
    dir.end_angle = end;
    dir.large_arc_flag = dir.angle_diff > 180.0 ? 1 : 0;
    return dir;
}

Result<ArcDirection> resolve_arc_direction(const Vec2& center,
                                           const Vec2& start,
                                           const Vec2& end,
                                           const Vec2& mid) {
    double start_deg = polar_angle_deg(center, start);
    double end_deg = polar_angle_deg(center, end);
    double mid_deg = polar_angle_deg(center, mid);

    if (!std::isfinite(start_deg) || !std::isfinite(end_deg) || !std::isfinite(mid_deg)) {
        return make_error(ErrorKind::CurveEvaluation, "Arc points are not finite");
    }
    return resolve_arc_direction(start_deg, end_deg, mid_deg);
}

}  // namespace faceflat

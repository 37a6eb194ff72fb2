#ifndef FACEFLAT_CLASSIFY_ARC_DIRECTION_HPP
#define FACEFLAT_CLASSIFY_ARC_DIRECTION_HPP

#include <math/vec2.hpp>
#include <common/errors.hpp>

namespace faceflat {

struct ArcDirection {
    // Stored so that CCW travel from start_angle reaches end_angle
    double start_angle = 0.0;
    double end_angle = 0.0;
    // Swept angle in the edge's own travel direction, degrees
    double angle_diff = 0.0;
    int sweep_flag = 1;       // 1 = CCW, 0 = CW
    int large_arc_flag = 0;   // 1 iff angle_diff > 180
};

// True when mid lies on the CCW path from start to end (all in degrees)
bool is_angle_between_ccw(double start, double end, double mid);

// Direction from polar angles (degrees) of the start, end and mid points
ArcDirection resolve_arc_direction(double start_deg, double end_deg, double mid_deg);

// Direction of a projected arc given its center and three points on it.
// mid is the curve value at the middle of the parameter range.
Result<ArcDirection> resolve_arc_direction(const Vec2& center,
                                           const Vec2& start,
                                           const Vec2& end,
                                           const Vec2& mid);

}  // namespace faceflat

#endif // FACEFLAT_CLASSIFY_ARC_DIRECTION_HPP

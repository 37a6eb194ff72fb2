#include "vec2.hpp"
#include <numbers>

namespace faceflat {

double wrap_degrees(double degrees) {
    double r = std::fmod(degrees, 360.0);
    if (r < 0.0) {
        r += 360.0;
    }
    // Tiny negative inputs round up to exactly 360
    return r >= 360.0 ? 0.0 : r;
}

double polar_angle_deg(const Vec2& center, const Vec2& p) {
    double rad = std::atan2(p.y - center.y, p.x - center.x);
    return wrap_degrees(rad * 180.0 / std::numbers::pi);
}

}  // namespace faceflat

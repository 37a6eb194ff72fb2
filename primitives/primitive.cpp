#include "primitive.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <type_traits>

namespace faceflat {

const char* primitive_class_name(PrimitiveClass cls) {
    return cls == PrimitiveClass::Boundary ? "boundary" : "hole";
}

const char* shape_name(const Shape& shape) {
    return std::visit([](auto&& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, primitive::Line>) return "line";
        else if constexpr (std::is_same_v<T, primitive::Circle>) return "circle";
        else if constexpr (std::is_same_v<T, primitive::Arc>) return "arc";
        else if constexpr (std::is_same_v<T, primitive::Ellipse>) return "ellipse";
        else return "polyline";
    }, shape);
}

Vec2 arc_point(const primitive::Arc& arc, double angle_deg) {
    double rad = angle_deg * std::numbers::pi / 180.0;
    return {arc.center.x + arc.radius * std::cos(rad),
            arc.center.y + arc.radius * std::sin(rad)};
}

void Bounds::expand(const Vec2& p) {
    if (!valid) {
        min = p;
        max = p;
        valid = true;
        return;
    }
    min.x = std::min(min.x, p.x);
    min.y = std::min(min.y, p.y);
    max.x = std::max(max.x, p.x);
    max.y = std::max(max.y, p.y);
}

Bounds primitive_bounds(const std::vector<Primitive>& primitives) {
    Bounds bounds;
    for (const auto& prim : primitives) {
        std::visit([&bounds](auto&& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, primitive::Line>) {
                bounds.expand(s.p1);
                bounds.expand(s.p2);
            } else if constexpr (std::is_same_v<T, primitive::Circle>) {
                bounds.expand({s.center.x - s.radius, s.center.y - s.radius});
                bounds.expand({s.center.x + s.radius, s.center.y + s.radius});
            } else if constexpr (std::is_same_v<T, primitive::Arc>) {
                bounds.expand(arc_point(s, s.start_angle));
                bounds.expand(arc_point(s, s.end_angle));
            } else if constexpr (std::is_same_v<T, primitive::Ellipse>) {
                double r = s.major_axis.length();
                bounds.expand({s.center.x - r, s.center.y - r});
                bounds.expand({s.center.x + r, s.center.y + r});
            } else {
                for (const auto& p : s.points) {
                    bounds.expand(p);
                }
            }
        }, prim.shape);
    }
    return bounds;
}

}  // namespace faceflat

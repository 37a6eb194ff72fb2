#ifndef FACEFLAT_PRIMITIVES_PRIMITIVE_HPP
#define FACEFLAT_PRIMITIVES_PRIMITIVE_HPP

#include <math/vec2.hpp>
#include <variant>
#include <vector>

namespace faceflat {

// Which loop of the face a primitive came from
enum class PrimitiveClass { Boundary, Hole };

const char* primitive_class_name(PrimitiveClass cls);

namespace primitive {

struct Line {
    Vec2 p1;
    Vec2 p2;
};

struct Circle {
    Vec2 center;
    double radius = 0.0;
};

// Angles in degrees, [0, 360). Travelling CCW from start_angle reaches
// end_angle along the arc regardless of sweep_flag; sweep_flag records the
// direction the source edge ran in (1 = CCW, 0 = CW).
struct Arc {
    Vec2 center;
    double radius = 0.0;
    double start_angle = 0.0;
    double end_angle = 0.0;
    int sweep_flag = 1;
    int large_arc_flag = 0;
};

// major_axis is the vector from the center to the major vertex, so its
// length is the major radius. ratio = minor / major.
struct Ellipse {
    Vec2 center;
    Vec2 major_axis;
    double ratio = 1.0;
};

struct Polyline {
    std::vector<Vec2> points;
    bool closed = false;
};

}  // namespace primitive

using Shape = std::variant<
    primitive::Line, primitive::Circle, primitive::Arc,
    primitive::Ellipse, primitive::Polyline
>;

struct Primitive {
    Shape shape;
    PrimitiveClass cls = PrimitiveClass::Boundary;
};

const char* shape_name(const Shape& shape);

// Point on the arc's circle at an angle in degrees
Vec2 arc_point(const primitive::Arc& arc, double angle_deg);

// Axis-aligned box over primitive coordinates
struct Bounds {
    Vec2 min;
    Vec2 max;
    bool valid = false;

    void expand(const Vec2& p);
    double width() const { return max.x - min.x; }
    double height() const { return max.y - min.y; }
};

// Line/polyline vertices, circle and ellipse extents, arc end points
Bounds primitive_bounds(const std::vector<Primitive>& primitives);

}  // namespace faceflat

#endif // FACEFLAT_PRIMITIVES_PRIMITIVE_HPP

#ifndef FACEFLAT_MATH_VEC2_HPP
#define FACEFLAT_MATH_VEC2_HPP

#include <cmath>

namespace faceflat {

// A point or direction in a face's projection plane
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    double length() const {
        return std::sqrt(x * x + y * y);
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Lexicographic order (x, then y)
    constexpr bool operator<(const Vec2& other) const {
        return x < other.x || (x == other.x && y < other.y);
    }

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Polar angle of p about center, in degrees reduced to [0, 360)
double polar_angle_deg(const Vec2& center, const Vec2& p);

// Reduce an angle in degrees to [0, 360), matching floored modulo
double wrap_degrees(double degrees);

}  // namespace faceflat

#endif // FACEFLAT_MATH_VEC2_HPP

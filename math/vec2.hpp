#ifndef SNOWFLAKE_MATH_VEC2_HPP
#define SNOWFLAKE_MATH_VEC2_HPP

#include <cmath>

namespace snowflake {

// A point or vector in drawing-surface coordinates (y grows downwards)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
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

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    // Dot product
    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // 2D cross product (z component of the 3D cross product)
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

}  // namespace snowflake

#endif // SNOWFLAKE_MATH_VEC2_HPP

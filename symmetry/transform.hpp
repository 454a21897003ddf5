#ifndef SNOWFLAKE_SYMMETRY_TRANSFORM_HPP
#define SNOWFLAKE_SYMMETRY_TRANSFORM_HPP

#include <math/vec2.hpp>
#include <string>
#include <variant>
#include <vector>

namespace snowflake {

namespace transform_op {

// Rotation about center, positive angles turn clockwise on screen
// (the SVG rotate() convention with y pointing down)
struct Rotate {
    double angle_degrees = 0.0;
    Vec2 center;
};

// Reflection across the vertical line x = axis_x
struct Mirror {
    double axis_x = 0.0;
};

struct Scale {
    double sx = 1.0;
    double sy = 1.0;
};

struct Translate {
    Vec2 offset;
};

}  // namespace transform_op

using TransformOp = std::variant<
    transform_op::Rotate,
    transform_op::Mirror,
    transform_op::Scale,
    transform_op::Translate
>;

// Apply a single primitive to a point
Vec2 apply_op(const TransformOp& op, const Vec2& p);

// A declarative composition of primitives, stored outermost first, the way
// an SVG transform attribute lists them. Applying it to a point runs the
// list right to left: the primitive closest to the coordinates goes first.
class Transform {
public:
    Transform() = default;
    explicit Transform(std::vector<TransformOp> ops);

    static Transform rotate(double angle_degrees, const Vec2& center);
    static Transform mirror(double axis_x);
    static Transform scale(double sx, double sy);
    static Transform translate(const Vec2& offset);

    // this after inner: the result applies inner first
    Transform operator*(const Transform& inner) const;

    Vec2 apply(const Vec2& p) const;

    const std::vector<TransformOp>& ops() const { return ops_; }

    // SVG transform attribute text, e.g. "rotate(60 500 500) scale(-1, 1) translate(-1000, 0)"
    std::string to_svg() const;

private:
    std::vector<TransformOp> ops_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_SYMMETRY_TRANSFORM_HPP

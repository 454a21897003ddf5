#include "transform.hpp"
#include <cmath>
#include <numbers>
#include <sstream>

namespace snowflake {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

Vec2 apply_op(const TransformOp& op, const Vec2& p) {
    return std::visit(Overloaded{
        [&](const transform_op::Rotate& r) {
            double a = r.angle_degrees * std::numbers::pi / 180.0;
            double c = std::cos(a);
            double s = std::sin(a);
            double dx = p.x - r.center.x;
            double dy = p.y - r.center.y;
            return Vec2{r.center.x + dx * c - dy * s,
                        r.center.y + dx * s + dy * c};
        },
        [&](const transform_op::Mirror& m) {
            return Vec2{2.0 * m.axis_x - p.x, p.y};
        },
        [&](const transform_op::Scale& s) {
            return Vec2{p.x * s.sx, p.y * s.sy};
        },
        [&](const transform_op::Translate& t) {
            return p + t.offset;
        }
    }, op);
}

Transform::Transform(std::vector<TransformOp> ops) : ops_(std::move(ops)) {}

Transform Transform::rotate(double angle_degrees, const Vec2& center) {
    return Transform({transform_op::Rotate{angle_degrees, center}});
}

Transform Transform::mirror(double axis_x) {
    return Transform({transform_op::Mirror{axis_x}});
}

Transform Transform::scale(double sx, double sy) {
    return Transform({transform_op::Scale{sx, sy}});
}

Transform Transform::translate(const Vec2& offset) {
    return Transform({transform_op::Translate{offset}});
}

Transform Transform::operator*(const Transform& inner) const {
    std::vector<TransformOp> ops = ops_;
    ops.insert(ops.end(), inner.ops_.begin(), inner.ops_.end());
    return Transform(std::move(ops));
}

Vec2 Transform::apply(const Vec2& p) const {
    Vec2 result = p;
    for (auto it = ops_.rbegin(); it != ops_.rend(); ++it) {
        result = apply_op(*it, result);
    }
    return result;
}

std::string Transform::to_svg() const {
    std::ostringstream ss;
    bool first = true;

    for (const auto& op : ops_) {
        if (!first) {
            ss << ' ';
        }
        first = false;

        std::visit(Overloaded{
            [&](const transform_op::Rotate& r) {
                ss << "rotate(" << r.angle_degrees << ' ' << r.center.x << ' ' << r.center.y << ')';
            },
            [&](const transform_op::Mirror& m) {
                // x' = -(x - 2a) = 2a - x
                double offset = -2.0 * m.axis_x;
                if (offset == 0.0) {
                    offset = 0.0;
                }
                ss << "scale(-1, 1) translate(" << offset << ", 0)";
            },
            [&](const transform_op::Scale& s) {
                ss << "scale(" << s.sx << ", " << s.sy << ')';
            },
            [&](const transform_op::Translate& t) {
                ss << "translate(" << t.offset.x << ", " << t.offset.y << ')';
            }
        }, op);
    }

    return ss.str();
}

}  // namespace snowflake

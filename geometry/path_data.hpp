#ifndef SNOWFLAKE_GEOMETRY_PATH_DATA_HPP
#define SNOWFLAKE_GEOMETRY_PATH_DATA_HPP

#include <math/vec2.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace snowflake {

enum class PathCommandType {
    MoveTo,
    LineTo,
    QuadraticTo,
    CubicTo
};

// Number of coordinate pairs a well-formed command carries
size_t expected_point_count(PathCommandType type);

// SVG command letter (absolute form)
char command_letter(PathCommandType type);

// One path command with absolute coordinates. The point list is checked
// against expected_point_count() by consumers, not on construction.
struct PathCommand {
    PathCommandType type = PathCommandType::MoveTo;
    std::vector<Vec2> points;

    bool well_formed() const { return points.size() == expected_point_count(type); }

    bool operator==(const PathCommand& other) const = default;
};

// Ordered list of path commands: the curve representation shared by source
// strokes, replicas and baked output.
class PathData {
public:
    PathData() = default;
    explicit PathData(std::vector<PathCommand> commands);

    void move_to(const Vec2& p);
    void line_to(const Vec2& p);
    void cubic_to(const Vec2& c1, const Vec2& c2, const Vec2& p);
    void add_command(PathCommand command);

    const std::vector<PathCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }

    // First and last coordinate of the path
    std::optional<Vec2> first_point() const;
    std::optional<Vec2> last_point() const;

    // Flatten to polylines, one per subpath. Curves are sampled with
    // samples_per_curve segments. Malformed commands are ignored.
    std::vector<std::vector<Vec2>> to_polylines(int samples_per_curve = 16) const;

    // SVG path data, "M x y C x y, x y, x y" with fixed precision
    std::string to_svg(int precision = 2) const;

    bool operator==(const PathData& other) const = default;

private:
    std::vector<PathCommand> commands_;
};

// Format a coordinate with fixed precision, never printing "-0.00"
std::string format_coordinate(double value, int precision);

}  // namespace snowflake

#endif // SNOWFLAKE_GEOMETRY_PATH_DATA_HPP

#include "path_data.hpp"
#include "cubic_bezier.hpp"
#include <utility>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace snowflake {

size_t expected_point_count(PathCommandType type) {
    switch (type) {
        case PathCommandType::MoveTo: return 1;
        case PathCommandType::LineTo: return 1;
        case PathCommandType::QuadraticTo: return 2;
        case PathCommandType::CubicTo: return 3;
    }
    return 0;
}

char command_letter(PathCommandType type) {
    switch (type) {
        case PathCommandType::MoveTo: return 'M';
        case PathCommandType::LineTo: return 'L';
        case PathCommandType::QuadraticTo: return 'Q';
        case PathCommandType::CubicTo: return 'C';
    }
    return '?';
}

std::string format_coordinate(double value, int precision) {
    double half_unit = 0.5 * std::pow(10.0, -precision);
    if (std::abs(value) < half_unit) {
        value = 0.0;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

PathData::PathData(std::vector<PathCommand> commands)
    : commands_(std::move(commands)) {}

void PathData::move_to(const Vec2& p) {
    commands_.push_back(PathCommand{PathCommandType::MoveTo, {p}});
}

void PathData::line_to(const Vec2& p) {
    commands_.push_back(PathCommand{PathCommandType::LineTo, {p}});
}

void PathData::cubic_to(const Vec2& c1, const Vec2& c2, const Vec2& p) {
    commands_.push_back(PathCommand{PathCommandType::CubicTo, {c1, c2, p}});
}

void PathData::add_command(PathCommand command) {
    commands_.push_back(std::move(command));
}

std::optional<Vec2> PathData::first_point() const {
    for (const auto& cmd : commands_) {
        if (!cmd.points.empty()) {
            return cmd.points.front();
        }
    }
    return std::nullopt;
}

std::optional<Vec2> PathData::last_point() const {
    for (auto it = commands_.rbegin(); it != commands_.rend(); ++it) {
        if (!it->points.empty()) {
            return it->points.back();
        }
    }
    return std::nullopt;
}

std::vector<std::vector<Vec2>> PathData::to_polylines(int samples_per_curve) const {
    std::vector<std::vector<Vec2>> polylines;
    std::vector<Vec2> current;

    auto flush = [&]() {
        if (!current.empty()) {
            polylines.push_back(std::move(current));
            current.clear();
        }
    };

    for (const auto& cmd : commands_) {
        if (!cmd.well_formed()) {
            continue;
        }

        if (cmd.type == PathCommandType::MoveTo) {
            flush();
            current.push_back(cmd.points[0]);
            continue;
        }

        // Drawing command without a preceding move starts at its own origin
        Vec2 from = current.empty() ? cmd.points.front() : current.back();
        if (current.empty()) {
            current.push_back(from);
        }

        switch (cmd.type) {
            case PathCommandType::LineTo:
                current.push_back(cmd.points[0]);
                break;
            case PathCommandType::QuadraticTo: {
                auto pts = CubicBezier::from_quadratic(from, cmd.points[0], cmd.points[1])
                               .to_polyline(samples_per_curve);
                current.insert(current.end(), pts.begin() + 1, pts.end());
                break;
            }
            case PathCommandType::CubicTo: {
                auto pts = CubicBezier(from, cmd.points[0], cmd.points[1], cmd.points[2])
                               .to_polyline(samples_per_curve);
                current.insert(current.end(), pts.begin() + 1, pts.end());
                break;
            }
            case PathCommandType::MoveTo:
                break;
        }
    }

    flush();
    return polylines;
}

std::string PathData::to_svg(int precision) const {
    std::ostringstream ss;
    bool first_command = true;

    for (const auto& cmd : commands_) {
        if (!first_command) {
            ss << ' ';
        }
        first_command = false;

        ss << command_letter(cmd.type);
        for (size_t i = 0; i < cmd.points.size(); ++i) {
            if (i > 0) {
                ss << ',';
            }
            ss << ' ' << format_coordinate(cmd.points[i].x, precision)
               << ' ' << format_coordinate(cmd.points[i].y, precision);
        }
    }

    return ss.str();
}

}  // namespace snowflake

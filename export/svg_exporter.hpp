#ifndef SNOWFLAKE_EXPORT_SVG_EXPORTER_HPP
#define SNOWFLAKE_EXPORT_SVG_EXPORTER_HPP

#include <symmetry/transform_baker.hpp>
#include <optional>
#include <string>
#include <vector>

namespace snowflake {

class DrawingSession;

// Laser-cutter export settings. The canvas is canvas_size user units on a
// side and maps onto physical_size_mm millimetres.
struct ExportConfig {
    double canvas_size = 1000.0;
    double physical_size_mm = 200.0;
    double cut_width_mm = 0.1;
    std::string stroke_color = "#FF0000";
    int precision = 2;

    // Cut line width in user units
    double cut_width_units() const {
        return cut_width_mm * canvas_size / physical_size_mm;
    }
};

// Writes the baked replica set as a flat SVG document: one path per
// replica, coordinates baked, no transform attributes, no wedge outline.
class SvgExporter {
public:
    explicit SvgExporter(const ExportConfig& config = ExportConfig{});

    std::string to_svg(const std::vector<BakedPath>& paths) const;

    // nullopt when the session has no strokes
    std::optional<std::string> export_svg(const DrawingSession& session) const;

    // Returns false when there is nothing to export; throws on I/O failure
    bool export_to_file(const DrawingSession& session, const std::string& path) const;

    const ExportConfig& config() const { return config_; }

private:
    ExportConfig config_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_EXPORT_SVG_EXPORTER_HPP

#include "svg_exporter.hpp"
#include <session/drawing_session.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace snowflake {

SvgExporter::SvgExporter(const ExportConfig& config) : config_(config) {
    if (config_.canvas_size <= 0.0 || config_.physical_size_mm <= 0.0) {
        throw std::invalid_argument("export canvas and physical size must be positive");
    }
}

std::string SvgExporter::to_svg(const std::vector<BakedPath>& paths) const {
    std::ostringstream ss;
    std::string size_mm = format_coordinate(config_.physical_size_mm, config_.precision);
    std::string canvas = format_coordinate(config_.canvas_size, config_.precision);
    std::string stroke_width = format_coordinate(config_.cut_width_units(), config_.precision);

    ss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << size_mm << "mm\" height=\""
       << size_mm << "mm\" viewBox=\"0 0 " << canvas << ' ' << canvas << "\">\n";

    for (const auto& baked : paths) {
        ss << "  <path d=\"" << baked.to_svg(config_.precision) << "\" stroke=\""
           << config_.stroke_color << "\" stroke-width=\"" << stroke_width
           << "\" fill=\"none\"/>\n";
    }

    ss << "</svg>\n";
    return ss.str();
}

std::optional<std::string> SvgExporter::export_svg(const DrawingSession& session) const {
    if (session.stroke_count() == 0) {
        logging::get_logger()->warn("Nothing to export: draw at least one stroke first");
        return std::nullopt;
    }

    auto paths = session.get_all_baked_paths();
    logging::get_logger()->debug("Exporting {} baked paths", paths.size());
    return to_svg(paths);
}

bool SvgExporter::export_to_file(const DrawingSession& session, const std::string& path) const {
    auto svg = export_svg(session);
    if (!svg) {
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << *svg;
    return true;
}

}  // namespace snowflake

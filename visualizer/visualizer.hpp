#ifndef SNOWFLAKE_VISUALIZER_HPP
#define SNOWFLAKE_VISUALIZER_HPP

#include <session/drawing_session.hpp>
#include <export/svg_exporter.hpp>
#include <string>

namespace snowflake {

// Configuration for the drawing window
struct VisualizerConfig {
    int window_width = 900;
    int window_height = 900;
    std::string window_title = "Snowflake";

    // Camera
    float zoom_speed = 1.1f;          // Scroll zoom factor
    float min_zoom = 0.5f;
    float max_zoom = 20.0f;

    // Rendering
    int curve_samples = 16;           // Samples per curve command
    int fill_resolution = 200;        // Raster size of the fill overlay
    bool show_fill = false;           // Start with the fill overlay on

    // Editing
    double width_step = 0.5;          // +/- stroke width increment
    std::string export_path = "snowflake.svg";
};

// Result of a drawing session
struct VisualizerResult {
    bool completed = false;           // User closed window normally
    size_t strokes_drawn = 0;         // Finished strokes at close
    int exports = 0;                  // Successful SVG exports
};

// Open the interactive drawing window on session. Returns when the window
// is closed; the session keeps whatever was drawn.
VisualizerResult run_drawing_window(
    DrawingSession& session,
    const ExportConfig& export_config,
    const VisualizerConfig& viz_config = VisualizerConfig{}
);

// Check if visualization is available (GLFW/OpenGL compiled in)
bool visualization_available();

}  // namespace snowflake

#endif // SNOWFLAKE_VISUALIZER_HPP

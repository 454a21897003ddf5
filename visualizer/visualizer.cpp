#include "visualizer.hpp"
#include <common/logging.hpp>

#ifdef SNOWFLAKE_HAS_VISUALIZATION

#include <GLFW/glfw3.h>
#include <fill/fill_classifier.hpp>
#include <session/pointer_adapter.hpp>
#include <algorithm>
#include <cmath>
#include <memory>
#include <numbers>
#include <vector>

namespace snowflake {

// Orthographic view onto the 1000x1000 canvas
struct View {
    double center_x = 500.0;
    double center_y = 500.0;
    double zoom = 1.0;

    // Canvas units per window pixel
    double scale(int width, int height) const {
        return 1000.0 / zoom / static_cast<double>(std::max(1, std::min(width, height)));
    }

    Vec2 to_canvas(double px, double py, int width, int height) const {
        double s = scale(width, height);
        return Vec2{center_x + (px - width * 0.5) * s,
                    center_y + (py - height * 0.5) * s};
    }

    // y grows downwards, as on the canvas
    void apply(int width, int height) const {
        double s = scale(width, height);
        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        glOrtho(center_x - width * 0.5 * s, center_x + width * 0.5 * s,
                center_y + height * 0.5 * s, center_y - height * 0.5 * s,
                -1.0, 1.0);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
    }
};

// Global state for callbacks
static View g_view;
static DrawingSession* g_session = nullptr;
static std::unique_ptr<PointerAdapter> g_adapter;
static const ExportConfig* g_export_config = nullptr;
static const VisualizerConfig* g_viz_config = nullptr;
static bool g_panning = false;
static double g_last_mouse_x = 0;
static double g_last_mouse_y = 0;
static bool g_show_fill = false;
static bool g_fill_dirty = true;
static int g_exports = 0;

static Vec2 cursor_to_canvas(GLFWwindow* window, double xpos, double ypos) {
    int width = 0;
    int height = 0;
    glfwGetWindowSize(window, &width, &height);
    return g_view.to_canvas(xpos, ypos, width, height);
}

static void export_drawing() {
    auto log = logging::get_logger();
    try {
        SvgExporter exporter(*g_export_config);
        if (exporter.export_to_file(*g_session, g_viz_config->export_path)) {
            ++g_exports;
            log->info("Exported {} paths to {}",
                      g_session->replicator().replica_count(), g_viz_config->export_path);
        }
    } catch (const std::exception& e) {
        log->error("Export failed: {}", e.what());
    }
}

static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods) {
    double xpos = 0;
    double ypos = 0;
    glfwGetCursorPos(window, &xpos, &ypos);
    g_last_mouse_x = xpos;
    g_last_mouse_y = ypos;

    bool pan_gesture = button == GLFW_MOUSE_BUTTON_MIDDLE ||
                       (button == GLFW_MOUSE_BUTTON_LEFT && (mods & GLFW_MOD_SHIFT));

    if (action == GLFW_PRESS && pan_gesture) {
        g_panning = true;
        return;
    }
    if (action == GLFW_RELEASE && g_panning) {
        g_panning = false;
        return;
    }
    if (button != GLFW_MOUSE_BUTTON_LEFT) {
        return;
    }

    Vec2 p = cursor_to_canvas(window, xpos, ypos);
    if (action == GLFW_PRESS) {
        g_adapter->pointer_down(p);
    } else if (action == GLFW_RELEASE) {
        if (g_adapter->pointer_up(p)) {
            g_fill_dirty = true;
        }
    }
}

static void cursor_position_callback(GLFWwindow* window, double xpos, double ypos) {
    if (g_panning) {
        int width = 0;
        int height = 0;
        glfwGetWindowSize(window, &width, &height);
        double s = g_view.scale(width, height);
        g_view.center_x -= (xpos - g_last_mouse_x) * s;
        g_view.center_y -= (ypos - g_last_mouse_y) * s;
    } else if (g_adapter->armed()) {
        g_adapter->pointer_move(cursor_to_canvas(window, xpos, ypos));
    }
    g_last_mouse_x = xpos;
    g_last_mouse_y = ypos;
}

// Leaving the window ends the gesture like a release
static void cursor_enter_callback(GLFWwindow* window, int entered) {
    if (!entered && g_adapter->armed()) {
        if (g_adapter->pointer_up(cursor_to_canvas(window, g_last_mouse_x, g_last_mouse_y))) {
            g_fill_dirty = true;
        }
    }
}

static void scroll_callback(GLFWwindow* window, double xoffset, double yoffset) {
    (void)window;
    (void)xoffset;
    if (yoffset > 0) {
        g_view.zoom *= g_viz_config->zoom_speed;
    } else if (yoffset < 0) {
        g_view.zoom /= g_viz_config->zoom_speed;
    }
    g_view.zoom = std::clamp(g_view.zoom,
                             static_cast<double>(g_viz_config->min_zoom),
                             static_cast<double>(g_viz_config->max_zoom));
}

static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    if (action != GLFW_PRESS && action != GLFW_REPEAT) {
        return;
    }
    auto log = logging::get_logger();
    bool ctrl = (mods & GLFW_MOD_CONTROL) != 0;
    bool shift = (mods & GLFW_MOD_SHIFT) != 0;

    if (key == GLFW_KEY_ESCAPE || key == GLFW_KEY_Q) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    } else if (key == GLFW_KEY_F) {
        g_session->set_mode(StrokeMode::Freehand);
        log->info("Mode: freehand");
    } else if (key == GLFW_KEY_L) {
        g_session->set_mode(StrokeMode::Line);
        log->info("Mode: line");
    } else if (key == GLFW_KEY_U || (ctrl && key == GLFW_KEY_Z)) {
        if (g_session->undo_last()) {
            g_fill_dirty = true;
        }
    } else if (shift && key == GLFW_KEY_DELETE) {
        g_session->clear_all();
        g_fill_dirty = true;
        log->info("Cleared all strokes");
    } else if (key == GLFW_KEY_E) {
        export_drawing();
    } else if (key == GLFW_KEY_V) {
        g_show_fill = !g_show_fill;
    } else if (key == GLFW_KEY_EQUAL || key == GLFW_KEY_KP_ADD) {
        g_session->set_stroke_width(g_session->stroke_width() + g_viz_config->width_step);
        log->info("Stroke width: {}", g_session->stroke_width());
    } else if (key == GLFW_KEY_MINUS || key == GLFW_KEY_KP_SUBTRACT) {
        g_session->set_stroke_width(std::max(g_viz_config->width_step,
                                             g_session->stroke_width() - g_viz_config->width_step));
        log->info("Stroke width: {}", g_session->stroke_width());
    } else if (key == GLFW_KEY_R) {
        g_view = View{};
    }
}

static void draw_polyline(const std::vector<Vec2>& points) {
    glBegin(GL_LINE_STRIP);
    for (const auto& p : points) {
        glVertex2d(p.x, p.y);
    }
    glEnd();
}

static void render_wedge(const Wedge& wedge) {
    const Vec2& c = wedge.center();
    const int arc_samples = 32;

    // Full circle, faint
    glColor3f(0.85f, 0.85f, 0.9f);
    glBegin(GL_LINE_LOOP);
    for (int i = 0; i < 180; ++i) {
        double a = 2.0 * std::numbers::pi * i / 180.0;
        glVertex2d(c.x + wedge.radius() * std::sin(a), c.y - wedge.radius() * std::cos(a));
    }
    glEnd();

    glColor3f(0.55f, 0.6f, 0.75f);
    glBegin(GL_LINE_LOOP);
    glVertex2d(c.x, c.y);
    for (int i = 0; i <= arc_samples; ++i) {
        double angle = wedge.span_degrees() * i / arc_samples;
        Vec2 p = c + Wedge::ray_direction(angle) * wedge.radius();
        glVertex2d(p.x, p.y);
    }
    glEnd();
}

static void render_fill(const FillMask& mask) {
    if (mask.width() == 0) {
        return;
    }
    double cell = 1000.0 / mask.width();
    glColor4f(0.9f, 0.3f, 0.3f, 0.25f);
    glBegin(GL_QUADS);
    for (int y = 0; y < mask.height(); ++y) {
        for (int x = 0; x < mask.width(); ++x) {
            if (!mask.is_cut(x, y)) {
                continue;
            }
            glVertex2d(x * cell, y * cell);
            glVertex2d((x + 1) * cell, y * cell);
            glVertex2d((x + 1) * cell, (y + 1) * cell);
            glVertex2d(x * cell, (y + 1) * cell);
        }
    }
    glEnd();
}

static void render_paths(const std::vector<BakedPath>& paths, double pixels_per_unit, int samples) {
    glColor3f(0.1f, 0.15f, 0.4f);
    for (const auto& baked : paths) {
        glLineWidth(static_cast<float>(std::max(1.0, baked.stroke_width * pixels_per_unit)));
        for (const auto& polyline : baked.path.to_polylines(samples)) {
            draw_polyline(polyline);
        }
    }
    glLineWidth(1.0f);
}

static void render_snap_indicator(const SnapIndicator& indicator) {
    if (!indicator.visible()) {
        return;
    }
    const Vec2& p = indicator.position();
    glColor3f(0.1f, 0.7f, 0.3f);
    glLineWidth(2.0f);
    glBegin(GL_LINE_LOOP);
    for (int i = 0; i < 24; ++i) {
        double a = 2.0 * std::numbers::pi * i / 24.0;
        glVertex2d(p.x + 8.0 * std::cos(a), p.y + 8.0 * std::sin(a));
    }
    glEnd();
    glLineWidth(1.0f);
}

VisualizerResult run_drawing_window(
    DrawingSession& session,
    const ExportConfig& export_config,
    const VisualizerConfig& viz_config) {

    auto log = snowflake::logging::get_logger();
    VisualizerResult result;

    // Initialize GLFW
    if (!glfwInit()) {
        log->error("Failed to initialize GLFW");
        return result;
    }

    glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
    glfwWindowHint(GLFW_FOCUSED, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(
        viz_config.window_width,
        viz_config.window_height,
        viz_config.window_title.c_str(),
        nullptr, nullptr);

    if (!window) {
        log->error("Failed to create GLFW window");
        glfwTerminate();
        return result;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);  // Enable vsync

    // Callback state
    g_session = &session;
    g_adapter = std::make_unique<PointerAdapter>(session);
    g_export_config = &export_config;
    g_viz_config = &viz_config;
    g_view = View{};
    g_panning = false;
    g_show_fill = viz_config.show_fill;
    g_fill_dirty = true;
    g_exports = 0;

    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetCursorPosCallback(window, cursor_position_callback);
    glfwSetCursorEnterCallback(window, cursor_enter_callback);
    glfwSetScrollCallback(window, scroll_callback);
    glfwSetKeyCallback(window, key_callback);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glEnable(GL_LINE_SMOOTH);
    glClearColor(1.0f, 1.0f, 1.0f, 1.0f);

    FillConfig fill_config;
    fill_config.resolution = viz_config.fill_resolution;
    FillClassifier classifier(fill_config);
    FillMask fill_mask;

    log->info("Drawing window started. Controls:");
    log->info("  drag inside the wedge=draw, shift+drag or middle drag=pan, scroll=zoom");
    log->info("  f=freehand, l=line, u/ctrl+z=undo, shift+delete=clear");
    log->info("  e=export to {}, v=toggle fill, +/-=stroke width", viz_config.export_path);
    log->info("  r=reset view, q=quit");

    while (!glfwWindowShouldClose(window)) {
        session.tick(DrawingSession::Clock::now());

        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(window, &width, &height);
        glViewport(0, 0, width, height);
        glClear(GL_COLOR_BUFFER_BIT);

        int win_width = 0;
        int win_height = 0;
        glfwGetWindowSize(window, &win_width, &win_height);
        g_view.apply(win_width, win_height);

        std::vector<BakedPath> paths = session.get_all_baked_paths();

        if (g_show_fill) {
            if (g_fill_dirty) {
                fill_mask = classifier.classify(paths);
                g_fill_dirty = false;
            }
            render_fill(fill_mask);
        }

        render_wedge(session.wedge());

        // Framebuffer pixels per canvas unit, for stroke widths
        double pixels_per_unit = static_cast<double>(width) /
                                 std::max(1, win_width) / g_view.scale(win_width, win_height);
        render_paths(paths, pixels_per_unit, viz_config.curve_samples);

        if (auto segment = session.preview_segment()) {
            glColor3f(0.5f, 0.5f, 0.5f);
            glBegin(GL_LINES);
            glVertex2d(segment->first.x, segment->first.y);
            glVertex2d(segment->second.x, segment->second.y);
            glEnd();
        }

        render_snap_indicator(session.snap_indicator());

        glfwSwapBuffers(window);
        glfwPollEvents();
    }

    // A gesture still in progress is finished like a release
    if (g_adapter->armed()) {
        g_adapter->pointer_up(cursor_to_canvas(window, g_last_mouse_x, g_last_mouse_y));
    }

    result.completed = true;
    result.strokes_drawn = session.stroke_count();
    result.exports = g_exports;

    g_adapter.reset();
    g_session = nullptr;
    g_export_config = nullptr;
    g_viz_config = nullptr;

    glfwDestroyWindow(window);
    glfwTerminate();

    log->info("Drawing window closed. {} strokes, {} exports.",
              result.strokes_drawn, result.exports);

    return result;
}

bool visualization_available() {
    return true;
}

}  // namespace snowflake

#else  // SNOWFLAKE_HAS_VISUALIZATION not defined

namespace snowflake {

VisualizerResult run_drawing_window(
    DrawingSession&,
    const ExportConfig&,
    const VisualizerConfig&) {

    auto log = snowflake::logging::get_logger();
    log->error("Visualization not available - compile with GLFW and OpenGL");
    return VisualizerResult{};
}

bool visualization_available() {
    return false;
}

}  // namespace snowflake

#endif  // SNOWFLAKE_HAS_VISUALIZATION

#include <gtest/gtest.h>
#include <serialization/config_json.hpp>
#include <serialization/baked_path_json.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using namespace snowflake;

TEST(ConfigJsonTest, EmptyObjectKeepsDefaults) {
    AppConfig config = nlohmann::json::object().get<AppConfig>();

    EXPECT_EQ(config.session.wedge.center, Vec2(500.0, 500.0));
    EXPECT_DOUBLE_EQ(config.session.wedge.radius, 400.0);
    EXPECT_DOUBLE_EQ(config.session.wedge.span_degrees, 30.0);
    EXPECT_DOUBLE_EQ(config.session.stroke.simplify_epsilon, 2.0);
    EXPECT_DOUBLE_EQ(config.session.snap.threshold, 20.0);
    EXPECT_EQ(config.session.snap.start_indicator_duration.count(), 200);
    EXPECT_EQ(config.session.snap.finish_indicator_duration.count(), 300);
    EXPECT_DOUBLE_EQ(config.export_config.physical_size_mm, 200.0);
    EXPECT_EQ(config.export_config.stroke_color, "#FF0000");
    EXPECT_EQ(config.fill.resolution, 500);
}

TEST(ConfigJsonTest, PartialOverrides) {
    auto j = nlohmann::json::parse(R"({
        "session": {
            "stroke": {"mode": "line", "stroke_width": 3.5},
            "snap": {"threshold": 12, "finish_indicator_ms": 500}
        },
        "export": {"physical_size_mm": 150},
        "fill": {"resolution": 250, "num_threads": 2}
    })");

    AppConfig config = j.get<AppConfig>();
    EXPECT_EQ(config.session.stroke.mode, StrokeMode::Line);
    EXPECT_DOUBLE_EQ(config.session.stroke.stroke_width, 3.5);
    EXPECT_DOUBLE_EQ(config.session.stroke.simplify_epsilon, 2.0);
    EXPECT_DOUBLE_EQ(config.session.snap.threshold, 12.0);
    EXPECT_EQ(config.session.snap.start_indicator_duration.count(), 200);
    EXPECT_EQ(config.session.snap.finish_indicator_duration.count(), 500);
    EXPECT_DOUBLE_EQ(config.export_config.physical_size_mm, 150.0);
    EXPECT_DOUBLE_EQ(config.export_config.canvas_size, 1000.0);
    EXPECT_EQ(config.fill.resolution, 250);
    EXPECT_EQ(config.fill.num_threads, 2);
}

TEST(ConfigJsonTest, WritesEverySection) {
    nlohmann::json j = AppConfig{};

    ASSERT_TRUE(j.contains("session"));
    ASSERT_TRUE(j.contains("export"));
    ASSERT_TRUE(j.contains("fill"));
    EXPECT_EQ(j["session"]["wedge"]["center"], nlohmann::json::array({500.0, 500.0}));
    EXPECT_EQ(j["session"]["stroke"]["mode"], "freehand");
    EXPECT_EQ(j["session"]["snap"]["start_indicator_ms"], 200);
}

TEST(ConfigJsonTest, MalformedPointThrows) {
    auto j = nlohmann::json::parse(R"({"center": [1, 2, 3]})");
    EXPECT_THROW(j.get<WedgeConfig>(), std::runtime_error);
}

TEST(ConfigJsonTest, BakedPathDocument) {
    PathData path;
    path.move_to(Vec2(520.0, 400.0));
    path.line_to(Vec2(530.0, 350.0));

    nlohmann::json j = baked_path_to_json(BakedPath{4, path, 2.5});
    EXPECT_EQ(j["stroke_id"], 4);
    EXPECT_EQ(j["d"], "M 520.00 400.00 L 530.00 350.00");
    ASSERT_EQ(j["commands"].size(), 2u);
    EXPECT_EQ(j["commands"][1]["type"], "L");
    EXPECT_EQ(j["commands"][1]["points"][0], nlohmann::json::array({530.0, 350.0}));
}

TEST(ConfigJsonTest, BakeDocumentLayout) {
    PathData path;
    path.move_to(Vec2(520.0, 400.0));
    path.line_to(Vec2(530.0, 350.0));

    BakeDocument doc;
    doc.source_file = "strokes.json";
    doc.paths = {BakedPath{1, path, 2.0}};
    doc.endpoints = {Vec2(520.0, 400.0), Vec2(530.0, 350.0)};
    doc.stroke_count = 1;

    auto generated = std::chrono::system_clock::time_point{} + std::chrono::hours(24);
    nlohmann::json j = bake_document_to_json(doc, generated);

    EXPECT_EQ(j["format"], "snowflake-bake");
    EXPECT_EQ(j["version"], BakeDocument::FORMAT_VERSION);
    EXPECT_EQ(j["generated"], "1970-01-02T00:00:00Z");
    EXPECT_EQ(j["source_file"], "strokes.json");
    EXPECT_DOUBLE_EQ(j["session"]["wedge"]["radius"].get<double>(), 400.0);
    EXPECT_EQ(j["stats"]["path_count"], 1);
    EXPECT_EQ(j["stats"]["endpoint_count"], 2);
    EXPECT_EQ(j["paths"][0]["d"], "M 520.00 400.00 L 530.00 350.00");
    EXPECT_EQ(j["endpoints"][1], nlohmann::json::array({530.0, 350.0}));
}

TEST(ConfigJsonTest, MalformedFileNamesPath) {
    std::string path = ::testing::TempDir() + "snowflake_bad_config.json";
    {
        std::ofstream file(path);
        file << "{\"session\": ";
    }

    try {
        load_app_config(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
    }
    std::remove(path.c_str());
}

TEST(ConfigJsonTest, MissingFileThrows) {
    EXPECT_THROW(load_app_config(::testing::TempDir() + "snowflake_no_such_config.json"),
                 std::runtime_error);
}

// ============================================
// Validation
// ============================================

namespace {

void expect_rejected(const char* document) {
    auto j = nlohmann::json::parse(document);
    EXPECT_THROW(j.get<AppConfig>(), std::runtime_error) << document;
}

}  // namespace

TEST(ConfigJsonTest, RejectsNonPositiveRadius) {
    expect_rejected(R"({"session": {"wedge": {"radius": -5}}})");
    expect_rejected(R"({"session": {"wedge": {"radius": 0}}})");
}

TEST(ConfigJsonTest, RejectsSpanOutsideFullTurn) {
    expect_rejected(R"({"session": {"wedge": {"span_degrees": 0}}})");
    expect_rejected(R"({"session": {"wedge": {"span_degrees": -30}}})");
    expect_rejected(R"({"session": {"wedge": {"span_degrees": 360}}})");
}

TEST(ConfigJsonTest, RejectsNegativeSimplifyEpsilon) {
    expect_rejected(R"({"session": {"stroke": {"simplify_epsilon": -1}}})");
}

TEST(ConfigJsonTest, RejectsNonPositiveStrokeWidth) {
    expect_rejected(R"({"session": {"stroke": {"stroke_width": 0}}})");
    expect_rejected(R"({"session": {"stroke": {"stroke_width": -2}}})");
}

TEST(ConfigJsonTest, RejectsNegativeSnapThreshold) {
    expect_rejected(R"({"session": {"snap": {"threshold": -1}}})");
    expect_rejected(R"({"session": {"snap": {"start_indicator_ms": -200}}})");
}

TEST(ConfigJsonTest, RejectsNegativePrecision) {
    expect_rejected(R"({"export": {"precision": -1}})");
}

TEST(ConfigJsonTest, RejectsDegenerateExportSize) {
    expect_rejected(R"({"export": {"physical_size_mm": 0}})");
    expect_rejected(R"({"export": {"cut_width_mm": 0}})");
}

TEST(ConfigJsonTest, RejectsNonPositiveCurveSamples) {
    expect_rejected(R"({"fill": {"samples_per_curve": 0}})");
}

TEST(ConfigJsonTest, RejectsInvalidFillRaster) {
    expect_rejected(R"({"fill": {"resolution": 0}})");
    expect_rejected(R"({"fill": {"num_threads": -1}})");
}

TEST(ConfigJsonTest, AcceptsBoundaryValues) {
    auto j = nlohmann::json::parse(R"({
        "session": {
            "stroke": {"simplify_epsilon": 0},
            "snap": {"threshold": 0}
        },
        "export": {"precision": 0}
    })");
    AppConfig config = j.get<AppConfig>();
    EXPECT_DOUBLE_EQ(config.session.stroke.simplify_epsilon, 0.0);
    EXPECT_DOUBLE_EQ(config.session.snap.threshold, 0.0);
    EXPECT_EQ(config.export_config.precision, 0);
}

#include <gtest/gtest.h>
#include <session/stroke_script.hpp>
#include <serialization/stroke_script_json.hpp>

using namespace snowflake;

TEST(StrokeScriptTest, ReplaysEveryGesture) {
    StrokeScript script;
    script.strokes.push_back(ScriptedStroke{StrokeMode::Line, std::nullopt,
                                            {Vec2(520.0, 400.0), Vec2(530.0, 350.0)}});
    script.strokes.push_back(ScriptedStroke{StrokeMode::Freehand, 3.0,
                                            {Vec2(560.0, 250.0), Vec2(575.0, 240.0), Vec2(590.0, 250.0)}});

    DrawingSession session;
    ReplayResult result = replay_script(session, script);

    EXPECT_EQ(result.finished, 2u);
    EXPECT_EQ(result.rejected, 0u);
    EXPECT_EQ(session.stroke_count(), 2u);
    EXPECT_EQ(session.history()[0].mode, StrokeMode::Line);
    EXPECT_DOUBLE_EQ(session.history()[1].stroke_width, 3.0);
}

TEST(StrokeScriptTest, RejectedGesturesAreCounted) {
    StrokeScript script;
    script.strokes.push_back(ScriptedStroke{StrokeMode::Freehand, std::nullopt,
                                            {Vec2(300.0, 300.0), Vec2(200.0, 300.0)}});
    script.strokes.push_back(ScriptedStroke{});

    DrawingSession session;
    ReplayResult result = replay_script(session, script);

    EXPECT_EQ(result.finished, 0u);
    EXPECT_EQ(result.rejected, 2u);
    EXPECT_EQ(session.stroke_count(), 0u);
}

TEST(StrokeScriptTest, ReadsJsonDocument) {
    auto j = nlohmann::json::parse(R"({
        "strokes": [
            {"mode": "line", "points": [[520, 400], [530, 350]]},
            {"mode": "freehand", "stroke_width": 1.5, "points": [[560, 250], [590, 250]]}
        ]
    })");

    StrokeScript script = stroke_script_from_json(j);
    ASSERT_EQ(script.strokes.size(), 2u);
    ASSERT_TRUE(script.strokes[0].mode.has_value());
    EXPECT_EQ(*script.strokes[0].mode, StrokeMode::Line);
    EXPECT_FALSE(script.strokes[0].stroke_width.has_value());
    EXPECT_EQ(script.strokes[0].points[1], Vec2(530.0, 350.0));
    EXPECT_DOUBLE_EQ(*script.strokes[1].stroke_width, 1.5);
}

TEST(StrokeScriptTest, MissingModeKeepsSessionMode) {
    auto j = nlohmann::json::parse(R"({
        "strokes": [
            {"points": [[520, 400], [530, 350]]},
            {"mode": "freehand", "points": [[560, 250], [575, 240], [590, 250]]},
            {"points": [[540, 200], [545, 210], [550, 205]]}
        ]
    })");
    StrokeScript script = stroke_script_from_json(j);
    EXPECT_FALSE(script.strokes[0].mode.has_value());

    SessionConfig config;
    config.stroke.mode = StrokeMode::Line;
    DrawingSession session(config);
    ReplayResult result = replay_script(session, script);

    ASSERT_EQ(result.finished, 3u);
    EXPECT_EQ(session.history()[0].mode, StrokeMode::Line);
    EXPECT_EQ(session.history()[1].mode, StrokeMode::Freehand);
    EXPECT_EQ(session.history()[2].mode, StrokeMode::Freehand);
}

TEST(StrokeScriptTest, UnknownModeThrows) {
    auto j = nlohmann::json::parse(R"({"strokes": [{"mode": "spiral", "points": []}]})");
    EXPECT_THROW(stroke_script_from_json(j), std::runtime_error);
}

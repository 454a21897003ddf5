#include <gtest/gtest.h>
#include <symmetry/transform_baker.hpp>
#include <geometry/stroke_synthesizer.hpp>
#include "test_helpers.hpp"

using namespace snowflake;
using snowflake::test::near;

namespace {

const Vec2 kCenter{500.0, 500.0};

PathData sample_curve() {
    return points_to_path({Vec2(510.0, 300.0), Vec2(520.0, 280.0),
                           Vec2(515.0, 250.0), Vec2(530.0, 220.0)});
}

void expect_paths_near(const PathData& actual, const PathData& expected, double tol) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); ++i) {
        const auto& a = actual.commands()[i];
        const auto& e = expected.commands()[i];
        EXPECT_EQ(a.type, e.type);
        ASSERT_EQ(a.points.size(), e.points.size());
        for (size_t k = 0; k < a.points.size(); ++k) {
            EXPECT_TRUE(near(a.points[k], e.points[k], tol))
                << "command " << i << " point " << k;
        }
    }
}

}  // namespace

// ============================================
// Baking properties
// ============================================

TEST(TransformBakerTest, IdentityBakeIsUnchanged) {
    TransformBaker baker;
    PathData path = sample_curve();

    PathData once = baker.bake(path, Transform{});
    EXPECT_EQ(once, path);
    EXPECT_EQ(baker.bake(once, Transform{}), once);
    EXPECT_TRUE(baker.warnings().empty());
}

TEST(TransformBakerTest, DoubleMirrorRestoresCoordinates) {
    TransformBaker baker;
    PathData path = sample_curve();

    PathData baked = baker.bake(path, Transform::mirror(500.0) * Transform::mirror(500.0));
    expect_paths_near(baked, path, 0.01);

    PathData stepwise = baker.bake(baker.bake(path, Transform::mirror(500.0)), Transform::mirror(500.0));
    expect_paths_near(stepwise, path, 0.01);
}

TEST(TransformBakerTest, SixRotationStepsReturnHome) {
    TransformBaker baker;
    PathData path = sample_curve();

    PathData current = path;
    for (int i = 0; i < 6; ++i) {
        current = baker.bake(current, Transform::rotate(60.0, kCenter));
    }
    expect_paths_near(current, path, 0.01);
}

TEST(TransformBakerTest, KeepsCommandTypesAndOrder) {
    TransformBaker baker;
    PathData path;
    path.move_to(Vec2(510.0, 300.0));
    path.add_command(PathCommand{PathCommandType::QuadraticTo, {Vec2(515.0, 280.0), Vec2(520.0, 260.0)}});
    path.line_to(Vec2(525.0, 240.0));

    PathData baked = baker.bake(path, Transform::rotate(120.0, kCenter));
    ASSERT_EQ(baked.size(), 3u);
    EXPECT_EQ(baked.commands()[0].type, PathCommandType::MoveTo);
    EXPECT_EQ(baked.commands()[1].type, PathCommandType::QuadraticTo);
    EXPECT_EQ(baked.commands()[2].type, PathCommandType::LineTo);
}

TEST(TransformBakerTest, MalformedCommandSkippedWithWarning) {
    TransformBaker baker;
    PathData path;
    path.move_to(Vec2(510.0, 300.0));
    path.line_to(Vec2(520.0, 280.0));
    path.add_command(PathCommand{PathCommandType::CubicTo, {Vec2(1.0, 2.0), Vec2(3.0, 4.0)}});
    path.line_to(Vec2(530.0, 260.0));

    PathData baked = baker.bake(path, Transform::mirror(500.0));

    ASSERT_EQ(baked.size(), 3u);
    EXPECT_EQ(baked.commands()[1].points[0], Vec2(480.0, 280.0));
    EXPECT_EQ(baked.commands()[2].points[0], Vec2(470.0, 260.0));
    ASSERT_EQ(baker.warnings().size(), 1u);
    EXPECT_NE(baker.warnings()[0].find("index 2"), std::string::npos);

}

TEST(TransformBakerTest, FormattedWithTwoDecimals) {
    TransformBaker baker;
    PathData path = straight_path(Vec2(500.0, 300.0), Vec2(500.0, 200.0));

    BakedPath baked{1, baker.bake(path, Transform::rotate(90.0, kCenter)), 2.0};
    EXPECT_EQ(baked.to_svg(), "M 700.00 500.00 L 800.00 500.00");
}

// ============================================
// Replica baking
// ============================================

TEST(TransformBakerTest, RotationZeroReplicaMatchesSource) {
    SymmetryReplicator replicator;
    SourceStroke stroke;
    stroke.id = 1;
    stroke.points = {Vec2(550.0, 450.0), Vec2(600.0, 480.0)};
    stroke.path = straight_path(stroke.points[0], stroke.points[1]);
    replicator.add_stroke(stroke);

    TransformBaker baker;
    auto baked = baker.bake_all(replicator);
    ASSERT_EQ(baked.size(), 12u);

    const auto& replicas = *replicator.replicas_for(1);
    for (size_t i = 0; i < replicas.size(); ++i) {
        if (replicas[i].rotation_degrees != 0) {
            continue;
        }
        if (!replicas[i].mirrored) {
            EXPECT_EQ(baked[i].path, stroke.path);
        } else {
            EXPECT_EQ(*baked[i].path.first_point(), Vec2(450.0, 450.0));
            EXPECT_EQ(*baked[i].path.last_point(), Vec2(400.0, 480.0));
        }
    }
}

TEST(TransformBakerTest, EndpointsTwoPerReplica) {
    SymmetryReplicator replicator;
    SourceStroke stroke;
    stroke.id = 1;
    stroke.path = sample_curve();
    replicator.add_stroke(stroke);

    TransformBaker baker;
    auto endpoints = baker.baked_endpoints(replicator);
    ASSERT_EQ(endpoints.size(), 24u);

    // Every endpoint lies at the source endpoint's distance from the center
    double r_first = Vec2(510.0, 300.0).distance_to(kCenter);
    double r_last = Vec2(530.0, 220.0).distance_to(kCenter);
    for (size_t i = 0; i < endpoints.size(); i += 2) {
        EXPECT_NEAR(endpoints[i].distance_to(kCenter), r_first, 1e-9);
        EXPECT_NEAR(endpoints[i + 1].distance_to(kCenter), r_last, 1e-9);
    }
}

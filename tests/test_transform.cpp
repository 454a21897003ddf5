#include <gtest/gtest.h>
#include <symmetry/transform.hpp>
#include "test_helpers.hpp"

using namespace snowflake;
using snowflake::test::expect_vec_near;
using snowflake::test::near;

namespace {
const Vec2 kCenter{500.0, 500.0};
}

TEST(TransformTest, IdentityLeavesPointsUnchanged) {
    Transform t;
    EXPECT_TRUE(t.ops().empty());
    EXPECT_EQ(t.apply(Vec2(123.4, 567.8)), Vec2(123.4, 567.8));
}

TEST(TransformTest, RotateFollowsScreenConvention) {
    // Positive angles turn clockwise on a y-down surface
    Transform t = Transform::rotate(90.0, kCenter);
    expect_vec_near(t.apply(Vec2(500.0, 100.0)), Vec2(900.0, 500.0), 1e-9);
    expect_vec_near(t.apply(Vec2(900.0, 500.0)), Vec2(500.0, 900.0), 1e-9);
    expect_vec_near(t.apply(kCenter), kCenter, 1e-12);
}

TEST(TransformTest, MirrorAcrossVerticalAxis) {
    Transform t = Transform::mirror(500.0);
    EXPECT_EQ(t.apply(Vec2(550.0, 450.0)), Vec2(450.0, 450.0));
    EXPECT_EQ(t.apply(Vec2(600.0, 480.0)), Vec2(400.0, 480.0));
}

TEST(TransformTest, MirrorTwiceIsIdentity) {
    Transform t = Transform::mirror(500.0) * Transform::mirror(500.0);
    Vec2 p(537.25, 211.5);
    EXPECT_TRUE(near(t.apply(p), p, 0.01));
}

TEST(TransformTest, SixSixtyDegreeStepsAreIdentity) {
    Transform step = Transform::rotate(60.0, kCenter);
    Transform full = step * step * step * step * step * step;
    ASSERT_EQ(full.ops().size(), 6u);

    Vec2 p(560.0, 180.0);
    EXPECT_TRUE(near(full.apply(p), p, 0.01));
}

TEST(TransformTest, CompositionAppliesInnerFirst) {
    Transform t = Transform::rotate(90.0, kCenter) * Transform::mirror(500.0);
    // mirror (600,500) -> (400,500), then rotate 90 clockwise -> (500,400)
    expect_vec_near(t.apply(Vec2(600.0, 500.0)), Vec2(500.0, 400.0), 1e-9);

    Transform reversed = Transform::mirror(500.0) * Transform::rotate(90.0, kCenter);
    // rotate (600,500) -> (500,600), then mirror -> (500,600)
    expect_vec_near(reversed.apply(Vec2(600.0, 500.0)), Vec2(500.0, 600.0), 1e-9);
}

TEST(TransformTest, ScaleAndTranslate) {
    Transform t = Transform::translate(Vec2(10.0, -5.0)) * Transform::scale(2.0, 3.0);
    EXPECT_EQ(t.apply(Vec2(1.0, 1.0)), Vec2(12.0, -2.0));
}

TEST(TransformTest, MirrorMatchesScaleTranslateForm) {
    Transform mirror = Transform::mirror(500.0);
    Transform svg_form = Transform::scale(-1.0, 1.0) * Transform::translate(Vec2(-1000.0, 0.0));

    for (const Vec2& p : {Vec2(550.0, 450.0), Vec2(0.0, 0.0), Vec2(1000.0, 333.0)}) {
        expect_vec_near(mirror.apply(p), svg_form.apply(p), 1e-12);
    }
}

TEST(TransformTest, SvgAttributeText) {
    Transform t = Transform::rotate(60.0, kCenter) * Transform::mirror(500.0);
    EXPECT_EQ(t.to_svg(), "rotate(60 500 500) scale(-1, 1) translate(-1000, 0)");
    EXPECT_EQ(Transform::mirror(0.0).to_svg(), "scale(-1, 1) translate(0, 0)");
    EXPECT_EQ(Transform{}.to_svg(), "");
}

#include <gtest/gtest.h>
#include <math/vec2.hpp>

using namespace snowflake;

TEST(Vec2Test, Arithmetic) {
    Vec2 a(1.0, 2.0);
    Vec2 b(3.0, -4.0);

    EXPECT_EQ(a + b, Vec2(4.0, -2.0));
    EXPECT_EQ(a - b, Vec2(-2.0, 6.0));
    EXPECT_EQ(a * 2.0, Vec2(2.0, 4.0));
    EXPECT_EQ(b / 2.0, Vec2(1.5, -2.0));
    EXPECT_EQ(-a, Vec2(-1.0, -2.0));
}

TEST(Vec2Test, DotAndCross) {
    Vec2 a(1.0, 0.0);
    Vec2 b(0.0, 1.0);

    EXPECT_DOUBLE_EQ(a.dot(b), 0.0);
    EXPECT_DOUBLE_EQ(a.cross(b), 1.0);
    EXPECT_DOUBLE_EQ(b.cross(a), -1.0);
}

TEST(Vec2Test, LengthAndDistance) {
    Vec2 v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.length_squared(), 25.0);
    EXPECT_DOUBLE_EQ(Vec2(550.0, 450.0).distance_to(Vec2(551.0, 451.0)), std::sqrt(2.0));
}

TEST(Vec2Test, ExactComparison) {
    EXPECT_TRUE(Vec2(1.0, 2.0) == Vec2(1.0, 2.0));
    EXPECT_TRUE(Vec2(1.0, 2.0) != Vec2(1.0, 2.0 + 1e-12));
}

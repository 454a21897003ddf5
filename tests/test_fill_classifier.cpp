#include <gtest/gtest.h>
#include <fill/fill_classifier.hpp>
#include "test_helpers.hpp"

using namespace snowflake;
using snowflake::test::draw_freehand;

namespace {

BakedPath square(double x0, double y0, double x1, double y1) {
    PathData path;
    path.move_to(Vec2(x0, y0));
    path.line_to(Vec2(x1, y0));
    path.line_to(Vec2(x1, y1));
    path.line_to(Vec2(x0, y1));
    path.line_to(Vec2(x0, y0));
    return BakedPath{1, path, 2.0};
}

FillConfig small_raster() {
    FillConfig config;
    config.resolution = 100;
    return config;
}

}  // namespace

TEST(FillClassifierTest, EmptyPathSetIsAllPaper) {
    FillClassifier classifier(small_raster());
    FillMask mask = classifier.classify({});

    EXPECT_EQ(mask.width(), 100);
    EXPECT_EQ(mask.height(), 100);
    EXPECT_EQ(mask.cut_count(), 0u);
    EXPECT_DOUBLE_EQ(mask.cut_fraction(), 0.0);
}

TEST(FillClassifierTest, ClosedSquareIsCut) {
    FillClassifier classifier(small_raster());
    FillMask mask = classifier.classify({square(200.0, 200.0, 400.0, 400.0)});

    // 10 units per cell: cells 20..39 in both directions
    EXPECT_EQ(mask.cut_count(), 400u);
    EXPECT_TRUE(mask.is_cut(20, 20));
    EXPECT_TRUE(mask.is_cut(39, 39));
    EXPECT_FALSE(mask.is_cut(19, 20));
    EXPECT_FALSE(mask.is_cut(40, 39));
    EXPECT_DOUBLE_EQ(mask.cut_fraction(), 0.04);
}

TEST(FillClassifierTest, NestedSquaresAlternate) {
    FillClassifier classifier(small_raster());
    FillMask mask = classifier.classify({square(100.0, 100.0, 900.0, 900.0),
                                         square(300.0, 300.0, 700.0, 700.0)});

    EXPECT_TRUE(mask.is_cut(15, 50));
    EXPECT_FALSE(mask.is_cut(50, 50));
    EXPECT_FALSE(mask.is_cut(5, 5));
}

TEST(FillClassifierTest, OpenPathIsClosedImplicitly) {
    PathData path;
    path.move_to(Vec2(200.0, 200.0));
    path.line_to(Vec2(400.0, 200.0));
    path.line_to(Vec2(400.0, 400.0));
    path.line_to(Vec2(200.0, 400.0));

    FillClassifier classifier(small_raster());
    FillMask mask = classifier.classify({BakedPath{1, path, 2.0}});
    EXPECT_EQ(mask.cut_count(), 400u);
}

TEST(FillClassifierTest, ReplicatedStrokesProduceSymmetricMask) {
    DrawingSession session;
    ASSERT_TRUE(draw_freehand(session, {Vec2(510.0, 300.0), Vec2(560.0, 280.0),
                                        Vec2(590.0, 250.0)}).has_value());

    FillClassifier classifier(small_raster());
    FillMask mask = classifier.classify(session.get_all_baked_paths());

    for (int y = 0; y < mask.height(); ++y) {
        for (int x = 0; x < mask.width(); ++x) {
            EXPECT_EQ(mask.is_cut(x, y), mask.is_cut(mask.width() - 1 - x, y))
                << "cell " << x << ", " << y;
        }
    }
}

TEST(FillClassifierTest, PgmEncoding) {
    FillMask mask(3, 2);
    mask.set_cut(1, 0, true);

    std::string pgm = mask.to_pgm();
    std::string header = "P5\n3 2\n255\n";
    ASSERT_EQ(pgm.size(), header.size() + 6);
    EXPECT_EQ(pgm.substr(0, header.size()), header);
    EXPECT_EQ(static_cast<unsigned char>(pgm[header.size() + 1]), 255);
    EXPECT_EQ(static_cast<unsigned char>(pgm[header.size()]), 0);
}

TEST(FillClassifierTest, InvalidResolutionThrows) {
    FillConfig config;
    config.resolution = 0;
    EXPECT_THROW(FillClassifier classifier(config), std::invalid_argument);
}

#include <gtest/gtest.h>
#include "layout/calibration/measure_tool.h"
#include "layout/calibration/scale_calibrator.h"
#include "layout/view/view_transform.h"
#include "tests/layout_test_common.h"

#include <cmath>
#include <limits>

using namespace layout;
using layout_test::LayoutEngineTest;

namespace {

void drawLine(ScaleCalibrator& calibrator, Point2 a, Point2 b) {
    calibrator.begin();
    calibrator.click(a);
    calibrator.click(b);
}

} // namespace

TEST(ScaleCalibratorTest, ScaleIsPixelLengthOverRealLength) {
    ScaleCalibrator calibrator;
    drawLine(calibrator, Point2{0.0, 0.0}, Point2{300.0, 400.0});
    ASSERT_EQ(calibrator.phase(), ScaleCalibrator::Phase::AwaitingLength);
    ASSERT_TRUE(calibrator.pixelLength().has_value());
    EXPECT_DOUBLE_EQ(*calibrator.pixelLength(), 500.0);

    double scale = 0.0;
    ASSERT_EQ(calibrator.commit(250.0, scale), LayoutError::Ok);
    EXPECT_DOUBLE_EQ(scale, 500.0 / 250.0);
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::Inactive);

    ASSERT_TRUE(calibrator.referenceSquare().has_value());
    EXPECT_DOUBLE_EQ(calibrator.referenceSquare()->x, 0.0);
    EXPECT_DOUBLE_EQ(calibrator.referenceSquare()->y, 0.0);
    EXPECT_DOUBLE_EQ(calibrator.referenceSquare()->size, 200.0);
}

TEST(ScaleCalibratorTest, ArbitraryLengthsDivideExactly) {
    const double lengths[] = {1.0, 37.5, 123.456, 1000.0};
    for (const double real : lengths) {
        ScaleCalibrator calibrator;
        drawLine(calibrator, Point2{10.0, 10.0}, Point2{10.0, 187.3});
        const double pixels = *calibrator.pixelLength();
        double scale = 0.0;
        ASSERT_EQ(calibrator.commit(real, scale), LayoutError::Ok);
        EXPECT_EQ(scale, pixels / real);
    }
}

TEST(ScaleCalibratorTest, RejectedLengthKeepsPhaseOpen) {
    ScaleCalibrator calibrator;
    drawLine(calibrator, Point2{0.0, 0.0}, Point2{100.0, 0.0});

    double scale = -1.0;
    EXPECT_EQ(calibrator.commit(0.0, scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.commit(-5.0, scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.commit(std::nullopt, scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.commit(std::numeric_limits<double>::quiet_NaN(), scale),
              LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.commit(std::numeric_limits<double>::infinity(), scale),
              LayoutError::InvalidCalibrationInput);
    EXPECT_DOUBLE_EQ(scale, -1.0);
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::AwaitingLength);

    ASSERT_EQ(calibrator.commit(20.0, scale), LayoutError::Ok);
    EXPECT_DOUBLE_EQ(scale, 5.0);
}

TEST(ScaleCalibratorTest, TextInputMustBeACompleteNumber) {
    ScaleCalibrator calibrator;
    drawLine(calibrator, Point2{0.0, 0.0}, Point2{0.0, 90.0});

    double scale = 0.0;
    EXPECT_EQ(calibrator.commitText("12abc", scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.commitText("   ", scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.commitText("-30", scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::AwaitingLength);

    ASSERT_EQ(calibrator.commitText(" 45 ", scale), LayoutError::Ok);
    EXPECT_DOUBLE_EQ(scale, 2.0);
}

TEST(ScaleCalibratorTest, CommitBeforeLineIsInvalidOperation) {
    ScaleCalibrator calibrator;
    double scale = 0.0;
    EXPECT_EQ(calibrator.commit(100.0, scale), LayoutError::InvalidOperation);

    calibrator.begin();
    calibrator.click(Point2{1.0, 1.0});
    EXPECT_EQ(calibrator.commit(100.0, scale), LayoutError::InvalidOperation);
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::AwaitingEnd);
}

TEST(ScaleCalibratorTest, ZeroLengthLineIsRejected) {
    ScaleCalibrator calibrator;
    drawLine(calibrator, Point2{5.0, 5.0}, Point2{5.0, 5.0});
    double scale = 0.0;
    EXPECT_EQ(calibrator.commit(100.0, scale), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::AwaitingLength);
}

TEST(ScaleCalibratorTest, ExtraClickMovesEndPoint) {
    ScaleCalibrator calibrator;
    drawLine(calibrator, Point2{0.0, 0.0}, Point2{10.0, 0.0});
    calibrator.click(Point2{0.0, 40.0});
    EXPECT_DOUBLE_EQ(*calibrator.pixelLength(), 40.0);
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::AwaitingLength);
}

TEST(ScaleCalibratorTest, CancelDiscardsPoints) {
    ScaleCalibrator calibrator;
    calibrator.begin();
    calibrator.click(Point2{3.0, 4.0});
    calibrator.cancel();
    EXPECT_EQ(calibrator.phase(), ScaleCalibrator::Phase::Inactive);
    EXPECT_FALSE(calibrator.start().has_value());
    EXPECT_FALSE(calibrator.pixelLength().has_value());

    // Clicks while inactive are ignored.
    EXPECT_EQ(calibrator.click(Point2{9.0, 9.0}), ScaleCalibrator::Phase::Inactive);
}

TEST(ScaleCalibratorTest, ScreenClicksUseTheViewTransform) {
    ViewTransform view;
    view.setState(ViewTransformState{2.0, 10.0, 10.0});

    ScaleCalibrator calibrator;
    calibrator.begin();
    calibrator.clickAt(Point2{10.0, 10.0}, view);
    calibrator.clickAt(Point2{210.0, 10.0}, view);

    ASSERT_TRUE(calibrator.start().has_value());
    EXPECT_DOUBLE_EQ(calibrator.start()->x, 0.0);
    EXPECT_DOUBLE_EQ(*calibrator.pixelLength(), 100.0);
}

TEST(MeasureToolTest, TwoClicksProduceALabelledLine) {
    MeasureTool tool;
    tool.begin();
    EXPECT_FALSE(tool.click(Point2{0.0, 0.0}, 2.0).has_value());
    ASSERT_TRUE(tool.start().has_value());

    const auto line = tool.click(Point2{300.0, 400.0}, 2.0);
    ASSERT_TRUE(line.has_value());
    EXPECT_DOUBLE_EQ(line->lengthCm, 250.0);
    EXPECT_EQ(line->label, "2.50m");
    EXPECT_FALSE(tool.isActive());
    ASSERT_TRUE(tool.lastLine().has_value());
    EXPECT_DOUBLE_EQ(tool.lastLine()->x2, 300.0);
}

TEST(MeasureToolTest, MissingScaleCountsAsOnePixelPerCentimetre) {
    MeasureTool tool;
    tool.begin();
    tool.click(Point2{0.0, 0.0}, std::nullopt);
    const auto line = tool.click(Point2{0.0, 123.0}, std::nullopt);
    ASSERT_TRUE(line.has_value());
    EXPECT_DOUBLE_EQ(line->lengthCm, 123.0);
    EXPECT_EQ(line->label, "1.23m");
}

TEST(MeasureToolTest, InactiveToolIgnoresClicks) {
    MeasureTool tool;
    EXPECT_FALSE(tool.click(Point2{1.0, 1.0}, 1.0).has_value());
    EXPECT_FALSE(tool.start().has_value());
    EXPECT_EQ(formatMetres(235.0), "2.35m");
}

TEST_F(LayoutEngineTest, CalibrationCommitIsOneHistoryStep) {
    load({}, std::nullopt);
    engine->beginCalibration();
    EXPECT_EQ(engine->mode(), InteractionMode::Scaling);
    engine->click(Point2{0.0, 0.0}, 0);
    engine->click(Point2{0.0, 150.0}, 0);

    EXPECT_EQ(engine->commitCalibration(0.0), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(engine->lastError(), LayoutError::InvalidCalibrationInput);
    EXPECT_EQ(engine->history().size(), 1u);
    EXPECT_EQ(engine->mode(), InteractionMode::Scaling);

    ASSERT_EQ(engine->commitCalibration(75.0), LayoutError::Ok);
    ASSERT_TRUE(engine->project().scale.has_value());
    EXPECT_DOUBLE_EQ(*engine->project().scale, 2.0);
    EXPECT_EQ(engine->history().size(), 2u);
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);

    // Recalibration overwrites; cancelling never touches history.
    engine->beginCalibration();
    engine->click(Point2{0.0, 0.0}, 0);
    engine->cancelCalibration();
    EXPECT_DOUBLE_EQ(*engine->project().scale, 2.0);
    EXPECT_EQ(engine->history().size(), 2u);

    ASSERT_EQ(engine->undo(), LayoutError::Ok);
    EXPECT_FALSE(engine->project().scale.has_value());
}

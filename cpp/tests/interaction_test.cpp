#include <gtest/gtest.h>
#include "layout/interaction/pointer_capture.h"
#include "tests/layout_test_common.h"

#include <string>
#include <utility>
#include <vector>

using namespace layout;
using layout_test::LayoutEngineTest;
using layout_test::makeItem;
using layout_test::makeTemplate;
using layout_test::mods;

namespace {

using Ids = std::vector<std::string>;

class InteractionTest : public LayoutEngineTest {
protected:
    void SetUp() override {
        LayoutEngineTest::SetUp();
        load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0}),
              makeItem("b", "Chair", 40, 40, Point2{200.0, 0.0})});
    }
};

} // namespace

TEST(PointerCaptureTest, ReleasesExactlyOnce) {
    std::vector<bool> calls;
    {
        PointerCapture capture([&](bool captured) { calls.push_back(captured); });
        EXPECT_TRUE(capture.active());
        capture.release();
        capture.release();
        EXPECT_FALSE(capture.active());
    }
    EXPECT_EQ(calls, (std::vector<bool>{true, false}));

    calls.clear();
    {
        PointerCapture outer([&](bool captured) { calls.push_back(captured); });
        PointerCapture moved(std::move(outer));
        EXPECT_FALSE(outer.active());
        EXPECT_TRUE(moved.active());
    }
    EXPECT_EQ(calls, (std::vector<bool>{true, false}));
}

TEST_F(InteractionTest, ItemDragCommitsOnceThenLiveUpdates) {
    engine->pointerDown(Point2{10.0, 10.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::PendingItem);
    EXPECT_TRUE(engine->isPointerCaptured());
    EXPECT_EQ(captures, 1);

    // Below the threshold nothing moves.
    engine->pointerMove(Point2{11.0, 10.0}, 0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 0.0);
    EXPECT_EQ(engine->history().size(), 1u);

    engine->pointerMove(Point2{20.0, 10.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::MovingItem);
    EXPECT_DOUBLE_EQ(item("a").position->x, 10.0);
    EXPECT_EQ(engine->history().size(), 2u);

    engine->pointerMove(Point2{30.0, 15.0}, 0);
    engine->pointerMove(Point2{45.0, 25.0}, 0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 35.0);
    EXPECT_DOUBLE_EQ(item("a").position->y, 15.0);
    EXPECT_EQ(engine->history().size(), 2u);

    engine->pointerUp(Point2{50.0, 25.0}, 0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 40.0);
    EXPECT_FALSE(engine->isPointerCaptured());
    EXPECT_EQ(releases, 1);

    // The click that ends the drag does not select.
    engine->click(Point2{50.0, 25.0}, 0);
    EXPECT_TRUE(engine->selection().empty());

    ASSERT_EQ(engine->undo(), LayoutError::Ok);
    EXPECT_DOUBLE_EQ(item("a").position->x, 0.0);
    EXPECT_DOUBLE_EQ(item("a").position->y, 0.0);
}

TEST_F(InteractionTest, PressWithoutDragIsAClick) {
    engine->pointerDown(Point2{10.0, 10.0}, 0);
    engine->pointerUp(Point2{11.0, 10.0}, 0);
    EXPECT_EQ(engine->history().size(), 1u);
    engine->click(Point2{11.0, 10.0}, 0);
    EXPECT_EQ(engine->selection(), (Ids{"a"}));
    EXPECT_EQ(captures, 1);
    EXPECT_EQ(releases, 1);
}

TEST_F(InteractionTest, DragFollowsTheViewScale) {
    engine->view().setState(ViewTransformState{2.0, 0.0, 0.0});
    engine->pointerDown(Point2{20.0, 20.0}, 0);
    engine->pointerMove(Point2{60.0, 20.0}, 0);
    engine->pointerUp(Point2{60.0, 20.0}, 0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 20.0);
}

TEST_F(InteractionTest, BlurReleasesCaptureAndKeepsProgress) {
    engine->pointerDown(Point2{10.0, 10.0}, 0);
    engine->pointerMove(Point2{30.0, 10.0}, 0);
    engine->blur();

    EXPECT_FALSE(engine->isPointerCaptured());
    EXPECT_EQ(engine->dragKind(), DragKind::None);
    EXPECT_EQ(captures, 1);
    EXPECT_EQ(releases, 1);
    EXPECT_DOUBLE_EQ(item("a").position->x, 20.0);

    // Later moves are ignored.
    engine->pointerMove(Point2{90.0, 10.0}, 0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 20.0);
    engine->blur();
    EXPECT_EQ(releases, 1);
}

TEST_F(InteractionTest, MarqueeDragSelectsAndLeavesMode) {
    engine->setMarqueeMode(true);
    EXPECT_EQ(engine->mode(), InteractionMode::MarqueeSelecting);

    engine->pointerDown(Point2{-5.0, -5.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::Marquee);
    engine->pointerMove(Point2{150.0, 60.0}, 0);
    ASSERT_TRUE(engine->marqueeRect().has_value());
    EXPECT_DOUBLE_EQ(engine->marqueeRect()->maxX, 150.0);

    engine->pointerUp(Point2{150.0, 60.0}, 0);
    EXPECT_EQ(engine->selection(), (Ids{"a"}));
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
    EXPECT_FALSE(engine->marqueeRect().has_value());
    EXPECT_EQ(releases, 1);

    engine->click(Point2{150.0, 60.0}, 0);
    EXPECT_EQ(engine->selection(), (Ids{"a"}));
}

TEST_F(InteractionTest, EscapeAbandonsMarqueeAndCancelsEverything) {
    ASSERT_EQ(engine->setSelection({"b"}), LayoutError::Ok);
    engine->setMarqueeMode(true);
    engine->pointerDown(Point2{-5.0, -5.0}, 0);
    engine->pointerMove(Point2{300.0, 60.0}, 0);

    engine->keyDown(InputKey::Escape);
    EXPECT_EQ(engine->dragKind(), DragKind::None);
    EXPECT_FALSE(engine->isPointerCaptured());
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
    EXPECT_TRUE(engine->selection().empty());

    engine->pointerUp(Point2{300.0, 60.0}, 0);
    EXPECT_TRUE(engine->selection().empty());
}

TEST_F(InteractionTest, EscapeClosesTools) {
    ASSERT_EQ(engine->startPlacement(makeTemplate("Lamp", 20, 20), 3), LayoutError::Ok);
    engine->keyDown(InputKey::Escape);
    EXPECT_FALSE(engine->placement().isActive());

    engine->beginMeasure();
    engine->click(Point2{0.0, 0.0}, 0);
    engine->click(Point2{0.0, 100.0}, 0);
    ASSERT_TRUE(engine->measureTool().lastLine().has_value());
    engine->keyDown(InputKey::Escape);
    EXPECT_FALSE(engine->measureTool().lastLine().has_value());
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
}

TEST_F(InteractionTest, ModesAreMutuallyExclusive) {
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);

    engine->beginCalibration();
    EXPECT_EQ(engine->mode(), InteractionMode::Scaling);

    engine->beginMeasure();
    EXPECT_EQ(engine->mode(), InteractionMode::Measuring);
    EXPECT_FALSE(engine->calibrator().isActive());

    ASSERT_EQ(engine->startPlacement(makeTemplate("Lamp", 20, 20), 1), LayoutError::Ok);
    EXPECT_EQ(engine->mode(), InteractionMode::Placing);
    EXPECT_FALSE(engine->measureTool().isActive());

    // A rejected start leaves the current tool open.
    EXPECT_EQ(engine->startPlacement(makeTemplate("Lamp", 20, 20), 0), LayoutError::InvalidOperation);
    EXPECT_EQ(engine->mode(), InteractionMode::Placing);

    engine->setMarqueeMode(true);
    EXPECT_EQ(engine->mode(), InteractionMode::MarqueeSelecting);
    EXPECT_FALSE(engine->placement().isActive());

    engine->beginCalibration();
    EXPECT_EQ(engine->mode(), InteractionMode::Scaling);
    engine->cancelCalibration();
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);

    engine->toggleMarqueeMode();
    EXPECT_EQ(engine->mode(), InteractionMode::MarqueeSelecting);
    engine->toggleMarqueeMode();
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
}

TEST_F(InteractionTest, ToolModesIgnorePointerDrags) {
    engine->beginCalibration();
    engine->pointerDown(Point2{10.0, 10.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::None);
    EXPECT_EQ(captures, 0);
    engine->pointerMove(Point2{60.0, 10.0}, 0);
    engine->pointerUp(Point2{60.0, 10.0}, 0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 0.0);
}

TEST_F(InteractionTest, PlacementClicksUseWorldCoordinates) {
    engine->view().setState(ViewTransformState{2.0, 0.0, 0.0});
    ASSERT_EQ(engine->startPlacement(makeTemplate("Lamp", 20, 20), 2), LayoutError::Ok);

    engine->click(Point2{10.0, 10.0}, 0);
    engine->click(Point2{50.0, 60.0}, 0);
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);

    ASSERT_EQ(engine->project().furniture.size(), 4u);
    EXPECT_DOUBLE_EQ(engine->project().furniture[2].position->x, 5.0);
    EXPECT_DOUBLE_EQ(engine->project().furniture[3].position->y, 30.0);
    EXPECT_EQ(engine->tasks().size(), 4u);

    // Back in Idle, clicking empty space only clears the selection.
    engine->click(Point2{900.0, 900.0}, 0);
    EXPECT_EQ(engine->project().furniture.size(), 4u);
}

TEST_F(InteractionTest, MeasureClicksProduceALine) {
    load({}, 2.0);
    engine->beginMeasure();
    engine->click(Point2{0.0, 0.0}, 0);
    EXPECT_EQ(engine->mode(), InteractionMode::Measuring);
    engine->click(Point2{300.0, 400.0}, 0);
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
    ASSERT_TRUE(engine->measureTool().lastLine().has_value());
    EXPECT_DOUBLE_EQ(engine->measureTool().lastLine()->lengthCm, 250.0);
    EXPECT_EQ(engine->measureTool().lastLine()->label, "2.50m");
    EXPECT_EQ(engine->history().size(), 1u);
}

TEST_F(InteractionTest, ClickSelectionWithModifiers) {
    engine->click(Point2{10.0, 10.0}, 0);
    EXPECT_EQ(engine->selection(), (Ids{"a"}));

    engine->click(Point2{210.0, 10.0}, mods(PointerModifier::Shift));
    EXPECT_EQ(engine->selection(), (Ids{"a", "b"}));

    engine->click(Point2{10.0, 10.0}, mods(PointerModifier::Ctrl));
    EXPECT_EQ(engine->selection(), (Ids{"b"}));

    // Alt is not a multi-select modifier.
    engine->click(Point2{10.0, 10.0}, mods(PointerModifier::Alt));
    EXPECT_EQ(engine->selection(), (Ids{"a"}));

    engine->click(Point2{600.0, 600.0}, mods(PointerModifier::Meta));
    EXPECT_EQ(engine->selection(), (Ids{"a"}));

    engine->click(Point2{600.0, 600.0}, 0);
    EXPECT_TRUE(engine->selection().empty());
}

TEST_F(InteractionTest, ClickOnStackMemberSelectsStack) {
    FurnitureItem s1 = makeItem("s1", "Chair", 40, 40, Point2{0.0, 0.0});
    FurnitureItem s2 = makeItem("s2", "Chair", 40, 40, Point2{0.0, 0.0});
    s1.stackId = "stack_1";
    s2.stackId = "stack_1";
    load({s1, s2, makeItem("c", "Desk", 100, 50, Point2{300.0, 300.0})});

    engine->click(Point2{5.0, 5.0}, 0);
    EXPECT_EQ(engine->selection(), (Ids{"s1", "s2"}));
    EXPECT_TRUE(engine->selectionInfo().isSingleStackSelected);
}

TEST_F(InteractionTest, DoubleClickTogglesZoomOrUnstacks) {
    engine->doubleClick(Point2{500.0, 500.0});
    EXPECT_DOUBLE_EQ(engine->view().scale(), 1.5);
    engine->doubleClick(Point2{500.0, 500.0});
    EXPECT_DOUBLE_EQ(engine->view().scale(), 1.0);

    FurnitureItem s1 = makeItem("s1", "Chair", 40, 40, Point2{0.0, 0.0});
    FurnitureItem s2 = makeItem("s2", "Chair", 40, 40, Point2{0.0, 0.0});
    s1.stackId = "stack_1";
    s2.stackId = "stack_1";
    load({s1, s2});

    engine->doubleClick(Point2{5.0, 5.0});
    EXPECT_DOUBLE_EQ(engine->view().scale(), 1.0);
    EXPECT_FALSE(item("s1").stackId.has_value());
    EXPECT_DOUBLE_EQ(item("s1").position->x, 30.0);
    EXPECT_EQ(engine->selection(), (Ids{"s1", "s2"}));
}

TEST_F(InteractionTest, WheelZoomsAroundPointer) {
    engine->wheel(Point2{100.0, 100.0}, -1.0);
    EXPECT_NEAR(engine->view().scale(), 1.1, 1e-12);
    // The world point under the pointer stays put.
    const Point2 w = engine->view().screenToWorld(Point2{100.0, 100.0});
    EXPECT_NEAR(w.x, 100.0, 1e-9);
    EXPECT_NEAR(w.y, 100.0, 1e-9);

    engine->wheel(Point2{100.0, 100.0}, 0.0);
    EXPECT_NEAR(engine->view().scale(), 1.1, 1e-12);

    engine->wheel(Point2{100.0, 100.0}, 3.0);
    EXPECT_NEAR(engine->view().scale(), 1.0, 1e-12);
}

TEST_F(InteractionTest, SpaceDragPansInsteadOfMovingItems) {
    engine->keyDown(InputKey::Space);
    engine->pointerDown(Point2{10.0, 10.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::Pan);
    engine->pointerMove(Point2{30.0, 25.0}, 0);
    engine->pointerUp(Point2{30.0, 25.0}, 0);
    engine->keyUp(InputKey::Space);

    EXPECT_DOUBLE_EQ(engine->view().state().offsetX, 20.0);
    EXPECT_DOUBLE_EQ(engine->view().state().offsetY, 15.0);
    EXPECT_DOUBLE_EQ(item("a").position->x, 0.0);
    EXPECT_EQ(engine->history().size(), 1u);
    EXPECT_EQ(releases, 1);

    engine->pointerDown(Point2{30.0, 25.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::PendingItem);
    engine->blur();
}

TEST_F(InteractionTest, EmptySpaceDragPans) {
    ASSERT_EQ(engine->setSelection({"a"}), LayoutError::Ok);
    engine->pointerDown(Point2{500.0, 500.0}, 0);
    EXPECT_EQ(engine->dragKind(), DragKind::Pan);
    engine->pointerMove(Point2{490.0, 500.0}, 0);
    engine->pointerUp(Point2{480.0, 495.0}, 0);
    EXPECT_DOUBLE_EQ(engine->view().state().offsetX, -20.0);
    EXPECT_DOUBLE_EQ(engine->view().state().offsetY, -5.0);

    // A pan is not a click on empty space.
    engine->click(Point2{480.0, 495.0}, 0);
    EXPECT_EQ(engine->selection(), (Ids{"a"}));
}

TEST_F(InteractionTest, DraggingAStackMemberMovesTheStack) {
    FurnitureItem s1 = makeItem("s1", "Chair", 40, 40, Point2{0.0, 0.0});
    FurnitureItem s2 = makeItem("s2", "Chair", 40, 40, Point2{0.0, 0.0});
    s1.stackId = "stack_1";
    s2.stackId = "stack_1";
    load({s1, s2});

    engine->pointerDown(Point2{5.0, 5.0}, 0);
    engine->pointerMove(Point2{55.0, 5.0}, 0);
    engine->pointerMove(Point2{105.0, 25.0}, 0);
    engine->pointerUp(Point2{105.0, 25.0}, 0);
    EXPECT_DOUBLE_EQ(item("s1").position->x, 100.0);
    EXPECT_DOUBLE_EQ(item("s2").position->x, 100.0);
    EXPECT_DOUBLE_EQ(item("s2").position->y, 20.0);
    EXPECT_EQ(engine->history().size(), 2u);
}

#include <gtest/gtest.h>
#include "tests/layout_test_common.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace layout;
using layout_test::LayoutEngineTest;
using layout_test::fixedClockConfig;
using layout_test::makeItem;
using layout_test::makeProject;
using layout_test::makeTemplate;

namespace {

std::size_t placedCount(const Project& p) {
    std::size_t n = 0;
    for (const auto& item : p.furniture) {
        if (item.isPlaced()) ++n;
    }
    return n;
}

} // namespace

TEST(LayoutEngineConstructionTest, InvalidInitialProjectThrows) {
    Project bad = makeProject(1.0);
    bad.furniture.push_back(makeItem("x", "Desk", 10, 10));
    bad.furniture.push_back(makeItem("x", "Desk", 10, 10));
    EXPECT_THROW({ LayoutEngine rejected(bad, fixedClockConfig()); }, std::invalid_argument);

    LayoutEngine engine(makeProject(std::nullopt), fixedClockConfig());
    EXPECT_EQ(engine.mode(), InteractionMode::Idle);
    EXPECT_EQ(engine.history().size(), 1u);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_FALSE(engine.canRedo());
    EXPECT_TRUE(engine.tasks().empty());
}

TEST(LayoutEngineConstructionTest, InitialTasksAreDerived) {
    Project p = makeProject(1.0);
    p.furniture.push_back(makeItem("a", "Desk", 10, 10, Point2{0.0, 0.0}));
    p.furniture.push_back(makeItem("u", "Desk", 10, 10));
    LayoutEngine engine(p, fixedClockConfig());
    ASSERT_EQ(engine.tasks().size(), 1u);
    EXPECT_EQ(engine.tasks()[0].id, "task_a");
}

TEST_F(LayoutEngineTest, PipelineRunsTasksBeforeCallbacks) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0})});

    std::vector<std::string> events;
    engine->setProjectChangeCallback([&](const Project& p) {
        events.push_back("project");
        // Tasks and selection are already consistent with the new project.
        EXPECT_EQ(engine->tasks().size(), placedCount(p));
        for (const auto& id : engine->selection()) {
            EXPECT_NE(findItem(p, id), nullptr);
        }
        EXPECT_EQ(&p, &engine->project());
    });
    engine->setTasksCallback([&](const std::vector<InstallationTask>& tasks) {
        events.push_back("tasks");
        EXPECT_EQ(&tasks, &engine->tasks());
    });

    ASSERT_EQ(engine->setSelection({"a"}), LayoutError::Ok);
    ASSERT_EQ(engine->deleteSelected(), LayoutError::Ok);
    EXPECT_EQ(events, (std::vector<std::string>{"project", "tasks"}));

    ASSERT_EQ(engine->undo(), LayoutError::Ok);
    ASSERT_EQ(engine->redo(), LayoutError::Ok);
    EXPECT_EQ(events.size(), 6u);
}

TEST_F(LayoutEngineTest, FailedOperationsDoNotNotify) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0})});
    int projectCalls = 0;
    int taskCalls = 0;
    engine->setProjectChangeCallback([&](const Project&) { ++projectCalls; });
    engine->setTasksCallback([&](const std::vector<InstallationTask>&) { ++taskCalls; });

    EXPECT_EQ(engine->undo(), LayoutError::HistoryBoundary);
    EXPECT_EQ(engine->redo(), LayoutError::HistoryBoundary);
    EXPECT_EQ(engine->rotateItem("ghost", 10.0), LayoutError::UnknownIdentity);
    EXPECT_EQ(engine->placeAt(Point2{0.0, 0.0}), LayoutError::PlacementSessionInactive);
    EXPECT_EQ(engine->arrangeOnLargest(), LayoutError::InvalidOperation);
    EXPECT_EQ(projectCalls, 0);
    EXPECT_EQ(taskCalls, 0);

    ASSERT_EQ(engine->rotateItem("a", 10.0), LayoutError::Ok);
    EXPECT_EQ(projectCalls, 1);
    EXPECT_EQ(taskCalls, 1);

    // Live updates notify as well.
    ASSERT_EQ(engine->moveItemLive("a", Point2{5.0, 5.0}), LayoutError::Ok);
    EXPECT_EQ(projectCalls, 2);
}

TEST_F(LayoutEngineTest, LastErrorTracksMostRecentOperation) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0})});
    EXPECT_EQ(engine->lastError(), LayoutError::Ok);

    EXPECT_EQ(engine->undo(), LayoutError::HistoryBoundary);
    EXPECT_EQ(engine->lastError(), LayoutError::HistoryBoundary);

    EXPECT_EQ(engine->selectItem("ghost", false), LayoutError::UnknownIdentity);
    EXPECT_EQ(engine->lastError(), LayoutError::UnknownIdentity);

    ASSERT_EQ(engine->selectItem("a", false), LayoutError::Ok);
    EXPECT_EQ(engine->lastError(), LayoutError::Ok);
    EXPECT_STREQ(layoutErrorName(LayoutError::HistoryBoundary), "HistoryBoundary");
}

TEST_F(LayoutEngineTest, LoadProjectReplacesHistoryAndClosesTools) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0})});
    ASSERT_EQ(engine->rotateItem("a", 10.0), LayoutError::Ok);
    ASSERT_EQ(engine->setSelection({"a"}), LayoutError::Ok);
    ASSERT_EQ(engine->startPlacement(makeTemplate("Lamp", 20, 20), 2), LayoutError::Ok);

    Project next = makeProject(2.0);
    next.furniture.push_back(makeItem("z", "Sofa", 200, 90, Point2{50.0, 50.0}));
    engine->loadProject(next);

    EXPECT_EQ(engine->history().size(), 1u);
    EXPECT_FALSE(engine->canUndo());
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
    EXPECT_TRUE(engine->selection().empty());
    ASSERT_EQ(engine->tasks().size(), 1u);
    EXPECT_EQ(engine->tasks()[0].id, "task_z");
}

TEST_F(LayoutEngineTest, RejectedLoadKeepsState) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0})});
    ASSERT_EQ(engine->rotateItem("a", 10.0), LayoutError::Ok);
    ASSERT_EQ(engine->setSelection({"a"}), LayoutError::Ok);
    const std::uint64_t before = engine->digest();

    Project bad = makeProject(-1.0);
    EXPECT_THROW(engine->loadProject(bad), std::invalid_argument);

    EXPECT_EQ(engine->digest(), before);
    EXPECT_EQ(engine->history().size(), 2u);
    EXPECT_EQ(engine->selection(), (std::vector<std::string>{"a"}));
}

TEST_F(LayoutEngineTest, UndoPrunesSelection) {
    load({});
    ASSERT_EQ(engine->startPlacement(makeTemplate("Lamp", 20, 20), 1), LayoutError::Ok);
    std::string id;
    ASSERT_EQ(engine->placeAt(Point2{0.0, 0.0}, &id), LayoutError::Ok);
    ASSERT_EQ(engine->setSelection({id}), LayoutError::Ok);

    ASSERT_EQ(engine->undo(), LayoutError::Ok);
    EXPECT_TRUE(engine->selection().empty());
    EXPECT_TRUE(engine->tasks().empty());

    ASSERT_EQ(engine->redo(), LayoutError::Ok);
    EXPECT_TRUE(engine->selection().empty());
    EXPECT_EQ(engine->tasks().size(), 1u);
}

TEST_F(LayoutEngineTest, CancelAllResetsInteractionState) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0})});
    ASSERT_EQ(engine->setSelection({"a"}), LayoutError::Ok);
    engine->setMarqueeMode(true);

    engine->cancelAll();
    EXPECT_EQ(engine->mode(), InteractionMode::Idle);
    EXPECT_TRUE(engine->selection().empty());
    EXPECT_EQ(engine->history().size(), 1u);
}

TEST_F(LayoutEngineTest, SummariesFollowTheProject) {
    load({makeItem("a", "Desk", 100, 50, Point2{0.0, 0.0}),
          makeItem("b", "Desk", 100, 50),
          makeItem("c", "Chair", 40, 40)});

    const auto unplaced = engine->unplacedItems();
    ASSERT_EQ(unplaced.size(), 2u);
    EXPECT_EQ(unplaced[0].name, "Chair");
    EXPECT_EQ(unplaced[1].quantity, 1u);

    const auto placed = engine->placedItems();
    ASSERT_EQ(placed.size(), 1u);
    EXPECT_EQ(placed[0].placed, 1u);
    EXPECT_EQ(placed[0].unplaced, 1u);
}

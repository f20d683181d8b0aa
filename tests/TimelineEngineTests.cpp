#include <gtest/gtest.h>

#include <vector>

#include "key_adhesion/timeline_engine.hpp"

using namespace kb::adh;

TEST(TimelineEngine, QuantizesNowDownToTick)
{
    TimelineEngine engine;
    EXPECT_NEAR(engine.quantizeNow(10.0), 10.0, 1e-9);
    EXPECT_NEAR(engine.quantizeNow(10.049), 10.0, 1e-9);
    EXPECT_NEAR(engine.quantizeNow(10.051), 10.05, 1e-9);
}

TEST(TimelineEngine, EmptyInputHasNoRows)
{
    TimelineEngine engine;
    const auto& grid = engine.render({}, 10.0);
    EXPECT_TRUE(grid.rows.empty());
    EXPECT_NEAR(grid.view_start, 5.0, 1e-9);
    EXPECT_NEAR(grid.view_end, 10.0, 1e-9);
}

TEST(TimelineEngine, HeldKeyIsClippedToViewAndEndsInBody)
{
    TimelineEngine engine;
    const auto& grid = engine.render({KeyEvent::press("a", 7.025)}, 10.0);

    ASSERT_EQ(grid.rows.size(), 1u);
    const auto& row = grid.rows[0];
    EXPECT_EQ(row.key, "a");
    EXPECT_TRUE(row.held);
    EXPECT_NEAR(row.held_seconds, 2.975, 1e-9);
    ASSERT_EQ(row.cells.size(), 100u);

    EXPECT_EQ(row.cells[39].shape, CellShape::Empty);
    EXPECT_EQ(row.cells[40].shape, CellShape::Head);
    EXPECT_EQ(row.cells[40].level, 4);
    EXPECT_EQ(row.cells[41].shape, CellShape::Body);
    EXPECT_EQ(row.cells[99].shape, CellShape::Body);
    EXPECT_EQ(row.cells[99].level, 8);
}

TEST(TimelineEngine, HeldDurationFollowsQuantizedViewEnd)
{
    TimelineEngine engine;
    const auto first = engine.render({KeyEvent::press("a", 7.0)}, 10.01);
    ASSERT_EQ(first.rows.size(), 1u);
    EXPECT_NEAR(first.rows[0].held_seconds, 3.0, 1e-9);

    const auto& second = engine.render({KeyEvent::press("a", 7.0)}, 10.04);
    EXPECT_TRUE(engine.lastRenderReused());
    EXPECT_NEAR(second.rows[0].held_seconds, 3.0, 1e-9);
}

TEST(TimelineEngine, PressInsideLastSliceIsHead)
{
    TimelineEngine engine;
    const auto& grid = engine.render({KeyEvent::press("a", 9.97)}, 10.0);

    ASSERT_EQ(grid.rows.size(), 1u);
    const auto& cells = grid.rows[0].cells;
    EXPECT_TRUE(grid.rows[0].held);
    EXPECT_EQ(cells[98].shape, CellShape::Empty);
    EXPECT_EQ(cells[99].shape, CellShape::Head);
    EXPECT_EQ(cells[99].level, 5);
}

TEST(TimelineEngine, KeyReleasedAfterViewEndKeepsRow)
{
    TimelineEngine engine;
    const auto& grid = engine.render({
        KeyEvent::press("a", 1.0),
        KeyEvent::release("a", 10.02),
    }, 10.04);

    ASSERT_EQ(grid.rows.size(), 1u);
    EXPECT_EQ(grid.rows[0].key, "a");
    EXPECT_TRUE(grid.rows[0].held);
    EXPECT_NEAR(grid.rows[0].held_seconds, 9.0, 1e-9);
    for (const auto& cell : grid.rows[0].cells) {
        EXPECT_EQ(cell.shape, CellShape::Body);
    }
}

TEST(TimelineEngine, PressAfterViewEndIsNotYetShown)
{
    TimelineEngine engine;
    const auto& grid = engine.render({KeyEvent::press("a", 10.02)}, 10.04);
    EXPECT_TRUE(grid.rows.empty());
}

TEST(TimelineEngine, KeyHeldSinceBeforeViewFillsEveryCell)
{
    TimelineEngine engine;
    const auto& grid = engine.render({KeyEvent::press("shift", 1.0)}, 10.0);

    ASSERT_EQ(grid.rows.size(), 1u);
    for (const auto& cell : grid.rows[0].cells) {
        EXPECT_EQ(cell.shape, CellShape::Body);
    }
}

TEST(TimelineEngine, ReleasedKeyShapes)
{
    TimelineEngine engine;
    const auto& grid = engine.render({
        KeyEvent::press("a", 5.5),
        KeyEvent::release("a", 6.025),
        KeyEvent::press("a", 8.01),
        KeyEvent::release("a", 8.03),
    }, 10.0);

    ASSERT_EQ(grid.rows.size(), 1u);
    const auto& cells = grid.rows[0].cells;
    EXPECT_FALSE(grid.rows[0].held);
    EXPECT_EQ(cells[9].shape, CellShape::Empty);
    EXPECT_EQ(cells[10].shape, CellShape::Body);
    EXPECT_EQ(cells[19].shape, CellShape::Body);
    EXPECT_EQ(cells[20].shape, CellShape::Tail);
    EXPECT_EQ(cells[20].level, 4);
    EXPECT_EQ(cells[21].shape, CellShape::Empty);
    EXPECT_EQ(cells[60].shape, CellShape::Island);
    EXPECT_EQ(cells[60].level, 3);
}

TEST(TimelineEngine, ShortTapShowsAtLeastOneLevel)
{
    const std::vector<TimeInterval> intervals = {{0.0101, 0.0102}};
    const auto cell = TimelineEngine::classifySlice(intervals, 0.0, 0.05, 8);
    EXPECT_EQ(cell.shape, CellShape::Island);
    EXPECT_EQ(cell.level, 1);
}

TEST(TimelineEngine, KeyIntervalsPairPressesLikeTheAnalyzer)
{
    const std::vector<KeyEvent> events = {
        KeyEvent::press("a", 1.0),
        KeyEvent::press("a", 2.0),
        KeyEvent::release("a", 3.0),
        KeyEvent::release("a", 3.5),
        KeyEvent::press("b", 4.0),
    };
    const auto intervals = TimelineEngine::keyIntervals(events, "a", 0.0, 10.0);
    ASSERT_EQ(intervals.size(), 1u);
    EXPECT_DOUBLE_EQ(intervals[0].start, 2.0);
    EXPECT_DOUBLE_EQ(intervals[0].end, 3.0);
}

TEST(TimelineEngine, RowsFollowCanonicalOrder)
{
    TimelineEngine engine;
    const auto& grid = engine.render({
        KeyEvent::press("w", 9.0),
        KeyEvent::release("w", 9.1),
        KeyEvent::press("q", 9.2),
        KeyEvent::release("q", 9.3),
    }, 10.0);
    ASSERT_EQ(grid.rows.size(), 2u);
    EXPECT_EQ(grid.rows[0].key, "q");
    EXPECT_EQ(grid.rows[1].key, "w");
}

TEST(TimelineEngine, KeysOutsideViewAreNotRows)
{
    TimelineEngine engine;
    const auto& grid = engine.render({
        KeyEvent::press("a", 1.0),
        KeyEvent::release("a", 1.1),
        KeyEvent::press("b", 9.0),
        KeyEvent::release("b", 9.1),
    }, 10.0);
    ASSERT_EQ(grid.rows.size(), 1u);
    EXPECT_EQ(grid.rows[0].key, "b");
}

TEST(TimelineEngine, MaxRowsAndOffsetSelectVisibleRows)
{
    TimelineConfig config;
    config.max_rows = 1;
    TimelineEngine engine(config);
    engine.setRowOffset(1);

    const auto& grid = engine.render({
        KeyEvent::press("q", 9.0),
        KeyEvent::release("q", 9.1),
        KeyEvent::press("w", 9.2),
        KeyEvent::release("w", 9.3),
    }, 10.0);
    ASSERT_EQ(grid.rows.size(), 1u);
    EXPECT_EQ(grid.rows[0].key, "w");
    EXPECT_EQ(grid.hidden_rows, 1u);
}

TEST(TimelineEngine, UnchangedInputReusesCachedGrid)
{
    TimelineEngine engine;
    const std::vector<KeyEvent> events = {KeyEvent::press("a", 9.0), KeyEvent::release("a", 9.1)};

    engine.render(events, 10.0);
    EXPECT_FALSE(engine.lastRenderReused());
    const auto signature = engine.signature();

    engine.render(events, 10.02);
    EXPECT_TRUE(engine.lastRenderReused());
    EXPECT_EQ(engine.signature(), signature);
    EXPECT_EQ(engine.recomputeCount(), 1u);

    engine.render(events, 10.1);
    EXPECT_FALSE(engine.lastRenderReused());
    EXPECT_EQ(engine.recomputeCount(), 2u);
}

TEST(TimelineEngine, NewEventInvalidatesCache)
{
    TimelineEngine engine;
    std::vector<KeyEvent> events = {KeyEvent::press("a", 9.0)};
    engine.render(events, 10.0);

    events.push_back(KeyEvent::release("a", 9.5));
    engine.render(events, 10.0);
    EXPECT_FALSE(engine.lastRenderReused());
    EXPECT_FALSE(engine.grid().rows[0].held);
}

TEST(TimelineEngine, ClearResetsCache)
{
    TimelineEngine engine;
    engine.render({KeyEvent::press("a", 9.0)}, 10.0);
    engine.clear();

    EXPECT_TRUE(engine.grid().rows.empty());
    EXPECT_EQ(engine.recomputeCount(), 0u);
    EXPECT_EQ(engine.signature(), 0u);

    engine.render({KeyEvent::press("a", 9.0)}, 10.0);
    EXPECT_FALSE(engine.lastRenderReused());
}

TEST(TimelineEngine, LastSliceEndsExactlyAtViewEnd)
{
    const std::vector<TimeInterval> intervals = {{0.0, 1.0}};
    const auto cells = TimelineEngine::buildCells(intervals, 0.0, 1.0, 3, 8);
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[2].shape, CellShape::Body);
    EXPECT_EQ(cells[2].level, 8);
}

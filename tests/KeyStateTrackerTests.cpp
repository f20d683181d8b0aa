#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "key_adhesion/key_state_tracker.hpp"

using namespace kb::adh;

namespace {

struct Recorded {
    KeyEvent event;
    ActiveKeyState active;
};

std::shared_ptr<CallbackListener> recorderInto(std::vector<Recorded>& out)
{
    return std::make_shared<CallbackListener>([&out](const KeyEvent& ev, const ActiveKeyState& active) {
        out.push_back({ev, active});
    });
}

}  // namespace

TEST(KeyStateTracker, PressAddsActiveKey)
{
    KeyStateTracker tracker;
    EXPECT_TRUE(tracker.process(KeyEvent::press("a", 1.0)));
    EXPECT_TRUE(tracker.isActive("a"));
    EXPECT_TRUE(tracker.isActive("A"));
    EXPECT_EQ(tracker.activeCount(), 1u);
    EXPECT_DOUBLE_EQ(tracker.activeKeys().at("a"), 1.0);
}

TEST(KeyStateTracker, RepeatedPressKeepsFirstTimestampAndIsNotForwarded)
{
    KeyStateTracker tracker;
    std::vector<Recorded> seen;
    tracker.addListener(recorderInto(seen));

    tracker.process(KeyEvent::press("a", 1.0));
    EXPECT_FALSE(tracker.process(KeyEvent::press("a", 1.5)));

    EXPECT_DOUBLE_EQ(tracker.activeKeys().at("a"), 1.0);
    EXPECT_EQ(tracker.suppressedRepeats(), 1u);
    EXPECT_EQ(seen.size(), 1u);
}

TEST(KeyStateTracker, ReleaseListenersSeeKeyStillHeld)
{
    KeyStateTracker tracker;
    std::vector<Recorded> seen;
    tracker.addListener(recorderInto(seen));

    tracker.process(KeyEvent::press("a", 1.0));
    tracker.process(KeyEvent::release("a", 1.2));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[1].event.isRelease());
    EXPECT_EQ(seen[1].active.count("a"), 1u);
    EXPECT_FALSE(tracker.isActive("a"));
    EXPECT_EQ(tracker.activeCount(), 0u);
}

TEST(KeyStateTracker, StrayReleaseLeavesStateUnchanged)
{
    KeyStateTracker tracker;
    std::vector<Recorded> seen;
    tracker.addListener(recorderInto(seen));

    tracker.process(KeyEvent::press("b", 1.0));
    EXPECT_TRUE(tracker.process(KeyEvent::release("a", 1.1)));

    EXPECT_EQ(tracker.activeCount(), 1u);
    EXPECT_TRUE(tracker.isActive("b"));
    EXPECT_EQ(tracker.strayReleases(), 1u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[1].active.empty());
}

TEST(KeyStateTracker, ActiveCountNeverExceedsDistinctKeys)
{
    KeyStateTracker tracker;
    tracker.process(KeyEvent::press("a", 0.0));
    tracker.process(KeyEvent::press("b", 0.1));
    tracker.process(KeyEvent::press("a", 0.2));
    tracker.process(KeyEvent::release("c", 0.3));
    EXPECT_EQ(tracker.activeCount(), 2u);

    tracker.process(KeyEvent::release("a", 0.4));
    tracker.process(KeyEvent::release("a", 0.5));
    tracker.process(KeyEvent::release("b", 0.6));
    EXPECT_EQ(tracker.activeCount(), 0u);
}

TEST(KeyStateTracker, ListenerSnapshotIsACopy)
{
    KeyStateTracker tracker;
    std::vector<Recorded> seen;
    tracker.addListener(recorderInto(seen));

    tracker.process(KeyEvent::press("a", 0.0));
    tracker.process(KeyEvent::press("b", 0.1));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].active.size(), 1u);
    EXPECT_EQ(seen[1].active.size(), 2u);
}

TEST(KeyStateTracker, FailingListenerDoesNotStopOthers)
{
    KeyStateTracker tracker;
    std::vector<Recorded> seen;
    tracker.addListener(std::make_shared<CallbackListener>([](const KeyEvent&, const ActiveKeyState&) {
        throw std::runtime_error("boom");
    }));
    tracker.addListener(recorderInto(seen));

    tracker.process(KeyEvent::press("a", 0.0));

    EXPECT_EQ(tracker.listenerFailures(), 1u);
    EXPECT_EQ(seen.size(), 1u);
    EXPECT_TRUE(tracker.isActive("a"));
}

TEST(KeyStateTracker, AddAndRemoveListenerAreIdempotent)
{
    KeyStateTracker tracker;
    std::vector<Recorded> seen;
    auto listener = recorderInto(seen);

    EXPECT_TRUE(tracker.addListener(listener));
    EXPECT_FALSE(tracker.addListener(listener));
    EXPECT_EQ(tracker.listenerCount(), 1u);

    EXPECT_TRUE(tracker.removeListener(listener));
    EXPECT_FALSE(tracker.removeListener(listener));

    tracker.process(KeyEvent::press("a", 0.0));
    EXPECT_TRUE(seen.empty());
}

TEST(KeyStateTracker, ClearForgetsHeldKeys)
{
    KeyStateTracker tracker;
    tracker.process(KeyEvent::press("a", 0.0));
    tracker.clear();
    EXPECT_EQ(tracker.activeCount(), 0u);
    EXPECT_TRUE(tracker.process(KeyEvent::press("a", 1.0)));
}

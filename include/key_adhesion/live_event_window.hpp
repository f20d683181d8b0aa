#pragma once

#include <cstddef>
#include <deque>
#include <vector>

#include "key_adhesion/key_state_tracker.hpp"

namespace kb::adh {

// Rolling buffer of accepted events, fed as a tracker listener. Events older
// than the retention window are pruned, except the press of a key that is
// still held so its open interval stays reconstructible.
class LiveEventWindow : public KeyEventListener {
public:
    explicit LiveEventWindow(double retention_seconds = 10.0,
                             std::size_t max_events = 4096u);

    void onKeyEvent(const KeyEvent& event, const ActiveKeyState& active_keys) override;

    void setRetention(double retention_seconds);
    [[nodiscard]] double retention() const noexcept { return retention_seconds_; }

    // Drops stale events relative to `now` without waiting for the next event.
    void prune(double now);

    [[nodiscard]] std::vector<KeyEvent> snapshot() const;
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }

    void clear();

private:
    bool isHeldPress(const KeyEvent& event) const;

    double retention_seconds_;
    std::size_t max_events_;
    std::deque<KeyEvent> events_;
    ActiveKeyState held_;
};

}  // namespace kb::adh

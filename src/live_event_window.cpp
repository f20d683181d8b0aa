#include "key_adhesion/live_event_window.hpp"

#include <algorithm>

namespace kb::adh {

LiveEventWindow::LiveEventWindow(double retention_seconds, std::size_t max_events)
    : retention_seconds_(std::max(0.0, retention_seconds)),
      max_events_(std::max<std::size_t>(1u, max_events)) {}

void LiveEventWindow::onKeyEvent(const KeyEvent& event, const ActiveKeyState& /*active_keys*/) {
    if (event.isPress()) {
        held_[event.key()] = event.timestamp();
    } else {
        held_.erase(event.key());
    }
    events_.push_back(event);
    prune(event.timestamp());
    while (events_.size() > max_events_) {
        events_.pop_front();
    }
}

void LiveEventWindow::setRetention(double retention_seconds) {
    retention_seconds_ = std::max(0.0, retention_seconds);
}

void LiveEventWindow::prune(double now) {
    const double cutoff = now - retention_seconds_;
    events_.erase(std::remove_if(events_.begin(), events_.end(),
                                 [&](const KeyEvent& ev) {
                                     return ev.timestamp() < cutoff && !isHeldPress(ev);
                                 }),
                  events_.end());
}

std::vector<KeyEvent> LiveEventWindow::snapshot() const {
    return std::vector<KeyEvent>(events_.begin(), events_.end());
}

void LiveEventWindow::clear() {
    events_.clear();
    held_.clear();
}

bool LiveEventWindow::isHeldPress(const KeyEvent& event) const {
    if (!event.isPress()) {
        return false;
    }
    auto it = held_.find(event.key());
    return it != held_.end() && it->second == event.timestamp();
}

}  // namespace kb::adh

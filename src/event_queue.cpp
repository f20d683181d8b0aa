#include "key_adhesion/event_queue.hpp"

#include <algorithm>
#include <iterator>

namespace kb::adh {

BoundedEventQueue::BoundedEventQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1u, capacity)) {}

bool BoundedEventQueue::tryPush(KeyEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        dropped_.fetch_add(1);
        return false;
    }
    events_.push_back(std::move(event));
    return true;
}

std::size_t BoundedEventQueue::drainInto(std::vector<KeyEvent>& out) {
    std::deque<KeyEvent> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(events_);
    }
    out.insert(out.end(), std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
    return taken.size();
}

std::size_t BoundedEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace kb::adh

#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "key_adhesion/types.hpp"

namespace kb::adh {

// Bounded multi-producer/single-consumer hand-off between capture threads and
// the consumer tick. A full queue drops the newest event instead of blocking.
class BoundedEventQueue {
public:
    explicit BoundedEventQueue(std::size_t capacity = 1000u);

    bool tryPush(KeyEvent event);

    // Moves every queued event, in enqueue order, to the back of `out`.
    std::size_t drainInto(std::vector<KeyEvent>& out);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t droppedCount() const noexcept { return dropped_.load(); }

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::deque<KeyEvent> events_;
    std::atomic<std::size_t> dropped_{0};
};

using BoundedEventQueuePtr = std::shared_ptr<BoundedEventQueue>;

}  // namespace kb::adh

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "key_adhesion/types.hpp"

namespace kb::adh {

class KeyEventListener {
public:
    virtual ~KeyEventListener() = default;

    // `active_keys` is a copy taken for this notification. For a release of a
    // held key it still contains that key; for a stray release it is empty.
    virtual void onKeyEvent(const KeyEvent& event, const ActiveKeyState& active_keys) = 0;
};

using KeyEventListenerPtr = std::shared_ptr<KeyEventListener>;

class CallbackListener : public KeyEventListener {
public:
    using Callback = std::function<void(const KeyEvent&, const ActiveKeyState&)>;

    explicit CallbackListener(Callback callback) : callback_(std::move(callback)) {}

    void onKeyEvent(const KeyEvent& event, const ActiveKeyState& active_keys) override {
        if (callback_) {
            callback_(event, active_keys);
        }
    }

private:
    Callback callback_;
};

class KeyStateTracker {
public:
    bool addListener(KeyEventListenerPtr listener);
    bool removeListener(const KeyEventListenerPtr& listener);
    [[nodiscard]] std::size_t listenerCount() const noexcept { return listeners_.size(); }

    // Returns false only for a press of a key that is already held.
    bool process(const KeyEvent& event);

    [[nodiscard]] ActiveKeyState activeKeys() const { return active_keys_; }
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_keys_.size(); }
    [[nodiscard]] bool isActive(const std::string& key) const;

    [[nodiscard]] std::size_t suppressedRepeats() const noexcept { return suppressed_repeats_; }
    [[nodiscard]] std::size_t strayReleases() const noexcept { return stray_releases_; }
    [[nodiscard]] std::size_t listenerFailures() const noexcept { return listener_failures_; }

    void clear();

private:
    void notifyListeners(const KeyEvent& event, const ActiveKeyState& snapshot);

    ActiveKeyState active_keys_;
    std::vector<KeyEventListenerPtr> listeners_;

    std::size_t suppressed_repeats_{0};
    std::size_t stray_releases_{0};
    std::size_t listener_failures_{0};
};

}  // namespace kb::adh

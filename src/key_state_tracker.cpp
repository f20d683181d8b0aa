#include "key_adhesion/key_state_tracker.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

#include "key_adhesion/key_names.hpp"

namespace kb::adh {

bool KeyStateTracker::addListener(KeyEventListenerPtr listener) {
    if (!listener) {
        return false;
    }
    if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
        return false;
    }
    listeners_.push_back(std::move(listener));
    return true;
}

bool KeyStateTracker::removeListener(const KeyEventListenerPtr& listener) {
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

bool KeyStateTracker::isActive(const std::string& key) const {
    return active_keys_.count(normalizeKeyName(key)) != 0;
}

bool KeyStateTracker::process(const KeyEvent& event) {
    const auto& key = event.key();

    if (event.isPress()) {
        if (active_keys_.count(key) != 0) {
            ++suppressed_repeats_;
            return false;
        }
        active_keys_.emplace(key, event.timestamp());
        const ActiveKeyState snapshot = active_keys_;
        notifyListeners(event, snapshot);
        return true;
    }

    auto it = active_keys_.find(key);
    if (it == active_keys_.end()) {
        ++stray_releases_;
        notifyListeners(event, ActiveKeyState{});
        return true;
    }

    // Listeners see the key still held so they can read its press time.
    const ActiveKeyState snapshot = active_keys_;
    notifyListeners(event, snapshot);
    active_keys_.erase(key);
    return true;
}

void KeyStateTracker::clear() {
    active_keys_.clear();
}

void KeyStateTracker::notifyListeners(const KeyEvent& event, const ActiveKeyState& snapshot) {
    // Iterate a copy so a listener may unregister itself while being notified.
    const auto listeners = listeners_;
    for (const auto& listener : listeners) {
        try {
            listener->onKeyEvent(event, snapshot);
        } catch (const std::exception& ex) {
            ++listener_failures_;
            std::cerr << "[KeyStateTracker] Listener failed on " << eventTypeName(event.type())
                      << " '" << event.key() << "': " << ex.what() << '\n';
        } catch (...) {
            ++listener_failures_;
            std::cerr << "[KeyStateTracker] Listener failed on " << eventTypeName(event.type())
                      << " '" << event.key() << "' with a non-standard exception" << '\n';
        }
    }
}

}  // namespace kb::adh

#pragma once

#include <cstddef>

#include "key_adhesion/types.hpp"

namespace kb::adh {

// Collects the raw drained events between start() and stop().
class SessionRecorder {
public:
    void start(double now);
    void stop(double now);
    void reset();

    void append(const KeyEvent& event);

    [[nodiscard]] bool isRecording() const noexcept { return recording_; }
    [[nodiscard]] bool hasSession() const noexcept { return has_session_; }
    [[nodiscard]] const KeySession& session() const noexcept { return session_; }
    [[nodiscard]] std::size_t eventCount() const noexcept { return session_.events.size(); }

private:
    KeySession session_;
    bool recording_{false};
    bool has_session_{false};
};

}  // namespace kb::adh

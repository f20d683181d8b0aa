#include "key_adhesion/session_recorder.hpp"

namespace kb::adh {

void SessionRecorder::start(double now) {
    session_ = KeySession{};
    session_.start_time = now;
    session_.end_time = now;
    recording_ = true;
    has_session_ = true;
}

void SessionRecorder::stop(double now) {
    if (!recording_) {
        return;
    }
    session_.end_time = now;
    recording_ = false;
}

void SessionRecorder::reset() {
    session_ = KeySession{};
    recording_ = false;
    has_session_ = false;
}

void SessionRecorder::append(const KeyEvent& event) {
    if (!recording_) {
        return;
    }
    session_.events.push_back(event);
    session_.end_time = event.timestamp();
}

}  // namespace kb::adh

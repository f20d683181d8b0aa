#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "key_adhesion/config_loader.hpp"
#include "key_adhesion/event_queue.hpp"
#include "key_adhesion/key_state_tracker.hpp"
#include "key_adhesion/live_event_window.hpp"
#include "key_adhesion/session_recorder.hpp"
#include "key_adhesion/timeline_engine.hpp"
#include "key_adhesion/timing_analyzer.hpp"

namespace kb::adh {

// Seconds on the clock evdev timestamps are taken from (CLOCK_MONOTONIC).
[[nodiscard]] double monotonicNowSeconds();

class TickSchedule {
public:
    explicit TickSchedule(double interval_seconds = 1.0) : interval_(interval_seconds) {}

    void setInterval(double interval_seconds) { interval_ = interval_seconds; }
    [[nodiscard]] double interval() const noexcept { return interval_; }

    // True on the first call and whenever `interval` has elapsed since the
    // last due tick. Missed ticks are skipped rather than replayed.
    bool due(double now);
    void reset() { armed_ = false; }

private:
    double interval_;
    double next_{0.0};
    bool armed_{false};
};

struct MonitorStatus {
    std::size_t dropped_events{0};
    std::size_t suppressed_repeats{0};
    std::size_t stray_releases{0};
    std::size_t listener_failures{0};
    std::size_t active_keys{0};
    std::size_t window_events{0};
};

struct TickResult {
    std::size_t drained{0};
    bool analyzed{false};
    bool rendered{false};
};

// The consumer side of the pipeline. Every method runs on the consumer
// context; callers serialize access.
class AdhesionMonitor {
public:
    AdhesionMonitor(RuntimeConfig config, BoundedEventQueuePtr queue);

    void applyConfig(const RuntimeConfig& config);
    [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }

    // Drains the queue into the tracker, then runs whichever of the timeline
    // and analysis ticks are due.
    TickResult tick(double now);

    std::size_t drain(double now);
    const AnalysisReport& runAnalysis(double now);
    const TimelineGrid& renderTimeline(double now);

    [[nodiscard]] bool hasReport() const noexcept { return has_report_; }
    [[nodiscard]] const AnalysisReport& lastReport() const noexcept { return report_; }
    [[nodiscard]] const TimelineGrid& lastTimeline() const noexcept { return timeline_.grid(); }

    bool addListener(KeyEventListenerPtr listener) { return tracker_.addListener(std::move(listener)); }
    bool removeListener(const KeyEventListenerPtr& listener) { return tracker_.removeListener(listener); }

    [[nodiscard]] const KeyStateTracker& tracker() const noexcept { return tracker_; }
    [[nodiscard]] const TimingAnalyzer& analyzer() const noexcept { return analyzer_; }
    [[nodiscard]] TimelineEngine& timeline() noexcept { return timeline_; }
    [[nodiscard]] SessionRecorder& recorder() noexcept { return recorder_; }
    [[nodiscard]] const SessionRecorder& recorder() const noexcept { return recorder_; }
    [[nodiscard]] std::vector<KeyEvent> windowSnapshot() const { return window_->snapshot(); }

    [[nodiscard]] MonitorStatus status() const;

    // Forgets held keys, the live window, cached output and any recording.
    void clear();

private:
    RuntimeConfig config_;
    BoundedEventQueuePtr queue_;

    KeyStateTracker tracker_;
    std::shared_ptr<LiveEventWindow> window_;
    TimingAnalyzer analyzer_;
    TimelineEngine timeline_;
    SessionRecorder recorder_;

    TickSchedule timeline_tick_;
    TickSchedule analysis_tick_;

    AnalysisReport report_;
    bool has_report_{false};

    std::vector<KeyEvent> drain_buffer_;
};

}  // namespace kb::adh

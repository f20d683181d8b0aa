#include "key_adhesion/adhesion_monitor.hpp"

#include <algorithm>
#include <chrono>

namespace kb::adh {

double monotonicNowSeconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

bool TickSchedule::due(double now) {
    if (!armed_ || now >= next_) {
        armed_ = true;
        next_ = now + interval_;
        return true;
    }
    return false;
}

AdhesionMonitor::AdhesionMonitor(RuntimeConfig config, BoundedEventQueuePtr queue)
    : config_(std::move(config)),
      queue_(std::move(queue)),
      window_(std::make_shared<LiveEventWindow>()) {
    if (!queue_) {
        queue_ = std::make_shared<BoundedEventQueue>(config_.capture.queue_capacity);
    }
    tracker_.addListener(window_);
    applyConfig(config_);
}

void AdhesionMonitor::applyConfig(const RuntimeConfig& config) {
    config_ = config;
    analyzer_.setConfig(config_.analysis);
    timeline_.setConfig(config_.timeline);
    window_->setRetention(std::max(config_.analysis_window_seconds, config_.timeline.view_seconds));
    timeline_tick_.setInterval(config_.timeline.tick_seconds);
    analysis_tick_.setInterval(std::chrono::duration<double>(config_.analysis_interval).count());
}

TickResult AdhesionMonitor::tick(double now) {
    TickResult result;
    result.drained = drain(now);
    if (timeline_tick_.due(now)) {
        renderTimeline(now);
        result.rendered = true;
    }
    if (analysis_tick_.due(now)) {
        runAnalysis(now);
        result.analyzed = true;
    }
    return result;
}

std::size_t AdhesionMonitor::drain(double now) {
    drain_buffer_.clear();
    const auto count = queue_->drainInto(drain_buffer_);
    for (const auto& event : drain_buffer_) {
        recorder_.append(event);
        tracker_.process(event);
    }
    window_->prune(now);
    return count;
}

const AnalysisReport& AdhesionMonitor::runAnalysis(double now) {
    report_ = analyzer_.analyzeWindow(window_->snapshot(), now,
                                      config_.analysis_window_seconds, config_.hotspot_count);
    has_report_ = true;
    return report_;
}

const TimelineGrid& AdhesionMonitor::renderTimeline(double now) {
    return timeline_.render(window_->snapshot(), now);
}

MonitorStatus AdhesionMonitor::status() const {
    MonitorStatus s;
    s.dropped_events = queue_->droppedCount();
    s.suppressed_repeats = tracker_.suppressedRepeats();
    s.stray_releases = tracker_.strayReleases();
    s.listener_failures = tracker_.listenerFailures();
    s.active_keys = tracker_.activeCount();
    s.window_events = window_->size();
    return s;
}

void AdhesionMonitor::clear() {
    tracker_.clear();
    window_->clear();
    timeline_.clear();
    recorder_.reset();
    report_ = AnalysisReport{};
    has_report_ = false;
    timeline_tick_.reset();
    analysis_tick_.reset();
}

}  // namespace kb::adh

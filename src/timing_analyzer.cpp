#include "key_adhesion/timing_analyzer.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <unordered_map>

#include "key_adhesion/key_names.hpp"

namespace kb::adh {

namespace {

constexpr double kNoDataHygieneScore = 100.0;
constexpr double kNoDataAdhesionRate = 0.0;

std::optional<Overlap> overlapBetween(const std::vector<KeyMetric>& metrics,
                                      std::size_t i,
                                      std::size_t j) {
    const auto& m1 = metrics[i];
    const auto& m2 = metrics[j];
    if (m1.key == m2.key) {
        return std::nullopt;
    }
    if (!(m1.press_time < m2.release_time && m2.press_time < m1.release_time)) {
        return std::nullopt;
    }
    const double start = std::max(m1.press_time, m2.press_time);
    const double end = std::min(m1.release_time, m2.release_time);
    const double duration = end - start;
    if (duration <= 0.0) {
        return std::nullopt;
    }
    return Overlap{i, j, start, end, duration};
}

double percentageOf(double overlap, double combined_press) {
    if (combined_press <= 0.0) {
        return 0.0;
    }
    return overlap / combined_press * 100.0;
}

}  // namespace

const char* bandName(AdhesionBand band) noexcept {
    switch (band) {
        case AdhesionBand::Clean: return "clean";
        case AdhesionBand::Minor: return "minor";
        case AdhesionBand::Moderate: return "moderate";
        case AdhesionBand::Severe: return "severe";
    }
    return "unknown";
}

TimingAnalyzer::TimingAnalyzer(AnalyzerConfig config) : config_(config) {}

std::vector<KeyMetric> TimingAnalyzer::analyze(const std::vector<KeyEvent>& events) const {
    std::vector<KeyMetric> metrics;
    std::unordered_map<std::string, double> pending;

    for (const auto& event : events) {
        if (event.isPress()) {
            // A second press before the release replaces the pending one.
            pending[event.key()] = event.timestamp();
            continue;
        }
        auto it = pending.find(event.key());
        if (it == pending.end()) {
            continue;
        }
        const double press_time = it->second;
        metrics.push_back(KeyMetric{event.key(), press_time, event.timestamp(),
                                    event.timestamp() - press_time});
        pending.erase(it);
    }
    return metrics;
}

std::vector<Overlap> TimingAnalyzer::findOverlaps(const std::vector<KeyMetric>& metrics) const {
    std::vector<Overlap> overlaps;
    for (std::size_t i = 0; i < metrics.size(); ++i) {
        for (std::size_t j = i + 1; j < metrics.size(); ++j) {
            if (auto overlap = overlapBetween(metrics, i, j)) {
                overlaps.push_back(*overlap);
            }
        }
    }
    return overlaps;
}

std::map<KeyPair, double> TimingAnalyzer::detectOverlaps(const std::vector<KeyMetric>& metrics) const {
    std::map<KeyPair, double> out;
    for (const auto& overlap : findOverlaps(metrics)) {
        const auto pair = canonicalPair(metrics[overlap.first].key, metrics[overlap.second].key);
        out[pair] = overlap.duration;
    }
    return out;
}

std::vector<KeyInteraction> TimingAnalyzer::findHotspots(const std::vector<KeyMetric>& metrics,
                                                         std::size_t top_n) const {
    struct Group {
        KeyPair pair;
        std::size_t count{0};
        double total_overlap{0.0};
        double total_press{0.0};
    };

    std::vector<Group> groups;
    std::map<KeyPair, std::size_t> index_of;
    for (const auto& overlap : findOverlaps(metrics)) {
        const auto& m1 = metrics[overlap.first];
        const auto& m2 = metrics[overlap.second];
        auto pair = canonicalPair(m1.key, m2.key);
        auto it = index_of.find(pair);
        if (it == index_of.end()) {
            it = index_of.emplace(pair, groups.size()).first;
            groups.push_back(Group{std::move(pair)});
        }
        auto& group = groups[it->second];
        ++group.count;
        group.total_overlap += overlap.duration;
        group.total_press += m1.duration + m2.duration;
    }

    std::vector<KeyInteraction> hotspots;
    hotspots.reserve(groups.size());
    for (const auto& group : groups) {
        hotspots.push_back(KeyInteraction{group.pair.first,
                                          group.pair.second,
                                          group.total_overlap / static_cast<double>(group.count),
                                          percentageOf(group.total_overlap, group.total_press),
                                          group.count});
    }

    std::stable_sort(hotspots.begin(), hotspots.end(), [](const KeyInteraction& a, const KeyInteraction& b) {
        return a.overlap_duration > b.overlap_duration;
    });
    if (hotspots.size() > top_n) {
        hotspots.resize(top_n);
    }
    return hotspots;
}

std::optional<KeyInteraction> TimingAnalyzer::mostRecentOverlap(const std::vector<KeyMetric>& metrics) const {
    std::optional<Overlap> latest;
    for (const auto& overlap : findOverlaps(metrics)) {
        if (!latest || overlap.end > latest->end) {
            latest = overlap;
        }
    }
    if (!latest) {
        return std::nullopt;
    }
    const auto& m1 = metrics[latest->first];
    const auto& m2 = metrics[latest->second];
    return KeyInteraction{m1.key, m2.key, latest->duration,
                          percentageOf(latest->duration, m1.duration + m2.duration), 1u};
}

AdhesionBand TimingAnalyzer::classify(double overlap_seconds) const {
    if (overlap_seconds <= 0.0) {
        return AdhesionBand::Clean;
    }
    const double ms = overlap_seconds * 1000.0;
    if (ms < config_.thresholds.minor_ms) {
        return AdhesionBand::Minor;
    }
    // Everything between the minor and severe cut points is moderate.
    if (ms < config_.thresholds.severe_ms) {
        return AdhesionBand::Moderate;
    }
    return AdhesionBand::Severe;
}

double TimingAnalyzer::weightFor(AdhesionBand band) const {
    switch (band) {
        case AdhesionBand::Clean: return config_.weights.clean;
        case AdhesionBand::Minor: return config_.weights.minor;
        case AdhesionBand::Moderate: return config_.weights.moderate;
        case AdhesionBand::Severe: return config_.weights.severe;
    }
    return 0.0;
}

SessionMetrics TimingAnalyzer::sessionMetrics(const std::vector<KeyMetric>& metrics) const {
    SessionMetrics out;
    out.total_keypresses = metrics.size();
    if (metrics.empty()) {
        out.hygiene_score = kNoDataHygieneScore;
        out.adhesion_rate = kNoDataAdhesionRate;
        return out;
    }

    std::vector<double> worst(metrics.size(), 0.0);
    for (const auto& overlap : findOverlaps(metrics)) {
        worst[overlap.first] = std::max(worst[overlap.first], overlap.duration);
        worst[overlap.second] = std::max(worst[overlap.second], overlap.duration);
        out.total_overlap_duration += overlap.duration;
    }

    double weight_sum = 0.0;
    for (std::size_t i = 0; i < metrics.size(); ++i) {
        const auto band = classify(worst[i]);
        weight_sum += weightFor(band);
        switch (band) {
            case AdhesionBand::Clean:
                ++out.clean_keypresses;
                continue;
            case AdhesionBand::Minor:
                ++out.minor_adhesions;
                break;
            case AdhesionBand::Moderate:
                ++out.moderate_adhesions;
                break;
            case AdhesionBand::Severe:
                ++out.severe_adhesions;
                break;
        }
        ++out.overlapping_keypresses;
        ++out.key_adhesion_map[metrics[i].key];
    }

    const double total = static_cast<double>(out.total_keypresses);
    out.hygiene_score = 100.0 * weight_sum / total;
    out.adhesion_rate = static_cast<double>(out.overlapping_keypresses) / total * 100.0;
    return out;
}

double TimingAnalyzer::keysPerSecond(const std::vector<KeyEvent>& events, double window_seconds) {
    if (events.empty() || window_seconds <= 0.0) {
        return 0.0;
    }
    double latest = -std::numeric_limits<double>::infinity();
    for (const auto& ev : events) {
        latest = std::max(latest, ev.timestamp());
    }
    const auto presses = std::count_if(events.begin(), events.end(), [&](const KeyEvent& ev) {
        return ev.isPress() && latest - ev.timestamp() <= window_seconds;
    });
    return static_cast<double>(presses) / window_seconds;
}

AnalysisReport TimingAnalyzer::analyzeWindow(const std::vector<KeyEvent>& events,
                                             double now,
                                             double window_seconds,
                                             std::size_t top_n) const {
    std::vector<KeyEvent> in_window;
    if (window_seconds > 0.0) {
        const double cutoff = now - window_seconds;
        std::copy_if(events.begin(), events.end(), std::back_inserter(in_window),
                     [&](const KeyEvent& ev) { return ev.timestamp() >= cutoff; });
    } else {
        in_window = events;
    }

    AnalysisReport report;
    report.metrics = analyze(in_window);
    report.session = sessionMetrics(report.metrics);
    report.hotspots = findHotspots(report.metrics, top_n);
    report.most_recent = mostRecentOverlap(report.metrics);

    double kps_window = window_seconds;
    if (kps_window <= 0.0 && !in_window.empty()) {
        const auto [lo, hi] = std::minmax_element(in_window.begin(), in_window.end(),
                                                  [](const KeyEvent& a, const KeyEvent& b) {
                                                      return a.timestamp() < b.timestamp();
                                                  });
        kps_window = hi->timestamp() - lo->timestamp();
    }
    report.keys_per_second = keysPerSecond(in_window, kps_window);
    return report;
}

}  // namespace kb::adh

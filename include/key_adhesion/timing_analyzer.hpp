#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

#include "key_adhesion/types.hpp"

namespace kb::adh {

struct AdhesionThresholds {
    double minor_ms{50.0};
    double moderate_ms{100.0};
    double severe_ms{150.0};
};

struct HygieneWeights {
    double clean{1.0};
    double minor{0.7};
    double moderate{0.3};
    double severe{0.0};
};

struct AnalyzerConfig {
    AdhesionThresholds thresholds;
    HygieneWeights weights;
};

struct AnalysisReport {
    std::vector<KeyMetric> metrics;
    SessionMetrics session;
    std::vector<KeyInteraction> hotspots;
    std::optional<KeyInteraction> most_recent;
    double keys_per_second{0.0};
};

// Stateless apart from its configuration: every call works on the batch it is
// given. Metric and overlap order follow the input order.
class TimingAnalyzer {
public:
    explicit TimingAnalyzer(AnalyzerConfig config = {});

    void setConfig(const AnalyzerConfig& config) { config_ = config; }
    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::vector<KeyMetric> analyze(const std::vector<KeyEvent>& events) const;

    [[nodiscard]] std::vector<Overlap> findOverlaps(const std::vector<KeyMetric>& metrics) const;

    // Canonical pair -> duration in seconds of the last overlap found for it.
    [[nodiscard]] std::map<KeyPair, double> detectOverlaps(const std::vector<KeyMetric>& metrics) const;

    [[nodiscard]] std::vector<KeyInteraction> findHotspots(const std::vector<KeyMetric>& metrics,
                                                           std::size_t top_n) const;

    [[nodiscard]] std::optional<KeyInteraction> mostRecentOverlap(const std::vector<KeyMetric>& metrics) const;

    [[nodiscard]] SessionMetrics sessionMetrics(const std::vector<KeyMetric>& metrics) const;

    [[nodiscard]] static double keysPerSecond(const std::vector<KeyEvent>& events, double window_seconds);

    [[nodiscard]] AdhesionBand classify(double overlap_seconds) const;
    [[nodiscard]] double weightFor(AdhesionBand band) const;

    // Runs the full pipeline over the events of the trailing `window_seconds`
    // before `now`. A non-positive window analyzes every event.
    [[nodiscard]] AnalysisReport analyzeWindow(const std::vector<KeyEvent>& events,
                                               double now,
                                               double window_seconds,
                                               std::size_t top_n) const;

private:
    AnalyzerConfig config_;
};

[[nodiscard]] const char* bandName(AdhesionBand band) noexcept;

}  // namespace kb::adh

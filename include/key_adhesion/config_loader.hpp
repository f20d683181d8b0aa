#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "key_adhesion/timeline_engine.hpp"
#include "key_adhesion/timing_analyzer.hpp"

namespace kb::adh {

struct CaptureConfig {
    std::string device_dir{"/dev/input/by-path"};
    std::string device_filter{"-kbd"};
    std::size_t queue_capacity{1000};
    std::chrono::milliseconds poll_interval{std::chrono::milliseconds{10}};
};

struct RuntimeConfig {
    CaptureConfig capture;

    AnalyzerConfig analysis;
    double analysis_window_seconds{10.0};
    std::chrono::milliseconds analysis_interval{std::chrono::milliseconds{1000}};
    std::size_t hotspot_count{5};

    TimelineConfig timeline;

    std::string session_directory{"sessions"};
};

class ConfigLoader {
public:
    [[nodiscard]] RuntimeConfig loadFromFile(const std::string& path) const;
    [[nodiscard]] RuntimeConfig loadFromString(std::string_view toml_text) const;
};

// Throws std::runtime_error describing the first invalid value.
void validateConfig(const RuntimeConfig& config);

// Changes one runtime-adjustable setting addressed by its TOML path
// ("timeline.blocks", "analysis.thresholds.minor_ms", ...). On failure the
// config is left untouched and `error`, when given, receives the reason.
bool applySetting(RuntimeConfig& config,
                  const std::string& path,
                  const std::string& value,
                  std::string* error = nullptr);

// (TOML path, current value) for every setting, in file order.
[[nodiscard]] std::vector<std::pair<std::string, std::string>> describeConfig(const RuntimeConfig& config);

}  // namespace kb::adh

#include "key_adhesion/config_loader.hpp"

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace kb::adh {

namespace {

struct NumericSetting {
    const char* path;
    bool integral;
    bool runtime;
    double max;
    double (*get)(const RuntimeConfig&);
    void (*set)(RuntimeConfig&, double);
};

using std::chrono::milliseconds;

const std::vector<NumericSetting>& numericSettings() {
    static const std::vector<NumericSetting> settings = {
        {"capture.queue_capacity", true, false, 1000000,
         [](const RuntimeConfig& c) { return static_cast<double>(c.capture.queue_capacity); },
         [](RuntimeConfig& c, double v) { c.capture.queue_capacity = static_cast<std::size_t>(v); }},
        {"capture.poll_interval_ms", true, false, 1000,
         [](const RuntimeConfig& c) { return static_cast<double>(c.capture.poll_interval.count()); },
         [](RuntimeConfig& c, double v) { c.capture.poll_interval = milliseconds(static_cast<long long>(v)); }},

        {"analysis.window_seconds", false, true, 3600,
         [](const RuntimeConfig& c) { return c.analysis_window_seconds; },
         [](RuntimeConfig& c, double v) { c.analysis_window_seconds = v; }},
        {"analysis.interval_ms", true, true, 60000,
         [](const RuntimeConfig& c) { return static_cast<double>(c.analysis_interval.count()); },
         [](RuntimeConfig& c, double v) { c.analysis_interval = milliseconds(static_cast<long long>(v)); }},
        {"analysis.hotspot_count", true, true, 100,
         [](const RuntimeConfig& c) { return static_cast<double>(c.hotspot_count); },
         [](RuntimeConfig& c, double v) { c.hotspot_count = static_cast<std::size_t>(v); }},

        {"analysis.thresholds.minor_ms", false, true, 10000,
         [](const RuntimeConfig& c) { return c.analysis.thresholds.minor_ms; },
         [](RuntimeConfig& c, double v) { c.analysis.thresholds.minor_ms = v; }},
        {"analysis.thresholds.moderate_ms", false, true, 10000,
         [](const RuntimeConfig& c) { return c.analysis.thresholds.moderate_ms; },
         [](RuntimeConfig& c, double v) { c.analysis.thresholds.moderate_ms = v; }},
        {"analysis.thresholds.severe_ms", false, true, 10000,
         [](const RuntimeConfig& c) { return c.analysis.thresholds.severe_ms; },
         [](RuntimeConfig& c, double v) { c.analysis.thresholds.severe_ms = v; }},

        {"analysis.weights.clean", false, true, 1,
         [](const RuntimeConfig& c) { return c.analysis.weights.clean; },
         [](RuntimeConfig& c, double v) { c.analysis.weights.clean = v; }},
        {"analysis.weights.minor", false, true, 1,
         [](const RuntimeConfig& c) { return c.analysis.weights.minor; },
         [](RuntimeConfig& c, double v) { c.analysis.weights.minor = v; }},
        {"analysis.weights.moderate", false, true, 1,
         [](const RuntimeConfig& c) { return c.analysis.weights.moderate; },
         [](RuntimeConfig& c, double v) { c.analysis.weights.moderate = v; }},
        {"analysis.weights.severe", false, true, 1,
         [](const RuntimeConfig& c) { return c.analysis.weights.severe; },
         [](RuntimeConfig& c, double v) { c.analysis.weights.severe = v; }},

        {"timeline.view_seconds", false, true, 600,
         [](const RuntimeConfig& c) { return c.timeline.view_seconds; },
         [](RuntimeConfig& c, double v) { c.timeline.view_seconds = v; }},
        {"timeline.blocks", true, true, 1000,
         [](const RuntimeConfig& c) { return static_cast<double>(c.timeline.blocks); },
         [](RuntimeConfig& c, double v) { c.timeline.blocks = static_cast<std::size_t>(v); }},
        {"timeline.tick_ms", true, true, 10000,
         [](const RuntimeConfig& c) { return std::round(c.timeline.tick_seconds * 1000.0); },
         [](RuntimeConfig& c, double v) { c.timeline.tick_seconds = v / 1000.0; }},
        {"timeline.fill_levels", true, true, 64,
         [](const RuntimeConfig& c) { return static_cast<double>(c.timeline.fill_levels); },
         [](RuntimeConfig& c, double v) { c.timeline.fill_levels = static_cast<int>(v); }},
        {"timeline.max_rows", true, true, 1000,
         [](const RuntimeConfig& c) { return static_cast<double>(c.timeline.max_rows); },
         [](RuntimeConfig& c, double v) { c.timeline.max_rows = static_cast<std::size_t>(v); }},
    };
    return settings;
}

const NumericSetting* findSetting(const std::string& path) {
    for (const auto& setting : numericSettings()) {
        if (path == setting.path) {
            return &setting;
        }
    }
    return nullptr;
}

std::string formatNumber(double value, bool integral) {
    if (integral) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

void assignNumeric(RuntimeConfig& config, const NumericSetting& setting, double value) {
    if (!std::isfinite(value)) {
        throw std::runtime_error(std::string(setting.path) + " must be a finite number");
    }
    if (setting.integral && (value < 0.0 || value != std::floor(value))) {
        throw std::runtime_error(std::string(setting.path) + " must be a non-negative integer");
    }
    if (value > setting.max) {
        throw std::runtime_error(std::string(setting.path) + " must be at most " + formatNumber(setting.max, setting.integral));
    }
    setting.set(config, value);
}

RuntimeConfig configFromTable(const toml::table& tbl) {
    RuntimeConfig config;

    for (const auto& setting : numericSettings()) {
        auto node = tbl.at_path(setting.path);
        if (!node) {
            continue;
        }
        auto value = node.value<double>();
        if (!value) {
            throw std::runtime_error(std::string(setting.path) + " must be a number");
        }
        assignNumeric(config, setting, *value);
    }

    config.capture.device_dir = tbl.at_path("capture.device_dir").value_or(config.capture.device_dir);
    config.capture.device_filter = tbl.at_path("capture.device_filter").value_or(config.capture.device_filter);
    config.session_directory = tbl.at_path("session.directory").value_or(config.session_directory);

    validateConfig(config);
    return config;
}

}  // namespace

RuntimeConfig ConfigLoader::loadFromFile(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Config file not found: " + path);
    }
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }
    return configFromTable(tbl);
}

RuntimeConfig ConfigLoader::loadFromString(std::string_view toml_text) const {
    toml::table tbl;
    try {
        tbl = toml::parse(toml_text);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }
    return configFromTable(tbl);
}

void validateConfig(const RuntimeConfig& config) {
    auto require = [](bool ok, const char* message) {
        if (!ok) {
            throw std::runtime_error(message);
        }
    };

    require(config.capture.queue_capacity >= 1 && config.capture.queue_capacity <= 1000000,
            "capture.queue_capacity must be between 1 and 1000000");
    require(config.capture.poll_interval.count() >= 1 && config.capture.poll_interval.count() <= 1000,
            "capture.poll_interval_ms must be between 1 and 1000");
    require(!config.capture.device_dir.empty(), "capture.device_dir must not be empty");

    require(config.analysis_window_seconds > 0.0 && config.analysis_window_seconds <= 3600.0,
            "analysis.window_seconds must be positive and at most 3600");
    require(config.analysis_interval.count() >= 1 && config.analysis_interval.count() <= 60000,
            "analysis.interval_ms must be between 1 and 60000");
    require(config.hotspot_count >= 1 && config.hotspot_count <= 100,
            "analysis.hotspot_count must be between 1 and 100");

    const auto& t = config.analysis.thresholds;
    require(t.minor_ms > 0.0, "analysis.thresholds.minor_ms must be positive");
    require(t.minor_ms <= t.moderate_ms && t.moderate_ms <= t.severe_ms,
            "analysis.thresholds must satisfy minor_ms <= moderate_ms <= severe_ms");
    require(t.severe_ms <= 10000.0, "analysis.thresholds must not exceed 10000 ms");

    const auto& w = config.analysis.weights;
    for (double weight : {w.clean, w.minor, w.moderate, w.severe}) {
        require(weight >= 0.0 && weight <= 1.0, "analysis.weights must lie in [0, 1]");
    }

    require(config.timeline.view_seconds > 0.0 && config.timeline.view_seconds <= 600.0,
            "timeline.view_seconds must be positive and at most 600");
    require(config.timeline.blocks >= 1 && config.timeline.blocks <= 1000,
            "timeline.blocks must be between 1 and 1000");
    require(config.timeline.tick_seconds >= 0.001 && config.timeline.tick_seconds <= 10.0,
            "timeline.tick_ms must be between 1 and 10000");
    require(config.timeline.fill_levels >= 1 && config.timeline.fill_levels <= 64,
            "timeline.fill_levels must be between 1 and 64");
    require(config.timeline.max_rows <= 1000, "timeline.max_rows must be at most 1000");

    require(!config.session_directory.empty(), "session.directory must not be empty");
}

bool applySetting(RuntimeConfig& config,
                  const std::string& path,
                  const std::string& value,
                  std::string* error) {
    auto fail = [&](const std::string& reason) {
        if (error) {
            *error = reason;
        }
        return false;
    };

    RuntimeConfig candidate = config;
    if (path == "session.directory") {
        candidate.session_directory = value;
    } else {
        const auto* setting = findSetting(path);
        if (setting == nullptr) {
            return fail("Unknown setting: " + path);
        }
        if (!setting->runtime) {
            return fail(path + " only takes effect after a restart");
        }
        double parsed = 0.0;
        std::size_t consumed = 0;
        try {
            parsed = std::stod(value, &consumed);
        } catch (const std::logic_error&) {
            return fail("Not a number: " + value);
        }
        if (consumed != value.size()) {
            return fail("Not a number: " + value);
        }
        try {
            assignNumeric(candidate, *setting, parsed);
        } catch (const std::runtime_error& err) {
            return fail(err.what());
        }
    }

    try {
        validateConfig(candidate);
    } catch (const std::runtime_error& err) {
        return fail(err.what());
    }
    config = std::move(candidate);
    return true;
}

std::vector<std::pair<std::string, std::string>> describeConfig(const RuntimeConfig& config) {
    std::vector<std::pair<std::string, std::string>> out;
    out.emplace_back("capture.device_dir", config.capture.device_dir);
    out.emplace_back("capture.device_filter", config.capture.device_filter);
    for (const auto& setting : numericSettings()) {
        out.emplace_back(setting.path, formatNumber(setting.get(config), setting.integral));
    }
    out.emplace_back("session.directory", config.session_directory);
    return out;
}

}  // namespace kb::adh

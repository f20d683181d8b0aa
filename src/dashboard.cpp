#include "key_adhesion/dashboard.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace kb::adh {

namespace {

constexpr std::size_t kLabelWidth = 12;

const char* const kLeftEighths[] = {" ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█"};

std::string upper(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::string label(const std::string& key) {
    std::string text = upper(key).substr(0, kLabelWidth);
    text.resize(kLabelWidth, ' ');
    return text;
}

int toEighths(int level, int fill_levels) {
    if (fill_levels <= 0) {
        return 0;
    }
    const int eighths = static_cast<int>(std::lround(level * 8.0 / fill_levels));
    return std::clamp(eighths, level > 0 ? 1 : 0, 8);
}

// The block range only offers right-aligned eighth and half blocks.
const char* rightAligned(int eighths) {
    if (eighths <= 0) return " ";
    if (eighths <= 3) return "▕";
    if (eighths <= 6) return "▐";
    return "█";
}

std::string millis(double seconds) {
    std::ostringstream oss;
    oss << static_cast<long long>(std::lround(seconds * 1000.0)) << "ms";
    return oss.str();
}

}  // namespace

std::string cellGlyph(const TimelineCell& cell, int fill_levels) {
    const int eighths = toEighths(cell.level, fill_levels);
    switch (cell.shape) {
        case CellShape::Empty:
            return " ";
        case CellShape::Head:
            return rightAligned(eighths);
        case CellShape::Body:
        case CellShape::Tail:
        case CellShape::Island:
            return kLeftEighths[eighths];
    }
    return " ";
}

const char* hygieneStatus(double hygiene_score) noexcept {
    const int score = static_cast<int>(hygiene_score);
    if (score >= 80) return "EXCELLENT";
    if (score >= 60) return "GOOD";
    if (score >= 40) return "FAIR";
    return "POOR";
}

const char* offenderSeverity(double overlap_seconds, const AdhesionThresholds& thresholds) noexcept {
    const double ms = overlap_seconds * 1000.0;
    if (ms < thresholds.minor_ms) return "MINOR";
    if (ms < thresholds.moderate_ms) return "MODERATE";
    return "SEVERE";
}

std::string formatTimeline(const TimelineGrid& grid, const TimelineConfig& config) {
    std::ostringstream out;
    out << "DYNAMIC PIANO ROLL" << '\n';

    const double block_ms = config.blocks > 0
        ? config.view_seconds * 1000.0 / static_cast<double>(config.blocks)
        : 0.0;

    if (grid.rows.empty()) {
        out << "  Waiting for key events..." << '\n';
    }
    for (const auto& row : grid.rows) {
        out << label(row.key) << " | ";
        for (const auto& cell : row.cells) {
            out << cellGlyph(cell, config.fill_levels);
        }
        out << " | ";
        if (row.held) {
            out << "● " << std::fixed << std::setprecision(2) << row.held_seconds << "s";
            out << std::defaultfloat;
        } else {
            out << "○ released";
        }
        out << '\n';
    }
    if (grid.hidden_rows > 0) {
        out << "  (+" << grid.hidden_rows << " more keys)" << '\n';
    }
    out << "View window: " << config.view_seconds << "s | Resolution: "
        << static_cast<long long>(std::lround(block_ms)) << "ms/block | Events: "
        << grid.event_count << '\n';
    return out.str();
}

std::string formatReport(const AnalysisReport& report, const TimingAnalyzer& analyzer) {
    const auto& m = report.session;
    std::ostringstream out;

    out << "SIGNAL HYGIENE   " << static_cast<int>(m.hygiene_score) << " ("
        << hygieneStatus(m.hygiene_score) << ")" << '\n';

    const int clean_pct = m.total_keypresses > 0
        ? static_cast<int>(m.clean_keypresses * 100 / m.total_keypresses)
        : 100;
    const int bar = clean_pct / 10;
    out << "SIGNAL QUALITY   ";
    for (int i = 0; i < 10; ++i) {
        out << (i < bar ? "█" : "░");
    }
    out << ' ' << clean_pct << "% clean" << '\n';
    out << "  Keypresses: " << m.total_keypresses
        << "  Independent: " << m.clean_keypresses
        << "  Minor: " << m.minor_adhesions
        << "  Moderate: " << m.moderate_adhesions
        << "  Severe: " << m.severe_adhesions << '\n';
    out << "  Adhesion rate: " << std::fixed << std::setprecision(1) << m.adhesion_rate << "%"
        << std::defaultfloat << "  Total overlap: " << millis(m.total_overlap_duration) << '\n';

    out << "WORST OFFENDERS" << '\n';
    if (report.hotspots.empty()) {
        out << "  No data yet..." << '\n';
    }
    std::size_t rank = 1;
    for (const auto& hotspot : report.hotspots) {
        out << "  " << rank++ << ". [" << upper(hotspot.key1) << "]+[" << upper(hotspot.key2) << "]: "
            << millis(hotspot.overlap_duration) << " x" << hotspot.occurrences << " ("
            << std::fixed << std::setprecision(1) << hotspot.overlap_percentage << "%)"
            << std::defaultfloat << ' ' << offenderSeverity(hotspot.overlap_duration, analyzer.config().thresholds)
            << '\n';
    }

    out << "MOST RECENT      ";
    if (report.most_recent) {
        out << '[' << upper(report.most_recent->key1) << "]+[" << upper(report.most_recent->key2)
            << "] " << millis(report.most_recent->overlap_duration);
    } else {
        out << "none";
    }
    out << '\n';

    out << "KEYS/SEC         " << std::fixed << std::setprecision(2) << report.keys_per_second
        << std::defaultfloat << '\n';
    return out.str();
}

std::string formatStatus(const MonitorStatus& status, bool recording, std::size_t recorded_events) {
    std::ostringstream out;
    out << "Held: " << status.active_keys
        << "  Window events: " << status.window_events
        << "  Dropped: " << status.dropped_events
        << "  Repeats suppressed: " << status.suppressed_repeats
        << "  Stray releases: " << status.stray_releases;
    if (status.listener_failures > 0) {
        out << "  Listener failures: " << status.listener_failures;
    }
    out << '\n';
    out << (recording ? "Recording" : "Not recording");
    if (recording || recorded_events > 0) {
        out << " (" << recorded_events << " events)";
    }
    out << '\n';
    return out.str();
}

}  // namespace kb::adh

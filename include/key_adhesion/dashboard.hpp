#pragma once

#include <string>

#include "key_adhesion/adhesion_monitor.hpp"

namespace kb::adh {

// Block glyph for one timeline cell. Tail and island cells fill from the left,
// head cells from the right, so adjacent presses join into one bar.
[[nodiscard]] std::string cellGlyph(const TimelineCell& cell, int fill_levels);

[[nodiscard]] const char* hygieneStatus(double hygiene_score) noexcept;

// Label for a worst-offender line. Offenders are cut at minor_ms and
// moderate_ms, so a pair averaging moderate_ms or more reads SEVERE even when
// its keypresses fall in the moderate band.
[[nodiscard]] const char* offenderSeverity(double overlap_seconds, const AdhesionThresholds& thresholds) noexcept;

[[nodiscard]] std::string formatTimeline(const TimelineGrid& grid, const TimelineConfig& config);

[[nodiscard]] std::string formatReport(const AnalysisReport& report, const TimingAnalyzer& analyzer);

[[nodiscard]] std::string formatStatus(const MonitorStatus& status, bool recording, std::size_t recorded_events);

}  // namespace kb::adh

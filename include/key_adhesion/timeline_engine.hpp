#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "key_adhesion/types.hpp"

namespace kb::adh {

enum class CellShape {
    Empty,
    Head,    // interval starts inside the slice and runs past its end; fill is right-aligned
    Tail,    // interval started before the slice and ends inside it; fill is left-aligned
    Body,    // slice fully covered
    Island,  // interval starts and ends inside the slice; fill is left-aligned
};

struct TimelineCell {
    double fill_fraction{0.0};
    int level{0};
    CellShape shape{CellShape::Empty};
};

struct TimelineRow {
    std::string key;
    std::vector<TimelineCell> cells;
    bool held{false};
    double held_seconds{0.0};
};

struct TimelineGrid {
    double view_start{0.0};
    double view_end{0.0};
    std::vector<TimelineRow> rows;
    std::size_t event_count{0};
    std::size_t hidden_rows{0};
    std::uint64_t signature{0};
};

struct TimelineConfig {
    double view_seconds{5.0};
    std::size_t blocks{100};
    double tick_seconds{0.05};
    int fill_levels{8};
    std::size_t max_rows{0};  // 0 shows every relevant key
};

struct TimeInterval {
    double start{0.0};
    double end{0.0};
};

class TimelineEngine {
public:
    explicit TimelineEngine(TimelineConfig config = {});

    void setConfig(const TimelineConfig& config);
    [[nodiscard]] const TimelineConfig& config() const noexcept { return config_; }

    void setRowOffset(std::size_t offset) { row_offset_ = offset; }
    [[nodiscard]] std::size_t rowOffset() const noexcept { return row_offset_; }

    // Takes ownership of an event snapshot and renders the window ending at the
    // tick-quantized `now`. Returns the cached grid when nothing that affects
    // the output has changed since the previous call.
    const TimelineGrid& render(std::vector<KeyEvent> events, double now);

    [[nodiscard]] const TimelineGrid& grid() const noexcept { return grid_; }
    [[nodiscard]] std::uint64_t signature() const noexcept { return signature_; }
    [[nodiscard]] std::size_t recomputeCount() const noexcept { return recompute_count_; }
    [[nodiscard]] bool lastRenderReused() const noexcept { return last_reused_; }

    void clear();

    [[nodiscard]] double quantizeNow(double now) const;

    // Press/release intervals of `key`, paired like the analyzer pairs them,
    // with a still-held press running to `view_end`, clipped to the view.
    [[nodiscard]] static std::vector<TimeInterval> keyIntervals(const std::vector<KeyEvent>& events,
                                                                const std::string& key,
                                                                double view_start,
                                                                double view_end);

    [[nodiscard]] static TimelineCell classifySlice(const std::vector<TimeInterval>& intervals,
                                                    double slice_start,
                                                    double slice_end,
                                                    int fill_levels);

    [[nodiscard]] static std::vector<TimelineCell> buildCells(const std::vector<TimeInterval>& intervals,
                                                              double view_start,
                                                              double view_end,
                                                              std::size_t blocks,
                                                              int fill_levels);

private:
    TimelineConfig config_;
    std::size_t row_offset_{0};

    std::vector<KeyEvent> snapshot_;
    TimelineGrid grid_;
    std::uint64_t signature_{0};
    bool has_grid_{false};
    bool last_reused_{false};
    std::size_t recompute_count_{0};
};

[[nodiscard]] const char* shapeName(CellShape shape) noexcept;

}  // namespace kb::adh

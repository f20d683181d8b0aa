#include "key_adhesion/timeline_engine.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <set>
#include <unordered_map>

#include "key_adhesion/key_names.hpp"

namespace kb::adh {

namespace {

void hashCombine(std::uint64_t& seed, std::uint64_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

std::uint64_t hashOf(const std::string& value) {
    return static_cast<std::uint64_t>(std::hash<std::string>{}(value));
}

std::uint64_t hashOf(double value) {
    return static_cast<std::uint64_t>(std::hash<double>{}(value));
}

std::uint64_t computeSignature(const TimelineConfig& config,
                               std::size_t row_offset,
                               const std::vector<KeyEvent>& events,
                               double view_start,
                               double view_end,
                               const std::vector<std::string>& keys,
                               const std::set<std::string>& held) {
    std::uint64_t seed = 0;
    hashCombine(seed, events.size());
    hashCombine(seed, hashOf(view_start));
    hashCombine(seed, hashOf(view_end));
    hashCombine(seed, row_offset);
    for (const auto& key : keys) {
        hashCombine(seed, hashOf(key));
        hashCombine(seed, held.count(key));
    }
    if (!events.empty()) {
        const auto& last = events.back();
        hashCombine(seed, hashOf(last.key()));
        hashCombine(seed, static_cast<std::uint64_t>(last.type()));
        hashCombine(seed, hashOf(last.timestamp()));
    }
    hashCombine(seed, hashOf(config.view_seconds));
    hashCombine(seed, config.blocks);
    hashCombine(seed, static_cast<std::uint64_t>(config.fill_levels));
    hashCombine(seed, config.max_rows);
    return seed;
}

}  // namespace

const char* shapeName(CellShape shape) noexcept {
    switch (shape) {
        case CellShape::Empty: return "empty";
        case CellShape::Head: return "head";
        case CellShape::Tail: return "tail";
        case CellShape::Body: return "body";
        case CellShape::Island: return "island";
    }
    return "unknown";
}

TimelineEngine::TimelineEngine(TimelineConfig config) : config_(config) {}

void TimelineEngine::setConfig(const TimelineConfig& config) {
    config_ = config;
}

double TimelineEngine::quantizeNow(double now) const {
    if (config_.tick_seconds <= 0.0) {
        return now;
    }
    // The small bias keeps exact tick multiples from rounding down a whole tick.
    return std::floor(now / config_.tick_seconds + 1e-9) * config_.tick_seconds;
}

const TimelineGrid& TimelineEngine::render(std::vector<KeyEvent> events, double now) {
    snapshot_ = std::move(events);

    const double view_end = quantizeNow(now);
    const double view_start = view_end - config_.view_seconds;

    std::set<std::string> window_keys;
    std::unordered_map<std::string, double> pending;
    for (const auto& ev : snapshot_) {
        if (ev.timestamp() > view_end) {
            continue;
        }
        if (ev.timestamp() >= view_start) {
            window_keys.insert(ev.key());
        }
        if (ev.isPress()) {
            pending[ev.key()] = ev.timestamp();
        } else {
            pending.erase(ev.key());
        }
    }

    std::set<std::string> held;
    for (const auto& entry : pending) {
        held.insert(entry.first);
        window_keys.insert(entry.first);
    }

    std::vector<std::string> keys(window_keys.begin(), window_keys.end());
    std::sort(keys.begin(), keys.end(), canonicalKeyLess);

    const auto signature = computeSignature(config_, row_offset_, snapshot_, view_start, view_end, keys, held);
    if (has_grid_ && signature == signature_) {
        last_reused_ = true;
        return grid_;
    }

    TimelineGrid grid;
    grid.view_start = view_start;
    grid.view_end = view_end;
    grid.event_count = snapshot_.size();
    grid.signature = signature;

    const std::size_t first = std::min(row_offset_, keys.size());
    std::size_t last = keys.size();
    if (config_.max_rows > 0) {
        last = std::min(last, first + config_.max_rows);
    }
    grid.hidden_rows = keys.size() - (last - first);

    for (std::size_t i = first; i < last; ++i) {
        const auto& key = keys[i];
        TimelineRow row;
        row.key = key;
        row.cells = buildCells(keyIntervals(snapshot_, key, view_start, view_end),
                               view_start, view_end, config_.blocks, config_.fill_levels);
        if (held.count(key) != 0) {
            row.held = true;
            row.held_seconds = std::max(0.0, view_end - pending.at(key));
        }
        grid.rows.push_back(std::move(row));
    }

    grid_ = std::move(grid);
    signature_ = signature;
    has_grid_ = true;
    last_reused_ = false;
    ++recompute_count_;
    return grid_;
}

void TimelineEngine::clear() {
    snapshot_.clear();
    grid_ = TimelineGrid{};
    signature_ = 0;
    has_grid_ = false;
    last_reused_ = false;
    recompute_count_ = 0;
}

std::vector<TimeInterval> TimelineEngine::keyIntervals(const std::vector<KeyEvent>& events,
                                                       const std::string& key,
                                                       double view_start,
                                                       double view_end) {
    std::vector<TimeInterval> raw;
    bool has_pending = false;
    double pending_press = 0.0;
    for (const auto& ev : events) {
        if (ev.key() != key) {
            continue;
        }
        if (ev.isPress()) {
            has_pending = true;
            pending_press = ev.timestamp();
        } else if (has_pending) {
            raw.push_back({pending_press, ev.timestamp()});
            has_pending = false;
        }
    }
    if (has_pending) {
        raw.push_back({pending_press, view_end});
    }

    std::vector<TimeInterval> clipped;
    for (const auto& iv : raw) {
        const double start = std::max(iv.start, view_start);
        const double end = std::min(iv.end, view_end);
        if (end > start) {
            clipped.push_back({start, end});
        }
    }
    std::sort(clipped.begin(), clipped.end(), [](const TimeInterval& a, const TimeInterval& b) {
        return a.start < b.start;
    });
    return clipped;
}

TimelineCell TimelineEngine::classifySlice(const std::vector<TimeInterval>& intervals,
                                           double slice_start,
                                           double slice_end,
                                           int fill_levels) {
    const double slice = slice_end - slice_start;
    if (slice <= 0.0 || fill_levels <= 0) {
        return {};
    }

    double covered = 0.0;
    double first_start = 0.0;
    double last_end = 0.0;
    bool any = false;
    for (const auto& iv : intervals) {
        if (iv.end <= slice_start || iv.start >= slice_end) {
            continue;
        }
        covered += std::min(iv.end, slice_end) - std::max(iv.start, slice_start);
        if (!any) {
            first_start = iv.start;
            last_end = iv.end;
            any = true;
        } else {
            first_start = std::min(first_start, iv.start);
            last_end = std::max(last_end, iv.end);
        }
    }
    if (!any) {
        return {};
    }

    const double fraction = std::clamp(covered / slice, 0.0, 1.0);
    // Any coverage shows at least one level so short taps never vanish.
    const int level = std::clamp(static_cast<int>(std::lround(fraction * fill_levels)), 1, fill_levels);

    const double eps = slice * 1e-6;
    const bool covers_start = first_start <= slice_start + eps;
    const bool reaches_end = last_end >= slice_end - eps;

    TimelineCell cell;
    cell.level = level;
    cell.fill_fraction = static_cast<double>(level) / static_cast<double>(fill_levels);
    if (covers_start && reaches_end) {
        cell.shape = CellShape::Body;
    } else if (reaches_end) {
        cell.shape = CellShape::Head;
    } else if (covers_start) {
        cell.shape = CellShape::Tail;
    } else {
        cell.shape = CellShape::Island;
    }
    return cell;
}

std::vector<TimelineCell> TimelineEngine::buildCells(const std::vector<TimeInterval>& intervals,
                                                     double view_start,
                                                     double view_end,
                                                     std::size_t blocks,
                                                     int fill_levels) {
    std::vector<TimelineCell> cells(blocks);
    if (blocks == 0 || view_end <= view_start) {
        return cells;
    }
    const double slice = (view_end - view_start) / static_cast<double>(blocks);
    for (std::size_t i = 0; i < blocks; ++i) {
        const double slice_start = view_start + static_cast<double>(i) * slice;
        const double slice_end = (i + 1 == blocks) ? view_end
                                                   : view_start + static_cast<double>(i + 1) * slice;
        cells[i] = classifySlice(intervals, slice_start, slice_end, fill_levels);
    }
    return cells;
}

}  // namespace kb::adh

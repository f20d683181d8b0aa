#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kb::adh {

enum class KeyEventType {
    Press,
    Release,
};

class KeyEvent {
public:
    // Key identifiers are case-insensitive; they are stored lower-cased.
    KeyEvent(std::string key, KeyEventType type, double timestamp);

    static KeyEvent press(std::string key, double timestamp) {
        return KeyEvent(std::move(key), KeyEventType::Press, timestamp);
    }
    static KeyEvent release(std::string key, double timestamp) {
        return KeyEvent(std::move(key), KeyEventType::Release, timestamp);
    }

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] KeyEventType type() const noexcept { return type_; }
    [[nodiscard]] double timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] bool isPress() const noexcept { return type_ == KeyEventType::Press; }
    [[nodiscard]] bool isRelease() const noexcept { return type_ == KeyEventType::Release; }

private:
    std::string key_;
    KeyEventType type_;
    double timestamp_;
};

// key -> press timestamp of every key currently believed held.
using ActiveKeyState = std::map<std::string, double>;

struct KeyMetric {
    std::string key;
    double press_time{0.0};
    double release_time{0.0};
    double duration{0.0};
};

// Indices refer to the metric sequence the overlap was found in.
struct Overlap {
    std::size_t first{0};
    std::size_t second{0};
    double start{0.0};
    double end{0.0};
    double duration{0.0};
};

struct KeyPair {
    std::string first;
    std::string second;
};

bool operator==(const KeyPair& lhs, const KeyPair& rhs);
bool operator<(const KeyPair& lhs, const KeyPair& rhs);

struct KeyInteraction {
    std::string key1;
    std::string key2;
    double overlap_duration{0.0};
    double overlap_percentage{0.0};
    std::size_t occurrences{0};
};

enum class AdhesionBand {
    Clean,
    Minor,
    Moderate,
    Severe,
};

struct SessionMetrics {
    std::size_t total_keypresses{0};
    std::size_t clean_keypresses{0};
    std::size_t overlapping_keypresses{0};
    double hygiene_score{100.0};
    double adhesion_rate{0.0};
    double total_overlap_duration{0.0};
    std::size_t minor_adhesions{0};
    std::size_t moderate_adhesions{0};
    std::size_t severe_adhesions{0};
    std::map<std::string, std::size_t> key_adhesion_map;
};

struct KeySession {
    double start_time{0.0};
    double end_time{0.0};
    std::vector<KeyEvent> events;
    std::unordered_map<std::string, std::string> metadata;
};

[[nodiscard]] const char* eventTypeName(KeyEventType type) noexcept;

}  // namespace kb::adh

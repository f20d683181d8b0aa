#include "key_adhesion/key_names.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>

namespace kb::adh {

namespace {

const std::unordered_map<std::string, std::size_t>& rankTable() {
    static const std::unordered_map<std::string, std::size_t> table = {
        {"esc", 0},
        {"1", 1}, {"2", 2}, {"3", 3}, {"4", 4}, {"5", 5}, {"6", 6}, {"7", 7},
        {"8", 8}, {"9", 9}, {"0", 10}, {"-", 11}, {"=", 12}, {"backspace", 13},
        {"tab", 20}, {"q", 21}, {"w", 22}, {"e", 23}, {"r", 24}, {"t", 25},
        {"y", 26}, {"u", 27}, {"i", 28}, {"o", 29}, {"p", 30}, {"[", 31},
        {"]", 32}, {"\\", 33},
        {"left ctrl", 40}, {"a", 41}, {"s", 42}, {"d", 43}, {"f", 44}, {"g", 45},
        {"h", 46}, {"j", 47}, {"k", 48}, {"l", 49}, {";", 50}, {"'", 51},
        {"enter", 52},
        {"left shift", 60}, {"z", 61}, {"x", 62}, {"c", 63}, {"v", 64},
        {"b", 65}, {"n", 66}, {"m", 67}, {",", 68}, {".", 69}, {"/", 70},
        {"left alt", 80}, {"space", 81}, {"right alt", 82},
        {"f1", 100}, {"f2", 101}, {"f3", 102}, {"f4", 103}, {"f5", 104},
        {"f6", 105}, {"f7", 106}, {"f8", 107}, {"f9", 108}, {"f10", 109},
        {"f11", 110}, {"f12", 111},
    };
    return table;
}

const std::unordered_map<std::string, std::string>& evdevTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"ESC", "esc"},
        {"MINUS", "-"},
        {"EQUAL", "="},
        {"LEFTBRACE", "["},
        {"RIGHTBRACE", "]"},
        {"BACKSLASH", "\\"},
        {"SEMICOLON", ";"},
        {"APOSTROPHE", "'"},
        {"GRAVE", "`"},
        {"COMMA", ","},
        {"DOT", "."},
        {"SLASH", "/"},
        {"LEFTCTRL", "left ctrl"},
        {"RIGHTCTRL", "right ctrl"},
        {"LEFTSHIFT", "left shift"},
        {"RIGHTSHIFT", "right shift"},
        {"LEFTALT", "left alt"},
        {"RIGHTALT", "right alt"},
        {"LEFTMETA", "left meta"},
        {"RIGHTMETA", "right meta"},
        {"CAPSLOCK", "caps lock"},
        {"PAGEUP", "page up"},
        {"PAGEDOWN", "page down"},
    };
    return table;
}

}  // namespace

std::string normalizeKeyName(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char ch : key) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::string keyNameFromEvdev(const std::string& evdev_name) {
    std::string suffix = evdev_name;
    if (suffix.rfind("KEY_", 0) == 0) {
        suffix = suffix.substr(4);
    }
    const auto& table = evdevTable();
    if (auto it = table.find(suffix); it != table.end()) {
        return it->second;
    }
    return normalizeKeyName(suffix);
}

std::size_t canonicalKeyRank(const std::string& key) {
    const auto& table = rankTable();
    auto it = table.find(normalizeKeyName(key));
    if (it == table.end()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return it->second;
}

bool canonicalKeyLess(const std::string& lhs, const std::string& rhs) {
    const auto lr = canonicalKeyRank(lhs);
    const auto rr = canonicalKeyRank(rhs);
    if (lr != rr) {
        return lr < rr;
    }
    return lhs < rhs;
}

KeyPair canonicalPair(const std::string& a, const std::string& b) {
    if (canonicalKeyLess(b, a)) {
        return {b, a};
    }
    return {a, b};
}

}  // namespace kb::adh

#include "key_adhesion/types.hpp"

#include "key_adhesion/key_names.hpp"

namespace kb::adh {

KeyEvent::KeyEvent(std::string key, KeyEventType type, double timestamp)
    : key_(normalizeKeyName(key)), type_(type), timestamp_(timestamp) {}

bool operator==(const KeyPair& lhs, const KeyPair& rhs) {
    return lhs.first == rhs.first && lhs.second == rhs.second;
}

bool operator<(const KeyPair& lhs, const KeyPair& rhs) {
    if (lhs.first != rhs.first) {
        return canonicalKeyLess(lhs.first, rhs.first);
    }
    return canonicalKeyLess(lhs.second, rhs.second);
}

const char* eventTypeName(KeyEventType type) noexcept {
    return type == KeyEventType::Press ? "press" : "release";
}

}  // namespace kb::adh

#pragma once

#include <cstddef>
#include <string>

#include "key_adhesion/types.hpp"

namespace kb::adh {

[[nodiscard]] std::string normalizeKeyName(const std::string& key);

// Translates a kernel key name ("KEY_LEFTCTRL") to the identifier used in
// events ("left ctrl"). Names outside the table become the lower-cased suffix.
[[nodiscard]] std::string keyNameFromEvdev(const std::string& evdev_name);

// Position in the physical row-major layout; unknown keys rank after all known ones.
[[nodiscard]] std::size_t canonicalKeyRank(const std::string& key);
[[nodiscard]] bool canonicalKeyLess(const std::string& lhs, const std::string& rhs);

[[nodiscard]] KeyPair canonicalPair(const std::string& a, const std::string& b);

}  // namespace kb::adh

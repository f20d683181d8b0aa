#include <gtest/gtest.h>

#include <limits>

#include "key_adhesion/key_names.hpp"
#include "key_adhesion/types.hpp"

using namespace kb::adh;

TEST(KeyNames, NormalizeLowercases)
{
    EXPECT_EQ(normalizeKeyName("Left Shift"), "left shift");
    EXPECT_EQ(normalizeKeyName("A"), "a");
}

TEST(KeyNames, KeyEventStoresNormalizedKey)
{
    const auto ev = KeyEvent::press("Q", 1.0);
    EXPECT_EQ(ev.key(), "q");
    EXPECT_TRUE(ev.isPress());
}

TEST(KeyNames, EvdevNamesUseTable)
{
    EXPECT_EQ(keyNameFromEvdev("KEY_LEFTCTRL"), "left ctrl");
    EXPECT_EQ(keyNameFromEvdev("KEY_MINUS"), "-");
    EXPECT_EQ(keyNameFromEvdev("KEY_ESC"), "esc");
}

TEST(KeyNames, EvdevNamesFallBackToLowercasedSuffix)
{
    EXPECT_EQ(keyNameFromEvdev("KEY_A"), "a");
    EXPECT_EQ(keyNameFromEvdev("KEY_SPACE"), "space");
    EXPECT_EQ(keyNameFromEvdev("KEY_F5"), "f5");
}

TEST(KeyNames, CanonicalOrderFollowsKeyboardRows)
{
    EXPECT_TRUE(canonicalKeyLess("esc", "1"));
    EXPECT_TRUE(canonicalKeyLess("q", "w"));
    EXPECT_TRUE(canonicalKeyLess("p", "a"));
    EXPECT_TRUE(canonicalKeyLess("left shift", "z"));
    EXPECT_FALSE(canonicalKeyLess("w", "q"));
}

TEST(KeyNames, UnknownKeysSortLastAlphabetically)
{
    EXPECT_EQ(canonicalKeyRank("mystery"), std::numeric_limits<std::size_t>::max());
    EXPECT_TRUE(canonicalKeyLess("f12", "mystery"));
    EXPECT_TRUE(canonicalKeyLess("alpha", "beta"));
}

TEST(KeyNames, CanonicalPairIsOrderIndependent)
{
    EXPECT_EQ(canonicalPair("s", "a"), canonicalPair("a", "s"));
    EXPECT_EQ(canonicalPair("s", "a").first, "a");
}

#include <gtest/gtest.h>

#include "util/hash.hpp"

namespace espkit {

TEST(HashTest, Fnv1aKnownValues) {
    EXPECT_EQ(Fnv1a64Hex(""), "cbf29ce484222325");
    EXPECT_EQ(Fnv1a64Hex("https://example/repo"), "b9791476036a7605");
    EXPECT_EQ(Fnv1a64Hex("https://github.com/espressif/esp-idf"), "ee8c0505c7609156");
}

TEST(HashTest, IsUsableAtCompileTime) {
    static_assert(Fnv1a64("") == 0xcbf29ce484222325ULL);
    EXPECT_NE(Fnv1a64("a"), Fnv1a64("b"));
}

TEST(HashTest, HexHasNoLeadingZeros) {
    EXPECT_EQ(ToHex(0), "0");
    EXPECT_EQ(ToHex(0xabcULL), "abc");
    EXPECT_EQ(ToHex(0xffffffffffffffffULL), "ffffffffffffffff");
}

} // namespace espkit

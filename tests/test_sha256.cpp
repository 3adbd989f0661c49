#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace espkit {

TEST(Sha256Test, KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";

    testutil::MemoryReader reader(std::string("abc"));
    EXPECT_EQ(Sha256Hex(reader), expected);
}

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(Sha256Hex(std::span<const std::uint8_t>()),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HashesFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/abc.txt";
    testutil::WriteFile(path, std::string("abc"));

    std::string hex;
    auto res = Sha256HexFile(path, hex);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, MissingFileFails) {
    std::string hex;
    EXPECT_FALSE(Sha256HexFile("/nonexistent/espkit/file", hex).is_ok());
}

TEST(Sha256Test, ComparisonIgnoresCase) {
    EXPECT_TRUE(Sha256Equal("ABCDEF01", "abcdef01"));
    EXPECT_FALSE(Sha256Equal("abcdef01", "abcdef02"));
    EXPECT_FALSE(Sha256Equal("abcdef", "abcdef01"));
}

} // namespace espkit

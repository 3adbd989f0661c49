#include "io/xz_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace espkit {

TEST(XzReaderTest, DecompressesXzData) {
    const std::string input = "xtensa-esp32-elf\nriscv32-esp-elf\n";
    XzReader xz(std::make_unique<testutil::MemoryReader>(
        testutil::CompressRaw(input, testutil::ArchiveFormat::TarXz)));

    EXPECT_EQ(testutil::ReadAll(xz), input);
}

TEST(XzReaderTest, RejectsNonXzInput) {
    XzReader xz(std::make_unique<testutil::MemoryReader>(std::string("definitely not xz data")));

    std::vector<uint8_t> buf(64);
    EXPECT_LT(xz.Read(buf), 0);
}

TEST(XzReaderTest, TruncatedStreamIsAnError) {
    std::string input;
    for (int i = 0; i < 5000; ++i)
        input += std::to_string(i * 7919) + ",";
    auto compressed = testutil::CompressRaw(input, testutil::ArchiveFormat::TarXz);
    compressed.resize(compressed.size() - 16);

    XzReader xz(std::make_unique<testutil::MemoryReader>(compressed));

    std::vector<uint8_t> buf(1024);
    ssize_t n = 0;
    do {
        n = xz.Read(buf);
    } while (n > 0);
    EXPECT_LT(n, 0);
}

} // namespace espkit

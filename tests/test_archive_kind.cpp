#include <gtest/gtest.h>

#include "fetch/archive_kind.hpp"

namespace espkit {

TEST(ArchiveKindTest, DispatchesOnLastExtension) {
    EXPECT_EQ(ArchiveKindFromFileName("xtensa-esp32-elf.zip"), ArchiveKind::Zip);
    EXPECT_EQ(ArchiveKindFromFileName("openocd.tar.gz"), ArchiveKind::GzTar);
    EXPECT_EQ(ArchiveKindFromFileName("llvm-linux-amd64.tar.xz"), ArchiveKind::XzTar);
}

TEST(ArchiveKindTest, OtherExtensionsAreRejected) {
    auto bz = ArchiveKindFromFileName("tools.tar.bz2");
    ASSERT_FALSE(bz.has_value());
    EXPECT_EQ(bz.error(), "Unsupported file extension: bz2");

    auto none = ArchiveKindFromFileName("install");
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error(), "Unsupported file extension: <none>");
}

} // namespace espkit

#include <gtest/gtest.h>

#include "sdk/minifier.hpp"
#include "testing.hpp"

namespace espkit {

namespace fs = std::filesystem;

class MinifierTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    fs::path sdk{tmp.Path()};

    void Populate() {
        testutil::WriteFile(sdk / "docs/en/index.rst", std::string("docs"));
        testutil::WriteFile(sdk / "examples/get-started/main.c", std::string("int main;"));
        testutil::WriteFile(sdk / "tools/esp_app_trace/logtrace.py", std::string("#"));
        testutil::WriteFile(sdk / "tools/test_idf_size/test.sh", std::string("#"));
        testutil::WriteFile(sdk / "tools/idf.py", std::string("#"));
        testutil::WriteFile(sdk / "components/log/log.c", std::string("log"));
    }
};

TEST_F(MinifierTest, RemovesExactlyTheFourSubtrees) {
    Populate();

    auto res = MinifySdk(sdk);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_FALSE(fs::exists(sdk / "docs"));
    EXPECT_FALSE(fs::exists(sdk / "examples"));
    EXPECT_FALSE(fs::exists(sdk / "tools/esp_app_trace"));
    EXPECT_FALSE(fs::exists(sdk / "tools/test_idf_size"));
    EXPECT_TRUE(fs::exists(sdk / "tools/idf.py"));
    EXPECT_TRUE(fs::exists(sdk / "components/log/log.c"));
}

TEST_F(MinifierTest, MissingSubtreeIsFatal) {
    Populate();
    fs::remove_all(sdk / "examples");

    auto res = MinifySdk(sdk);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("examples"), std::string::npos);
    // Stops at the first failure: docs is gone, later subtrees are untouched.
    EXPECT_FALSE(fs::exists(sdk / "docs"));
    EXPECT_TRUE(fs::exists(sdk / "tools/esp_app_trace"));
}

} // namespace espkit

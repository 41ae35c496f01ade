/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/batch_transfer/batch_transfer.h>

namespace kcenon::batch_transfer::test {

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(VersionTest, MajorVersionIsCorrect) {
    EXPECT_EQ(version::major, 0);
}

TEST_F(VersionTest, MinorVersionIsCorrect) {
    EXPECT_EQ(version::minor, 1);
}

TEST_F(VersionTest, PatchVersionIsCorrect) {
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

}  // namespace kcenon::batch_transfer::test

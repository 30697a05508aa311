#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace pos {
namespace utl {

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  std::string hash = sha256("");
  EXPECT_EQ(hash, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  std::string hash = sha256("hello world");
  EXPECT_EQ(hash, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, DifferentInputsProduceDifferentHashes) {
  EXPECT_NE(sha256("test1"), sha256("test2"));
}

TEST(Sha256Test, OutputIsHexadecimal64Characters) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexTest, EncodeIsLowercaseTwoCharsPerByte) {
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xab\xff", 4)), "000fabff");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(HexTest, IsHexChecksCharactersAndLength) {
  EXPECT_TRUE(isHex("00ffAB"));
  EXPECT_TRUE(isHex("abcd", 4));
  EXPECT_FALSE(isHex("abcd", 6));
  EXPECT_FALSE(isHex(""));
  EXPECT_FALSE(isHex("12g4"));
  EXPECT_FALSE(isHex("0x12"));
}

TEST(RoundToTest, RoundsToDecimals) {
  EXPECT_DOUBLE_EQ(roundTo(3.14159, 4), 3.1416);
  EXPECT_DOUBLE_EQ(roundTo(2.5, 0), 3.0);
  EXPECT_DOUBLE_EQ(roundTo(0.1, 4), 0.1);
}

TEST(TailTest, ReturnsLastCharacters) {
  EXPECT_EQ(tail("0x1234567890", 6), "567890");
  EXPECT_EQ(tail("abc", 6), "abc");
  EXPECT_EQ(tail("", 3), "");
}

TEST(TimeTest, TimestampIsMonotonicWithinRun) {
  double first = getCurrentTimestamp();
  double second = getCurrentTimestamp();
  EXPECT_GT(first, 1.6e9);
  EXPECT_GE(second, first);
}

TEST(TimeTest, FormatTimestampIsIso) {
  std::string formatted = formatTimestamp(1700000000.25);
  // Local time zone varies; check shape only
  ASSERT_EQ(formatted.size(), 26u);
  EXPECT_EQ(formatted[4], '-');
  EXPECT_EQ(formatted[10], 'T');
  EXPECT_EQ(formatted.substr(19), ".250000");

  EXPECT_EQ(formatTimestamp(1700000000.0).size(), 19u);
}

class FileUtilitiesTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto micros = static_cast<int64_t>(getCurrentTimestamp() * 1e6);
    testDir_ = std::filesystem::temp_directory_path() /
               ("pos_utl_test_" + std::to_string(micros) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(testDir_);
    std::filesystem::create_directories(testDir_);
  }

  void TearDown() override { std::filesystem::remove_all(testDir_); }

  std::filesystem::path testDir_;
};

TEST_F(FileUtilitiesTest, LoadJsonFileMissing) {
  auto result = loadJsonFile((testDir_ / "missing.json").string());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
}

TEST_F(FileUtilitiesTest, LoadJsonFileParseError) {
  std::string path = (testDir_ / "broken.json").string();
  std::ofstream(path) << "{ not json";
  auto result = loadJsonFile(path);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);
}

TEST_F(FileUtilitiesTest, WriteThenLoad) {
  std::string path = (testDir_ / "nested" / "config.json").string();
  auto written = writeToNewFile(path, R"({"batchSize": 3})");
  ASSERT_TRUE(written.isOk()) << written.error().message;

  auto loaded = loadJsonFile(path);
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(loaded.value()["batchSize"].get<int>(), 3);
}

TEST_F(FileUtilitiesTest, WriteRefusesExistingFile) {
  std::string path = (testDir_ / "existing.json").string();
  ASSERT_TRUE(writeToNewFile(path, "{}").isOk());

  auto second = writeToNewFile(path, "{\"x\":1}");
  ASSERT_TRUE(second.isError());
  EXPECT_EQ(second.error().code, 1);

  auto loaded = loadJsonFile(path);
  ASSERT_TRUE(loaded.isOk());
  EXPECT_TRUE(loaded.value().empty());
}

} // namespace utl
} // namespace pos

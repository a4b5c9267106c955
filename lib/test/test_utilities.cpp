#include "../Utilities.h"
#include "../BinaryPack.hpp"
#include <gtest/gtest.h>

#include <filesystem>

namespace ws {
namespace utl {

TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsHexadecimal64Characters) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexEncodeTest, EncodesBytes) {
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xff", 3)), "000fff");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(ParseUInt64Test, AcceptsDigitsOnly) {
  uint64_t value = 0;
  EXPECT_TRUE(parseUInt64("18446744073709551615", value));
  EXPECT_EQ(value, UINT64_MAX);
  EXPECT_FALSE(parseUInt64("12a", value));
  EXPECT_FALSE(parseUInt64("", value));
  EXPECT_FALSE(parseUInt64("18446744073709551616", value));
}

TEST(JoinTest, JoinsWithDelimiter) {
  EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
  EXPECT_EQ(join({}, ","), "");
}

TEST(BinaryPackTest, PacksBigEndian) {
  EXPECT_EQ(binaryPack(uint32_t(0x01020304)), std::string("\x01\x02\x03\x04", 4));
  EXPECT_EQ(binaryPack(std::string("ab")),
            std::string("\x00\x00\x00\x00\x00\x00\x00\x02" "ab", 10));
}

TEST(JsonFileTest, MissingFileIsError) {
  auto result = loadJsonFile("/nonexistent/ws-sync/config.json");
  ASSERT_TRUE(result.isError());
  EXPECT_NE(result.error().message.find("not found"), std::string::npos);
}

TEST(JsonFileTest, WriteThenLoad) {
  auto dir = std::filesystem::temp_directory_path() / "ws_sync_utilities_test";
  std::filesystem::remove_all(dir);
  std::string path = (dir / "nested" / "config.json").string();

  ASSERT_TRUE(writeToFile(path, "{\"slotsPerEpoch\": 10}").isOk());
  auto result = loadJsonFile(path);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().value("slotsPerEpoch", 0), 10);

  std::filesystem::remove_all(dir);
}

TEST(JsonFileTest, InvalidJsonIsError) {
  auto dir = std::filesystem::temp_directory_path() / "ws_sync_utilities_bad";
  std::filesystem::remove_all(dir);
  std::string path = (dir / "bad.json").string();

  ASSERT_TRUE(writeToFile(path, "{ not json").isOk());
  EXPECT_TRUE(loadJsonFile(path).isError());

  std::filesystem::remove_all(dir);
}

} // namespace utl
} // namespace ws

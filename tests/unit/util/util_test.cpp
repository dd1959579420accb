#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>

#include "docu_core/util/hashing.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

TEST(HashingTest, Sha256Hex_KnownDigests) {
  EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashingTest, GenerateUuid4_IsVersion4AndUnique) {
  static const std::regex uuid_regex(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    auto id = generate_uuid4();
    EXPECT_TRUE(std::regex_match(id, uuid_regex)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(TextUtilTest, SplitAndCountWords) {
  EXPECT_THAT(split_words("  one\ttwo\n three  "), ::testing::ElementsAre("one", "two", "three"));
  EXPECT_EQ(count_words("  one\ttwo\n three  "), 3u);
  EXPECT_EQ(count_words(""), 0u);
  EXPECT_TRUE(split_words(" \n ").empty());
}

TEST(TextUtilTest, TrimAndBlank) {
  EXPECT_EQ(trim("\t padded \n"), "padded");
  EXPECT_EQ(trim("   "), "");
  EXPECT_TRUE(is_blank(" \r\n\t"));
  EXPECT_FALSE(is_blank(" x "));
}

TEST(TextUtilTest, Join) {
  EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
  EXPECT_EQ(join({}, ", "), "");
  EXPECT_EQ(join({"solo"}, "; "), "solo");
}

TEST(TextUtilTest, Utf8LengthAndPrefix) {
  const std::string text = "héllo wörld";

  EXPECT_EQ(utf8_length(text), 11u);
  EXPECT_EQ(utf8_prefix(text, 2), "hé");
  EXPECT_EQ(utf8_prefix(text, 100), text);
  EXPECT_EQ(utf8_prefix(text, 0), "");
}

}  // namespace docu_core

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "chunkwise_core/utils/text_utils.hpp"
#include "chunkwise_core/utils/uuid.hpp"

namespace chunkwise_core {

TEST(TextUtilsTest, TrimAndBlank) {
  EXPECT_EQ(text_utils::trim("  hello \n\t"), "hello");
  EXPECT_EQ(text_utils::trim("   "), "");
  EXPECT_TRUE(text_utils::is_blank(""));
  EXPECT_TRUE(text_utils::is_blank(" \r\n\t"));
  EXPECT_FALSE(text_utils::is_blank(" x "));
}

TEST(TextUtilsTest, ToLower) {
  EXPECT_EQ(text_utils::to_lower("ReadMe.MD"), "readme.md");
}

TEST(TextUtilsTest, InvalidUtf8IsReplaced) {
  const std::string valid = "caf\xC3\xA9";
  EXPECT_EQ(text_utils::ensure_valid_utf8(valid), valid);

  std::string repaired = text_utils::ensure_valid_utf8("ab\xFF" "cd");
  EXPECT_EQ(repaired, "ab\xEF\xBF\xBD" "cd");
}

TEST(TextUtilsTest, CodePointOffsets) {
  std::vector<size_t> offsets = text_utils::code_point_offsets("a\xC3\xA9z");

  EXPECT_EQ(offsets, (std::vector<size_t>{0, 1, 3, 4}));
  EXPECT_EQ(text_utils::code_point_offsets(""), (std::vector<size_t>{0}));
}

TEST(TextUtilsTest, Utf8PrefixLengthStopsOnBoundary) {
  const std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9";  // three two-byte characters

  EXPECT_EQ(text_utils::utf8_prefix_length(text, 6), 6u);
  EXPECT_EQ(text_utils::utf8_prefix_length(text, 5), 4u);
  EXPECT_EQ(text_utils::utf8_prefix_length(text, 3), 2u);
  // Always advances by at least one code point
  EXPECT_EQ(text_utils::utf8_prefix_length(text, 1), 2u);
}

TEST(TextUtilsTest, SplitAndJoinLines) {
  std::vector<std::string> lines = text_utils::split_lines("a\n\nb\n");

  EXPECT_EQ(lines, (std::vector<std::string>{"a", "", "b", ""}));
  EXPECT_EQ(text_utils::join_lines(lines), "a\n\nb\n");
}

TEST(UuidTest, GeneratesVersionFourUuids) {
  std::string first = generate_uuid_v4();
  std::string second = generate_uuid_v4();

  ASSERT_EQ(first.size(), 36u);
  EXPECT_EQ(first[8], '-');
  EXPECT_EQ(first[13], '-');
  EXPECT_EQ(first[14], '4');
  EXPECT_EQ(first[18], '-');
  EXPECT_EQ(first[23], '-');
  EXPECT_NE(std::string("89ab").find(first[19]), std::string::npos);
  EXPECT_NE(first, second);
}

}  // namespace chunkwise_core

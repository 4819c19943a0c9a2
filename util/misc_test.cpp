#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "/usr/local/bin:/usr/bin:/bin";
  auto pieces = util::split(str, ':');
  EXPECT_THAT(pieces,
              ElementsAreArray({"/usr/local/bin", "/usr/bin", "/bin"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "  wow  much lol  ";
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, ElementsAreArray({"wow", "much", "lol"}));
}

/*
 * Text
 */

// NOLINTNEXTLINE
TEST(Misc, IsBlank) {
  EXPECT_TRUE(util::isBlank(""));
  EXPECT_TRUE(util::isBlank(" \n\t\r "));
  EXPECT_FALSE(util::isBlank("  print(1)  "));
}

// NOLINTNEXTLINE
TEST(Misc, ParseInt) {
  int32_t x = 0;
  EXPECT_TRUE(util::parseInt("8888", &x));
  EXPECT_EQ(x, 8888);
  EXPECT_TRUE(util::parseInt("-3", &x));
  EXPECT_EQ(x, -3);
  EXPECT_FALSE(util::parseInt("", &x));
  EXPECT_FALSE(util::parseInt("88x", &x));
  EXPECT_FALSE(util::parseInt("99999999999", &x));
}

// NOLINTNEXTLINE
TEST(Misc, ValidUtf8Untouched) {
  std::string text = "h\xC3\xA9llo \xE2\x82\xAC";
  EXPECT_EQ(util::toValidUtf8(text), text);
}

// NOLINTNEXTLINE
TEST(Misc, InvalidUtf8Replaced) {
  std::string text = "ab\xFF" "cd";
  EXPECT_EQ(util::toValidUtf8(text), "ab\xEF\xBF\xBD" "cd");
}

// NOLINTNEXTLINE
TEST(Misc, TruncateUtf8Ascii) {
  std::string text(100, 'x');
  util::truncateUtf8(&text, 42);
  EXPECT_EQ(text.size(), 42);
}

// NOLINTNEXTLINE
TEST(Misc, TruncateUtf8DoesNotSplitSequences) {
  std::string text = "ab\xE2\x82\xAC";
  util::truncateUtf8(&text, 4);
  EXPECT_EQ(text, "ab");
}

// NOLINTNEXTLINE
TEST(Misc, TruncateUtf8Short) {
  std::string text = "short";
  util::truncateUtf8(&text, 42);
  EXPECT_EQ(text, "short");
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  util::setBool(&x)();
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  util::setString(&x)("wow");
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int32_t x = 0;
  util::setInt(&x)("42");
  EXPECT_EQ(x, 42);
}

// NOLINTNEXTLINE
TEST(Misc, SetIntInvalidKeepsValue) {
  int32_t x = 7;
  util::setInt(&x)("lol");
  EXPECT_EQ(x, 7);
}

}  // namespace

#include <gtest/gtest.h>
#include "psa/utils/string_utils.h"

using namespace psa::utils;

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    EXPECT_EQ(split("a.b.c", '.'), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split("a..b", '.'), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split("", '.'), (std::vector<std::string>{""}));
}

TEST(StringUtilsTest, Join) {
    EXPECT_EQ(join({"a.py", "b.py", "a.py"}, " -> "), "a.py -> b.py -> a.py");
    EXPECT_EQ(join({}, ","), "");
}

TEST(StringUtilsTest, TrimAndAffixes) {
    EXPECT_EQ(trim("  value \t\n"), "value");
    EXPECT_TRUE(starts_with("__init__", "__"));
    EXPECT_TRUE(ends_with("module.py", ".py"));
    EXPECT_FALSE(ends_with("py", ".py"));
    EXPECT_TRUE(contains("pkg/migrations/x.py", "migrations/"));
}

TEST(StringUtilsTest, ReplaceAllAndLower) {
    EXPECT_EQ(replace_all("pkg/sub/mod", "/", "."), "pkg.sub.mod");
    EXPECT_EQ(replace_all("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(to_lower("JSON"), "json");
}

TEST(StringUtilsTest, IsIdentifier) {
    EXPECT_TRUE(is_identifier("name"));
    EXPECT_TRUE(is_identifier("_private2"));
    EXPECT_TRUE(is_identifier("__init__"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("2fast"));
    EXPECT_FALSE(is_identifier("has-dash"));
    EXPECT_FALSE(is_identifier("two words"));
}

TEST(StringUtilsTest, CountLines) {
    EXPECT_EQ(count_lines(""), 0u);
    EXPECT_EQ(count_lines("x = 1"), 1u);
    EXPECT_EQ(count_lines("x = 1\n"), 1u);
    EXPECT_EQ(count_lines("x = 1\n\ny = 2"), 3u);
}

TEST(StringUtilsTest, ValidUtf8) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x90\x8D"));
    EXPECT_FALSE(is_valid_utf8("\xFF\xFE"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));          // truncated
}

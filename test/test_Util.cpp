#include "duct/Util.hpp"

#include <string>
#include <utility>

#include <gtest/gtest.h>

namespace {

using StripCase = std::pair<std::string, std::string>;
class StripTrailingNewline : public ::testing::TestWithParam<StripCase> {};

TEST_P(StripTrailingNewline, Test) {
  auto [input, expected] = GetParam();
  duct::util::strip_trailing_newline(input);
  EXPECT_EQ(input, expected);
}

INSTANTIATE_TEST_SUITE_P(
    Util,
    StripTrailingNewline,
    ::testing::Values(
        // clang-format off
        StripCase{"hi\n", "hi"},
        StripCase{"hi\r\n", "hi"},
        StripCase{"hi\n\n", "hi\n"},
        StripCase{"hi\r\n\r\n", "hi\r\n"},
        StripCase{"hi\r", "hi\r"},
        StripCase{"hi", "hi"},
        StripCase{"\n", ""},
        StripCase{"", ""} // clang-format on
    )
);

using Utf8Case = std::pair<std::string, bool>;
class IsValidUtf8 : public ::testing::TestWithParam<Utf8Case> {};

TEST_P(IsValidUtf8, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(duct::util::is_valid_utf8(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    Util,
    IsValidUtf8,
    ::testing::Values(
        // clang-format off
        Utf8Case{"", true},
        Utf8Case{"plain ascii", true},
        Utf8Case{"caf\xc3\xa9", true},
        Utf8Case{"\xe2\x82\xac", true},
        Utf8Case{"\xf0\x9f\x98\x80", true},
        Utf8Case{"\xff\xfe", false},
        Utf8Case{"\xc3", false},
        Utf8Case{"\xc0\xaf", false},
        Utf8Case{"\xed\xa0\x80", false},
        Utf8Case{"\xf4\x90\x80\x80", false},
        Utf8Case{"\x80", false} // clang-format on
    )
);

using QuoteCase = std::pair<std::string, std::string>;
class Quote : public ::testing::TestWithParam<QuoteCase> {};

TEST_P(Quote, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(duct::util::quote(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    Util,
    Quote,
    ::testing::Values(
        // clang-format off
        QuoteCase{"echo", "\"echo\""},
        QuoteCase{"", "\"\""},
        QuoteCase{"a \"b\"", "\"a \\\"b\\\"\""},
        QuoteCase{"c:\\dir", "\"c:\\\\dir\""},
        QuoteCase{"line\n", "\"line\\n\""},
        QuoteCase{std::string{"\x01", 1}, "\"\\x01\""} // clang-format on
    )
);

} // namespace

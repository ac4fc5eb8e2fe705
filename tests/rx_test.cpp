#include <gtest/gtest.h>
#include <exceptions.hpp>
#include <fmt.hpp>
#include <rx.hpp>

using caprec::NoMatchError;
using caprec::rx::CaptureSet;
using caprec::rx::Extract;

TEST(ExtractTest, KeepsDeclarationOrder) {
  re2::RE2 re{R"((?P<zeta>\w+) (?P<alpha>\w+) (?P<mid>\w+))"};
  CaptureSet captures = Extract(re, "one two three");

  EXPECT_EQ(captures.Names(),
            (std::vector<std::string>{"zeta", "alpha", "mid"}));
  EXPECT_EQ(captures.Get("zeta"), std::optional<std::string>{"one"});
  EXPECT_EQ(captures.Get("alpha"), std::optional<std::string>{"two"});
  EXPECT_EQ(captures.Get("mid"), std::optional<std::string>{"three"});
}

TEST(ExtractTest, DistinguishesAbsentFromEmpty) {
  re2::RE2 re{R"((?P<foo>x)?(?P<bar>y*)z)"};
  CaptureSet captures = Extract(re, "z");

  ASSERT_EQ(captures.Size(), 2u);
  EXPECT_EQ(captures.Names(), (std::vector<std::string>{"foo", "bar"}));
  EXPECT_FALSE(captures.Get("foo").has_value());
  ASSERT_TRUE(captures.Get("bar").has_value());
  EXPECT_EQ(*captures.Get("bar"), "");
}

TEST(ExtractTest, UnmatchedAlternativeIsAbsent) {
  re2::RE2 re{R"((?P<foo>\d+) (?:(?P<bar>true|false)|none))"};
  CaptureSet captures = Extract(re, "12 none");

  EXPECT_EQ(captures.Get("foo"), std::optional<std::string>{"12"});
  EXPECT_FALSE(captures.Get("bar").has_value());
}

TEST(ExtractTest, SearchesWithoutImplicitAnchors) {
  re2::RE2 re{R"((?P<n>\d+))"};
  EXPECT_EQ(Extract(re, "abc 42 def").Get("n"),
            std::optional<std::string>{"42"});

  re2::RE2 anchored{R"(^(?P<n>\d+)$)"};
  EXPECT_THROW(Extract(anchored, "abc 42 def"), NoMatchError);
}

TEST(ExtractTest, IgnoresUnnamedGroups) {
  re2::RE2 re{R"((\w+) (?P<x>\w+))"};
  CaptureSet captures = Extract(re, "a b");

  EXPECT_EQ(captures.Names(), std::vector<std::string>{"x"});
  EXPECT_EQ(captures.Get("x"), std::optional<std::string>{"b"});
}

TEST(ExtractTest, NoMatchCarriesPatternAndExcerpt) {
  re2::RE2 re{R"(^(?P<n>\d+)$)"};
  std::string input(100, 'a');
  try {
    Extract(re, input);
    FAIL() << "expected NoMatchError";
  } catch (const NoMatchError &e) {
    EXPECT_EQ(e.Pattern(), re.pattern());
    EXPECT_EQ(e.InputExcerpt(), std::string(64, 'a') + "...");
  }
}

TEST(ExtractTest, ExcerptKeepsMultiByteCharactersWhole) {
  re2::RE2 re{R"(^(?P<n>\d+)$)"};
  // 63 ASCII bytes, then a two-byte character straddling the 64 byte bound
  std::string input = std::string(63, 'a') + "\xc3\xa9" + "tail";
  try {
    Extract(re, input);
    FAIL() << "expected NoMatchError";
  } catch (const NoMatchError &e) {
    EXPECT_EQ(e.InputExcerpt(), std::string(63, 'a') + "...");
  }

  EXPECT_EQ(caprec::Excerpt("\xe2\x82\xac\xe2\x82\xac", 4),
            "\xe2\x82\xac...");
  EXPECT_EQ(caprec::Excerpt("\xe2\x82\xac\xe2\x82\xac", 6),
            "\xe2\x82\xac\xe2\x82\xac");
}

TEST(ExtractTest, LookupOfUndeclaredNameIsAbsent) {
  re2::RE2 re{R"((?P<n>\d+))"};
  CaptureSet captures = Extract(re, "7");

  EXPECT_FALSE(captures.Get("other").has_value());
}

TEST(IsMatchTest, MatchesAnywhere) {
  re2::RE2 re{R"((?P<n>\d+))"};
  EXPECT_TRUE(caprec::rx::IsMatch(re, "x 1 y"));
  EXPECT_FALSE(caprec::rx::IsMatch(re, "x y"));
}

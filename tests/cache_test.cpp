#include <gtest/gtest.h>
#include <cache.hpp>
#include <exceptions.hpp>
#include <thread>
#include <vector>

using caprec::CompileError;
using caprec::cache::CompiledPattern;
using caprec::cache::PatternCache;

TEST(PatternCacheTest, CompilesEachTextOnce) {
  PatternCache cache;
  auto first = cache.CompileOrGet(R"((?P<foo>\d+))");
  auto second = cache.CompileOrGet(R"((?P<foo>\d+))");

  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(cache.Size(), 1u);
  EXPECT_TRUE(cache.Contains(R"((?P<foo>\d+))"));
}

TEST(PatternCacheTest, KeysOnExactText) {
  PatternCache cache;
  auto plain = cache.CompileOrGet("(?P<word>abc)");
  auto folded = cache.CompileOrGet("(?i)(?P<word>abc)");

  EXPECT_NE(plain.get(), folded.get());
  EXPECT_EQ(cache.Size(), 2u);
  EXPECT_FALSE(re2::RE2::PartialMatch("ABC", *plain));
  EXPECT_TRUE(re2::RE2::PartialMatch("ABC", *folded));
}

TEST(PatternCacheTest, MalformedPatternIsNotCached) {
  PatternCache cache;
  std::string reason;
  try {
    cache.CompileOrGet("(?P<foo>\\d+");
    FAIL() << "expected CompileError";
  } catch (const CompileError &e) {
    EXPECT_EQ(e.Pattern(), "(?P<foo>\\d+");
    EXPECT_FALSE(e.Reason().empty());
    reason = e.Reason();
  }

  EXPECT_FALSE(cache.Contains("(?P<foo>\\d+"));
  EXPECT_EQ(cache.Size(), 0u);

  try {
    cache.CompileOrGet("(?P<foo>\\d+");
    FAIL() << "expected CompileError";
  } catch (const CompileError &e) {
    EXPECT_EQ(e.Reason(), reason);
  }
}

TEST(PatternCacheTest, ConcurrentFirstUseSharesOneCompiledPattern) {
  PatternCache cache;
  const std::string pattern{R"((?P<host>\S+) (?P<code>\d{3}))"};
  std::vector<CompiledPattern> results(16);
  std::vector<std::thread> threads;

  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&cache, &pattern, &results, i] {
      results[i] = cache.CompileOrGet(pattern);
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  for (const auto &re : results) {
    ASSERT_NE(re, nullptr);
    EXPECT_EQ(re.get(), results.front().get());
  }
  EXPECT_EQ(cache.Size(), 1u);
}

TEST(PatternCacheTest, CachesAreIsolated) {
  PatternCache one;
  PatternCache two;
  one.CompileOrGet("(?P<x>x)");

  EXPECT_TRUE(one.Contains("(?P<x>x)"));
  EXPECT_FALSE(two.Contains("(?P<x>x)"));
}

TEST(PatternCacheTest, DefaultCacheIsProcessWide) {
  EXPECT_EQ(&caprec::cache::DefaultPatternCache(),
            &caprec::cache::DefaultPatternCache());
}

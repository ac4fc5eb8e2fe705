#pragma once

#include <re2/re2.h>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace caprec::cache {

typedef std::shared_ptr<const re2::RE2> CompiledPattern;

/// Compiles each distinct pattern text once and hands the compiled form to
/// every later caller. Entries live as long as the cache; there is no
/// eviction. Safe for concurrent use.
class PatternCache {
 public:
  PatternCache() = default;

  PatternCache(const PatternCache &) = delete;

  void operator=(const PatternCache &) = delete;

  /// Returns the compiled form of `pattern`, compiling it on first use.
  /// Throws CompileError for a malformed pattern, which is not cached.
  CompiledPattern CompileOrGet(const std::string &pattern);

  bool Contains(const std::string &pattern) const;

  unsigned long Size() const;

 private:
  CompiledPattern Lookup(const std::string &pattern) const;

  mutable std::shared_mutex mutex_{};
  std::unordered_map<std::string, CompiledPattern> patterns_{};
};

// process-wide cache, created on first use and never torn down
PatternCache &DefaultPatternCache();
}  // namespace caprec::cache

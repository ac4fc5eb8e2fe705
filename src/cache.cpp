#include <cache.hpp>
#include <exceptions.hpp>
#include <logger.hpp>
#include <mutex>

using caprec::cache::CompiledPattern;
using caprec::cache::PatternCache;

namespace {
CompiledPattern Compile(const std::string &pattern) {
  re2::RE2::Options options;
  // failures are reported through CompileError, not RE2's own logging
  options.set_log_errors(false);

  auto re = std::make_shared<const re2::RE2>(pattern, options);
  if (!re->ok()) {
    std::string reason{re->error()};
    if (!re->error_arg().empty()) {
      reason += caprec::Sprintf(" at '%s'", re->error_arg().c_str());
    }
    caprec::logger::error() << "pattern '" << pattern
                            << "' failed to compile: " << reason << std::endl;
    throw caprec::CompileError(pattern, reason);
  }

  caprec::logger::debug() << "compiled pattern '" << pattern << "' ("
                          << re->NumberOfCapturingGroups() << " groups)"
                          << std::endl;
  return re;
}
}  // namespace

CompiledPattern PatternCache::Lookup(const std::string &pattern) const {
  auto it = patterns_.find(pattern);
  return it == patterns_.end() ? nullptr : it->second;
}

CompiledPattern PatternCache::CompileOrGet(const std::string &pattern) {
  {
    std::shared_lock<std::shared_mutex> lock{mutex_};
    if (auto re = Lookup(pattern)) {
      return re;
    }
  }

  std::unique_lock<std::shared_mutex> lock{mutex_};
  // another caller may have compiled it while we waited for the lock
  if (auto re = Lookup(pattern)) {
    return re;
  }

  auto re = Compile(pattern);
  patterns_.emplace(pattern, re);
  return re;
}

bool PatternCache::Contains(const std::string &pattern) const {
  std::shared_lock<std::shared_mutex> lock{mutex_};
  return patterns_.find(pattern) != patterns_.end();
}

unsigned long PatternCache::Size() const {
  std::shared_lock<std::shared_mutex> lock{mutex_};
  return patterns_.size();
}

PatternCache &caprec::cache::DefaultPatternCache() {
  static PatternCache cache;
  return cache;
}

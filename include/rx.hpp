#pragma once

#include <re2/re2.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace caprec::rx {

/// Named groups of one match in pattern declaration order. A group that did
/// not take part in the match is absent; one that matched nothing holds an
/// empty string.
class CaptureSet {
 private:
  typedef std::vector<std::pair<std::string, std::optional<std::string>>>
      Collection;

  Collection groups_{};

 public:
  typedef Collection::const_iterator const_iterator;

  CaptureSet() = default;

  void Add(std::string name, std::optional<std::string> text);

  std::vector<std::string> Names() const;

  std::optional<std::string> Get(const std::string &name) const;

  unsigned long Size() const { return groups_.size(); }

  const_iterator begin() const { return groups_.cbegin(); }

  const_iterator end() const { return groups_.cend(); }
};

/// Searches `input` for the first match of `rx` and collects its named
/// groups. Throws NoMatchError when nothing matches.
CaptureSet Extract(const re2::RE2 &rx, const std::string &input);

bool IsMatch(const re2::RE2 &rx, const std::string &input);
}  // namespace caprec::rx

#include <exceptions.hpp>
#include <rx.hpp>

using caprec::rx::CaptureSet;

void CaptureSet::Add(std::string name, std::optional<std::string> text) {
  groups_.emplace_back(std::move(name), std::move(text));
}

std::vector<std::string> CaptureSet::Names() const {
  std::vector<std::string> names;
  names.reserve(groups_.size());
  for (const auto &kv : groups_) {
    names.emplace_back(kv.first);
  }
  return names;
}

std::optional<std::string> CaptureSet::Get(const std::string &name) const {
  for (const auto &kv : groups_) {
    if (kv.first == name) {
      return kv.second;
    }
  }
  return std::nullopt;
}

CaptureSet caprec::rx::Extract(const re2::RE2 &rx, const std::string &input) {
  int ngroups{rx.NumberOfCapturingGroups()};
  if (ngroups < 0) {
    throw CompileError(rx.pattern(), rx.error());
  }

  // slot 0 holds the overall match
  std::vector<re2::StringPiece> groups(static_cast<size_t>(ngroups) + 1);
  bool matched = rx.Match(input, 0, input.size(), re2::RE2::UNANCHORED,
                          groups.data(), ngroups + 1);
  if (!matched) {
    throw NoMatchError(rx.pattern(), input);
  }

  // keyed by group index, which is declaration order
  CaptureSet captures;
  for (auto &&kv : rx.CapturingGroupNames()) {
    const re2::StringPiece &group = groups[kv.first];
    if (group.data() == nullptr) {
      captures.Add(kv.second, std::nullopt);
      continue;
    }
    captures.Add(kv.second, std::string(group.data(), group.size()));
  }

  return captures;
}

bool caprec::rx::IsMatch(const re2::RE2 &rx, const std::string &input) {
  return re2::RE2::PartialMatch(input, rx);
}

#include <sstream>
#include <source.hpp>

using caprec::MapSource;

std::vector<std::string> MapSource::FieldNames() const {
  std::vector<std::string> names;
  names.reserve(values_.size());
  for (const auto &kv : values_) {
    names.emplace_back(kv.first);
  }
  return names;
}

std::optional<std::string> MapSource::GetScalar(const std::string &name) const {
  auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string MapSource::Input() const {
  std::ostringstream ss;
  bool first{true};
  for (const auto &kv : values_) {
    ss << (first ? "" : " ") << kv.first << "=" << kv.second;
    first = false;
  }
  return ss.str();
}

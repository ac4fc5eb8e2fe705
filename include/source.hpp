#pragma once

#include <map>
#include <optional>
#include <rx.hpp>
#include <string>
#include <utility>
#include <vector>

namespace caprec {

/// A self-describing map of raw scalar strings. The decoder reads records
/// from any source through this interface and never sees where the strings
/// came from.
class ValueSource {
 public:
  virtual ~ValueSource() = default;

  virtual std::vector<std::string> FieldNames() const = 0;

  // nullopt when the field is not present; an empty string is present
  virtual std::optional<std::string> GetScalar(
      const std::string &name) const = 0;

  // pattern or origin shown in error context
  virtual std::string Origin() const = 0;

  // text the values were taken from, shown in error context
  virtual std::string Input() const = 0;
};

class CaptureSource : public ValueSource {
 public:
  CaptureSource(rx::CaptureSet captures, std::string pattern,
                std::string input)
      : captures_{std::move(captures)},
        pattern_{std::move(pattern)},
        input_{std::move(input)} {}

  std::vector<std::string> FieldNames() const override {
    return captures_.Names();
  }

  std::optional<std::string> GetScalar(const std::string &name) const override {
    return captures_.Get(name);
  }

  std::string Origin() const override { return pattern_; }

  std::string Input() const override { return input_; }

 private:
  rx::CaptureSet captures_;
  std::string pattern_;
  std::string input_;
};

/// Plain key/value pairs, e.g. collected from a config file or environment.
class MapSource : public ValueSource {
 public:
  typedef std::map<std::string, std::string> Values;

  explicit MapSource(Values values, std::string origin = "map")
      : values_{std::move(values)}, origin_{std::move(origin)} {}

  std::vector<std::string> FieldNames() const override;

  std::optional<std::string> GetScalar(const std::string &name) const override;

  std::string Origin() const override { return origin_; }

  std::string Input() const override;

 private:
  Values values_;
  std::string origin_;
};
}  // namespace caprec

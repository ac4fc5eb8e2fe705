#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace caprec {

class Record;

/// A decoded field value. Signed and unsigned integers of every width are
/// widened to 64 bits, f32 and f64 are both held as double.
class Value {
 public:
  enum class Kind { kNone, kBool, kSigned, kUnsigned, kFloat, kString, kRecord };

  Value() = default;

  static Value None() { return Value(); }

  static Value Bool(bool b);

  static Value Signed(int64_t n);

  static Value Unsigned(uint64_t n);

  static Value Float(double d);

  static Value String(std::string s);

  static Value Nested(Record record);

  Kind GetKind() const { return static_cast<Kind>(data_.index()); }

  bool IsNone() const { return GetKind() == Kind::kNone; }

  bool AsBool() const;

  int64_t AsSigned() const;

  uint64_t AsUnsigned() const;

  double AsFloat() const;

  const std::string &AsString() const;

  const Record &AsRecord() const;

  bool operator==(const Value &other) const;

  bool operator!=(const Value &other) const { return !(*this == other); }

 private:
  // alternative order must follow Kind
  typedef std::variant<std::monostate, bool, int64_t, uint64_t, double,
                       std::string, std::shared_ptr<const Record>>
      Data;

  explicit Value(Data data) : data_{std::move(data)} {}

  Data data_{};
};

const char *KindName(Value::Kind kind);

/// The decoded record: field values in declaration order.
class Record {
 private:
  typedef std::vector<std::pair<std::string, Value>> Collection;

  std::string name_;
  Collection fields_{};

 public:
  typedef Collection::const_iterator const_iterator;

  Record() = default;

  explicit Record(std::string name) : name_{std::move(name)} {}

  const std::string &Name() const { return name_; }

  // replaces the value when the field is already set
  void Set(const std::string &field, Value value);

  bool Contains(const std::string &field) const;

  const Value &Get(const std::string &field) const;

  unsigned long Size() const { return fields_.size(); }

  bool Empty() const { return fields_.empty(); }

  const_iterator begin() const { return fields_.cbegin(); }

  const_iterator end() const { return fields_.cend(); }

  bool operator==(const Record &other) const;

  bool operator!=(const Record &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &os, const Value &value);

std::ostream &operator<<(std::ostream &os, const Record &record);
}  // namespace caprec

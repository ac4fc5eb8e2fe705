#pragma once

#include <decoder.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <shape.hpp>
#include <string>
#include <type_traits>
#include <value.hpp>
#include <vector>

namespace caprec {

/// Maps a C++ member type to its declared shape and back from a Value.
template <typename M, typename Enable = void>
struct FieldTraits;

template <>
struct FieldTraits<std::string> {
  static Shape GetShape() { return Shape::Scalar(ScalarType::kString); }
  static std::string From(const Value &value) { return value.AsString(); }
};

template <>
struct FieldTraits<bool> {
  static Shape GetShape() { return Shape::Scalar(ScalarType::kBool); }
  static bool From(const Value &value) { return value.AsBool(); }
};

template <typename M>
struct FieldTraits<M, std::enable_if_t<std::is_integral_v<M> &&
                                       std::is_signed_v<M>>> {
  static Shape GetShape() {
    switch (sizeof(M)) {
      case 1:
        return Shape::Scalar(ScalarType::kI8);
      case 2:
        return Shape::Scalar(ScalarType::kI16);
      case 4:
        return Shape::Scalar(ScalarType::kI32);
      default:
        return Shape::Scalar(ScalarType::kI64);
    }
  }
  static M From(const Value &value) {
    return static_cast<M>(value.AsSigned());
  }
};

template <typename M>
struct FieldTraits<M, std::enable_if_t<std::is_integral_v<M> &&
                                       std::is_unsigned_v<M> &&
                                       !std::is_same_v<M, bool>>> {
  static Shape GetShape() {
    switch (sizeof(M)) {
      case 1:
        return Shape::Scalar(ScalarType::kU8);
      case 2:
        return Shape::Scalar(ScalarType::kU16);
      case 4:
        return Shape::Scalar(ScalarType::kU32);
      default:
        return Shape::Scalar(ScalarType::kU64);
    }
  }
  static M From(const Value &value) {
    return static_cast<M>(value.AsUnsigned());
  }
};

template <>
struct FieldTraits<float> {
  static Shape GetShape() { return Shape::Scalar(ScalarType::kF32); }
  static float From(const Value &value) {
    return static_cast<float>(value.AsFloat());
  }
};

template <>
struct FieldTraits<double> {
  static Shape GetShape() { return Shape::Scalar(ScalarType::kF64); }
  static double From(const Value &value) { return value.AsFloat(); }
};

template <typename M>
struct FieldTraits<std::optional<M>> {
  static Shape GetShape() {
    return Shape::Optional(FieldTraits<M>::GetShape());
  }
  static std::optional<M> From(const Value &value) {
    if (value.IsNone()) {
      return std::nullopt;
    }
    return FieldTraits<M>::From(value);
  }
};

/// Binds the members of a default constructible struct to the named groups
/// of a pattern, e.g.
///
///   static const auto binding = caprec::Binding<LogEntry>(
///       "LogEntry", R"((?P<foo>\d+)\s+(?P<bar>true|false)\s+(?P<baz>\S+))")
///       .Field("foo", &LogEntry::foo)
///       .Field("bar", &LogEntry::bar)
///       .Field("baz", &LogEntry::baz);
///   LogEntry entry = binding.Parse("1 true hello");
///
/// Nested structs are bound with their own Binding, which must be complete
/// before it is passed in.
template <typename T>
class Binding {
 public:
  typedef std::function<void(T *, const Record &)> Setter;

  Binding(std::string name, std::string pattern)
      : builder_{std::move(name), std::move(pattern)},
        schema_{builder_.Build()} {}

  template <typename M>
  Binding &Field(const std::string &name, M T::*member) {
    builder_.Field(name, FieldTraits<M>::GetShape());
    return Bind(name, [member, name](T *target, const Record &record) {
      target->*member = FieldTraits<M>::From(record.Get(name));
    });
  }

  template <typename M>
  Binding &Field(const std::string &name, M T::*member,
                 const Binding<M> &nested) {
    builder_.Field(name, Shape::Struct(nested.SchemaPtr()));
    return Bind(name, [member, name, nested](T *target, const Record &record) {
      target->*member = nested.FromRecord(record.Get(name).AsRecord());
    });
  }

  template <typename M>
  Binding &Field(const std::string &name, std::optional<M> T::*member,
                 const Binding<M> &nested) {
    builder_.Optional(name, Shape::Struct(nested.SchemaPtr()));
    return Bind(name, [member, name, nested](T *target, const Record &record) {
      const Value &value = record.Get(name);
      if (value.IsNone()) {
        target->*member = std::nullopt;
        return;
      }
      target->*member = nested.FromRecord(value.AsRecord());
    });
  }

  // reads the last bound field from another capture group
  Binding &From(const std::string &capture) {
    builder_.From(capture);
    schema_ = builder_.Build();
    return *this;
  }

  // value of the last bound field when its group did not participate
  Binding &Default(Value value) {
    builder_.Default(std::move(value));
    schema_ = builder_.Build();
    return *this;
  }

  const Schema &GetSchema() const { return *schema_; }

  std::shared_ptr<const Schema> SchemaPtr() const { return schema_; }

  T FromRecord(const Record &record) const {
    T target{};
    for (const Setter &setter : setters_) {
      setter(&target, record);
    }
    return target;
  }

  T Parse(const std::string &text, const Decoder &decoder = Decoder()) const {
    return FromRecord(decoder.Decode(*schema_, text));
  }

  bool IsMatch(const std::string &text,
               const Decoder &decoder = Decoder()) const {
    return decoder.IsMatch(*schema_, text);
  }

 private:
  Binding &Bind(const std::string &name, Setter setter) {
    setters_.emplace_back(std::move(setter));
    schema_ = builder_.Build();
    return *this;
  }

  Schema::Builder builder_;
  std::shared_ptr<const Schema> schema_;
  std::vector<Setter> setters_{};
};
}  // namespace caprec

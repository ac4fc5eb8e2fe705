#pragma once

#include <memory>
#include <optional>
#include <string>
#include <value.hpp>
#include <vector>

namespace caprec {

enum class ScalarType {
  kString,
  kBool,
  kI8,
  kI16,
  kI32,
  kI64,
  kU8,
  kU16,
  kU32,
  kU64,
  kF32,
  kF64
};

const char *ScalarTypeName(ScalarType type);

// accepts the names ScalarTypeName() produces
bool ParseScalarType(const std::string &name, ScalarType *type);

class Schema;

/// Declared shape of a field: a scalar, an optional wrapping another shape,
/// or a nested record parsed with its own schema.
class Shape {
 public:
  enum class Kind { kScalar, kOptional, kStruct };

  Shape() = default;

  static Shape Scalar(ScalarType type);

  static Shape Optional(Shape inner);

  static Shape Struct(std::shared_ptr<const Schema> schema);

  Kind GetKind() const { return kind_; }

  bool IsOptional() const { return kind_ == Kind::kOptional; }

  ScalarType Type() const;

  const Shape &Inner() const;

  const Schema &Nested() const;

  std::string Name() const;

  // whether `value` is a decoded value of this shape, integer ranges and
  // nested record names included
  bool Admits(const Value &value) const;

 private:
  Kind kind_{Kind::kScalar};
  ScalarType type_{ScalarType::kString};
  std::shared_ptr<const Shape> inner_{};
  std::shared_ptr<const Schema> schema_{};
};

struct FieldSpec {
  std::string name;
  Shape shape;
  // capture group to read, empty means the field name
  std::string capture{};
  // used when the capture group did not participate
  std::optional<Value> fallback{};

  const std::string &CaptureName() const {
    return capture.empty() ? name : capture;
  }
};

/// A target record: its name, the pattern it is parsed with and the fields
/// in declaration order.
class Schema {
 public:
  class Builder {
   public:
    Builder(std::string name, std::string pattern);

    Builder &Field(FieldSpec spec);

    Builder &Field(const std::string &name, Shape shape);

    Builder &Field(const std::string &name, ScalarType type);

    Builder &Optional(const std::string &name, Shape inner);

    Builder &Optional(const std::string &name, ScalarType type);

    // the following modify the most recently added field
    Builder &From(const std::string &capture);

    // throws CaprecError when the value does not fit the field's shape
    Builder &Default(Value value);

    std::shared_ptr<const Schema> Build() const;

   private:
    FieldSpec &Last();

    std::string name_;
    std::string pattern_;
    std::vector<FieldSpec> fields_{};
  };

  Schema(std::string name, std::string pattern, std::vector<FieldSpec> fields);

  const std::string &Name() const { return name_; }

  const std::string &Pattern() const { return pattern_; }

  const std::vector<FieldSpec> &Fields() const { return fields_; }

  const FieldSpec *Find(const std::string &field) const;

 private:
  std::string name_;
  std::string pattern_;
  std::vector<FieldSpec> fields_;
};
}  // namespace caprec

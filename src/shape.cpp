#include <cfloat>
#include <cmath>
#include <cstdint>
#include <exceptions.hpp>
#include <shape.hpp>
#include <unordered_map>
#include <unordered_set>

using caprec::FieldSpec;
using caprec::ScalarType;
using caprec::Schema;
using caprec::Shape;
using caprec::Value;

namespace {

bool SignedFits(const Value &value, int64_t min, int64_t max) {
  if (value.GetKind() != Value::Kind::kSigned) {
    return false;
  }
  return value.AsSigned() >= min && value.AsSigned() <= max;
}

bool UnsignedFits(const Value &value, uint64_t max) {
  if (value.GetKind() != Value::Kind::kUnsigned) {
    return false;
  }
  return value.AsUnsigned() <= max;
}

bool ScalarFits(const Value &value, ScalarType type) {
  switch (type) {
    case ScalarType::kString:
      return value.GetKind() == Value::Kind::kString;
    case ScalarType::kBool:
      return value.GetKind() == Value::Kind::kBool;
    case ScalarType::kI8:
      return SignedFits(value, INT8_MIN, INT8_MAX);
    case ScalarType::kI16:
      return SignedFits(value, INT16_MIN, INT16_MAX);
    case ScalarType::kI32:
      return SignedFits(value, INT32_MIN, INT32_MAX);
    case ScalarType::kI64:
      return SignedFits(value, INT64_MIN, INT64_MAX);
    case ScalarType::kU8:
      return UnsignedFits(value, UINT8_MAX);
    case ScalarType::kU16:
      return UnsignedFits(value, UINT16_MAX);
    case ScalarType::kU32:
      return UnsignedFits(value, UINT32_MAX);
    case ScalarType::kU64:
      return UnsignedFits(value, UINT64_MAX);
    case ScalarType::kF32:
      // inf and nan are valid f32 values, finite doubles must not overflow
      return value.GetKind() == Value::Kind::kFloat &&
             (!std::isfinite(value.AsFloat()) ||
              std::fabs(value.AsFloat()) <= FLT_MAX);
    case ScalarType::kF64:
      return value.GetKind() == Value::Kind::kFloat;
  }
  return false;
}

void CheckDefault(const std::string &record, const FieldSpec &spec) {
  if (spec.fallback && !spec.shape.Admits(*spec.fallback)) {
    throw caprec::CaprecError(
        "record '%s': default (%s) of field '%s' is not a valid %s",
        record.c_str(), caprec::KindName(spec.fallback->GetKind()),
        spec.name.c_str(), spec.shape.Name().c_str());
  }
}
}  // namespace

const char *caprec::ScalarTypeName(ScalarType type) {
  switch (type) {
    case ScalarType::kString:
      return "string";
    case ScalarType::kBool:
      return "bool";
    case ScalarType::kI8:
      return "i8";
    case ScalarType::kI16:
      return "i16";
    case ScalarType::kI32:
      return "i32";
    case ScalarType::kI64:
      return "i64";
    case ScalarType::kU8:
      return "u8";
    case ScalarType::kU16:
      return "u16";
    case ScalarType::kU32:
      return "u32";
    case ScalarType::kU64:
      return "u64";
    case ScalarType::kF32:
      return "f32";
    case ScalarType::kF64:
      return "f64";
  }
  return "unknown";
}

bool caprec::ParseScalarType(const std::string &name, ScalarType *type) {
  static const std::unordered_map<std::string, ScalarType> types{
      {"string", ScalarType::kString}, {"bool", ScalarType::kBool},
      {"i8", ScalarType::kI8},         {"i16", ScalarType::kI16},
      {"i32", ScalarType::kI32},       {"i64", ScalarType::kI64},
      {"u8", ScalarType::kU8},         {"u16", ScalarType::kU16},
      {"u32", ScalarType::kU32},       {"u64", ScalarType::kU64},
      {"f32", ScalarType::kF32},       {"f64", ScalarType::kF64}};

  auto it = types.find(name);
  if (it == types.end()) {
    return false;
  }
  *type = it->second;
  return true;
}

Shape Shape::Scalar(ScalarType type) {
  Shape shape;
  shape.kind_ = Kind::kScalar;
  shape.type_ = type;
  return shape;
}

Shape Shape::Optional(Shape inner) {
  if (inner.IsOptional()) {
    throw CaprecError("optional of optional is not supported");
  }
  Shape shape;
  shape.kind_ = Kind::kOptional;
  shape.inner_ = std::make_shared<const Shape>(std::move(inner));
  return shape;
}

Shape Shape::Struct(std::shared_ptr<const Schema> schema) {
  if (!schema) {
    throw CaprecError("nested shape needs a schema");
  }
  Shape shape;
  shape.kind_ = Kind::kStruct;
  shape.schema_ = std::move(schema);
  return shape;
}

ScalarType Shape::Type() const {
  if (kind_ != Kind::kScalar) {
    throw CaprecError("shape '%s' is not a scalar", Name().c_str());
  }
  return type_;
}

const Shape &Shape::Inner() const {
  if (kind_ != Kind::kOptional) {
    throw CaprecError("shape '%s' is not optional", Name().c_str());
  }
  return *inner_;
}

const Schema &Shape::Nested() const {
  if (kind_ != Kind::kStruct) {
    throw CaprecError("shape '%s' is not a record", Name().c_str());
  }
  return *schema_;
}

std::string Shape::Name() const {
  switch (kind_) {
    case Kind::kScalar:
      return ScalarTypeName(type_);
    case Kind::kOptional:
      return "?" + inner_->Name();
    case Kind::kStruct:
      return "record " + schema_->Name();
  }
  return "unknown";
}

bool Shape::Admits(const Value &value) const {
  switch (kind_) {
    case Kind::kScalar:
      return ScalarFits(value, type_);
    case Kind::kOptional:
      return value.IsNone() || inner_->Admits(value);
    case Kind::kStruct:
      return value.GetKind() == Value::Kind::kRecord &&
             value.AsRecord().Name() == schema_->Name();
  }
  return false;
}

Schema::Builder::Builder(std::string name, std::string pattern)
    : name_{std::move(name)}, pattern_{std::move(pattern)} {}

Schema::Builder &Schema::Builder::Field(FieldSpec spec) {
  fields_.emplace_back(std::move(spec));
  return *this;
}

Schema::Builder &Schema::Builder::Field(const std::string &name, Shape shape) {
  return Field(FieldSpec{name, std::move(shape)});
}

Schema::Builder &Schema::Builder::Field(const std::string &name,
                                        ScalarType type) {
  return Field(name, Shape::Scalar(type));
}

Schema::Builder &Schema::Builder::Optional(const std::string &name,
                                           Shape inner) {
  return Field(name, Shape::Optional(std::move(inner)));
}

Schema::Builder &Schema::Builder::Optional(const std::string &name,
                                           ScalarType type) {
  return Optional(name, Shape::Scalar(type));
}

Schema::Builder &Schema::Builder::From(const std::string &capture) {
  Last().capture = capture;
  return *this;
}

Schema::Builder &Schema::Builder::Default(Value value) {
  FieldSpec &spec = Last();
  spec.fallback = std::move(value);
  try {
    CheckDefault(name_, spec);
  } catch (const CaprecError &) {
    spec.fallback.reset();
    throw;
  }
  return *this;
}

FieldSpec &Schema::Builder::Last() {
  if (fields_.empty()) {
    throw CaprecError("record '%s' has no field to modify", name_.c_str());
  }
  return fields_.back();
}

std::shared_ptr<const Schema> Schema::Builder::Build() const {
  return std::make_shared<const Schema>(name_, pattern_, fields_);
}

Schema::Schema(std::string name, std::string pattern,
               std::vector<FieldSpec> fields)
    : name_{std::move(name)},
      pattern_{std::move(pattern)},
      fields_{std::move(fields)} {
  if (pattern_.empty()) {
    throw CaprecError("record '%s' has an empty pattern", name_.c_str());
  }

  std::unordered_set<std::string> seen;
  for (const FieldSpec &spec : fields_) {
    if (spec.name.empty()) {
      throw CaprecError("record '%s' has a field without a name",
                        name_.c_str());
    }
    if (!seen.insert(spec.name).second) {
      throw CaprecError("record '%s' declares field '%s' twice", name_.c_str(),
                        spec.name.c_str());
    }
    CheckDefault(name_, spec);
  }
}

const FieldSpec *Schema::Find(const std::string &field) const {
  for (const FieldSpec &spec : fields_) {
    if (spec.name == field) {
      return &spec;
    }
  }
  return nullptr;
}

#include <charconv>
#include <coerce.hpp>
#include <exceptions.hpp>

using caprec::ScalarType;
using caprec::Shape;
using caprec::Value;

namespace {

// from_chars rejects a leading '+', the textual grammar allows one
bool StripPlus(const char **first, const char *last) {
  if (*first != last && **first == '+') {
    ++*first;
    return *first != last && **first != '-' && **first != '+';
  }
  return true;
}

template <typename T>
bool ParseNumber(const std::string &raw, T *out) {
  const char *first = raw.data();
  const char *last = raw.data() + raw.size();
  if (first == last || !StripPlus(&first, last)) {
    return false;
  }
  auto result = std::from_chars(first, last, *out);
  return result.ec == std::errc() && result.ptr == last;
}

template <typename T>
Value Signed(const std::string &raw, const std::string &field,
             ScalarType type) {
  T n{0};
  if (!ParseNumber(raw, &n)) {
    throw caprec::TypeMismatchError(field, caprec::ScalarTypeName(type), raw);
  }
  return Value::Signed(static_cast<int64_t>(n));
}

template <typename T>
Value Unsigned(const std::string &raw, const std::string &field,
               ScalarType type) {
  T n{0};
  if (!ParseNumber(raw, &n)) {
    throw caprec::TypeMismatchError(field, caprec::ScalarTypeName(type), raw);
  }
  return Value::Unsigned(static_cast<uint64_t>(n));
}

template <typename T>
Value Floating(const std::string &raw, const std::string &field,
               ScalarType type) {
  T n{0};
  if (!ParseNumber(raw, &n)) {
    throw caprec::TypeMismatchError(field, caprec::ScalarTypeName(type), raw);
  }
  return Value::Float(static_cast<double>(n));
}

Value Scalar(const std::string &raw, ScalarType type,
             const std::string &field) {
  switch (type) {
    case ScalarType::kString:
      return Value::String(raw);
    case ScalarType::kBool:
      if (raw == "true") {
        return Value::Bool(true);
      }
      if (raw == "false") {
        return Value::Bool(false);
      }
      throw caprec::TypeMismatchError(field, caprec::ScalarTypeName(type), raw);
    case ScalarType::kI8:
      return Signed<int8_t>(raw, field, type);
    case ScalarType::kI16:
      return Signed<int16_t>(raw, field, type);
    case ScalarType::kI32:
      return Signed<int32_t>(raw, field, type);
    case ScalarType::kI64:
      return Signed<int64_t>(raw, field, type);
    case ScalarType::kU8:
      return Unsigned<uint8_t>(raw, field, type);
    case ScalarType::kU16:
      return Unsigned<uint16_t>(raw, field, type);
    case ScalarType::kU32:
      return Unsigned<uint32_t>(raw, field, type);
    case ScalarType::kU64:
      return Unsigned<uint64_t>(raw, field, type);
    case ScalarType::kF32:
      return Floating<float>(raw, field, type);
    case ScalarType::kF64:
      return Floating<double>(raw, field, type);
  }
  throw caprec::CaprecError("field '%s' has an unknown scalar type",
                            field.c_str());
}
}  // namespace

Value caprec::Coerce(const std::optional<std::string> &raw, const Shape &shape,
                     const std::string &field, const NestedDecoder *nested) {
  if (!raw) {
    if (shape.IsOptional()) {
      return Value::None();
    }
    throw MissingFieldError(field);
  }

  switch (shape.GetKind()) {
    case Shape::Kind::kScalar:
      return Scalar(*raw, shape.Type(), field);
    case Shape::Kind::kOptional:
      return Coerce(raw, shape.Inner(), field, nested);
    case Shape::Kind::kStruct: {
      if (nested == nullptr) {
        throw CaprecError("field '%s' is a %s but no decoder was given",
                          field.c_str(), shape.Name().c_str());
      }
      try {
        return Value::Nested(nested->DecodeNested(shape.Nested(), *raw));
      } catch (const NoMatchError &e) {
        throw TypeMismatchError(field, shape.Name(), *raw, e.what());
      } catch (const FieldError &e) {
        throw TypeMismatchError(field, shape.Name(), *raw, e.what());
      }
    }
  }
  throw CaprecError("field '%s' has an unknown shape", field.c_str());
}

#pragma once

#include <optional>
#include <shape.hpp>
#include <string>
#include <value.hpp>

namespace caprec {

/// Parses the text captured for a record-typed field with that record's own
/// schema.
class NestedDecoder {
 public:
  virtual ~NestedDecoder() = default;

  virtual Record DecodeNested(const Schema &schema,
                              const std::string &text) const = 0;
};

/// Turns the raw text of `field` into a value of `shape`.
///
/// Absent text yields Value::None() for an optional shape and
/// MissingFieldError otherwise. Present text is parsed as the (inner) shape:
/// strings verbatim, booleans as exactly "true" / "false", numbers with the
/// whole text in the type's grammar and range. Anything else throws
/// TypeMismatchError. Record shapes need `nested`.
Value Coerce(const std::optional<std::string> &raw, const Shape &shape,
             const std::string &field, const NestedDecoder *nested = nullptr);
}  // namespace caprec

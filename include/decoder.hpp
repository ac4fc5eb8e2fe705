#pragma once

#include <cache.hpp>
#include <coerce.hpp>
#include <shape.hpp>
#include <source.hpp>
#include <string>
#include <value.hpp>
#include <vector>

namespace caprec {

/// Compiles (through the cache), extracts, coerces every field in
/// declaration order and assembles the record. Decoding is all or nothing:
/// the first failure is thrown and no partial record escapes.
class Decoder : public NestedDecoder {
 public:
  explicit Decoder(
      cache::PatternCache &patterns = cache::DefaultPatternCache())
      : cache_{patterns} {}

  Record Decode(const Schema &schema, const std::string &input) const;

  Record Decode(const std::string &pattern,
                const std::vector<FieldSpec> &fields,
                const std::string &input) const;

  /// Decodes from any map of scalars. Field errors carry the source's
  /// origin and input as context.
  Record Decode(const ValueSource &source, const std::vector<FieldSpec> &fields,
                const std::string &name = "") const;

  bool IsMatch(const Schema &schema, const std::string &input) const;

  Record DecodeNested(const Schema &schema,
                      const std::string &text) const override;

  cache::PatternCache &Cache() const { return cache_; }

 private:
  Record Decode(const std::string &pattern,
                const std::vector<FieldSpec> &fields, const std::string &input,
                const std::string &name) const;

  cache::PatternCache &cache_;
};
}  // namespace caprec

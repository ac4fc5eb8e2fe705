#pragma once

#include <re2/re2.h>
#include <cache.hpp>
#include <decoder.hpp>
#include <file.hpp>
#include <memory>
#include <optional>
#include <shape.hpp>
#include <string>
#include <vector>

namespace caprec::conf {

#define MAX_FILE_SIZE (8192 * 1024)

const Schema &RecordLineSchema();
const Schema &FieldLineSchema();
const re2::RE2 &CommentLineRegex();
const re2::RE2 &EmptyLineRegex();

/// Records declared in a schema file:
///
///   # comment
///   record Inner (?P<foo>\w+):(?P<bar>\d+)
///   field foo string
///   field bar u32
///   record Outer (?P<first>[^ ]+)( (?P<second>[^ ]+))?
///   field first Inner
///   field second ?Inner default abc:1
///
/// A field type is a scalar type name or a record declared above it.
class Schemas {
 private:
  typedef std::vector<std::shared_ptr<const Schema>> Collection;

  struct Pending {
    std::string name;
    std::string pattern;
    int lineno;
    std::vector<FieldSpec> fields;
  };

  Collection schemas_{};
  std::optional<Pending> pending_{};
  cache::PatternCache &cache_;
  Decoder decoder_;

  void Parse(const file::line_t &line);

  void ParseRecord(const file::line_t &line, const Record &directive);

  void ParseField(const file::line_t &line, const Record &directive);

  Shape ResolveType(const file::line_t &line, const std::string &type) const;

  void Finish();

 public:
  typedef Collection::const_iterator const_iterator;

  explicit Schemas(
      cache::PatternCache &patterns = cache::DefaultPatternCache())
      : cache_{patterns}, decoder_{patterns} {}

  Schemas &Load(const file::File &f);

  Schemas &Load(const std::string &path);

  const Schema *Find(const std::string &name) const;

  const Schema &Get(const std::string &name) const;

  // the record declared last
  const Schema &Main() const;

  unsigned long Size() const { return schemas_.size(); }

  bool Empty() const { return schemas_.empty(); }

  const_iterator begin() const { return schemas_.cbegin(); }

  const_iterator end() const { return schemas_.cend(); }
};
}  // namespace caprec::conf

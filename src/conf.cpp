#include <conf.hpp>
#include <exceptions.hpp>
#include <logger.hpp>

using caprec::Record;
using caprec::ScalarType;
using caprec::Schema;
using caprec::Shape;
using caprec::conf::Schemas;

Schemas &Schemas::Load(const std::string &path) {
  file::File f{path};
  return Load(f);
}

Schemas &Schemas::Load(const file::File &f) {
  if (!schemas_.empty()) {
    throw ConfigError("not allowed to reload schemas");
  }

  logger::debug() << "parsing " << f.String() << std::endl;
  if (f.IsRegular() && f.Size() > MAX_FILE_SIZE) {
    throw ConfigError("'%s' size is %ld, which is not supported",
                      f.Path().c_str(), static_cast<long>(f.Size()));
  }

  f.ReadLine([&](const file::line_t &line) { Parse(line); });
  Finish();

  if (schemas_.empty()) {
    throw ConfigError("'%s' declares no records", f.Path().c_str());
  }
  return *this;
}

void Schemas::Parse(const file::line_t &line) {
  logger::debug() << "parsing line " << line.lineno << ": '" << line.txt << "'"
                  << std::endl;

  //  a comment, no need to parse
  if (re2::RE2::FullMatch(line.txt, CommentLineRegex())) {
    logger::debug() << "line " << line.lineno << " is a comment, skipping."
                    << std::endl;
    return;
  }

  //  an empty line, no need to parse
  if (re2::RE2::FullMatch(line.txt, EmptyLineRegex())) {
    logger::debug() << "line " << line.lineno << " is empty, skipping."
                    << std::endl;
    return;
  }

  if (decoder_.IsMatch(RecordLineSchema(), line.txt)) {
    ParseRecord(line, decoder_.Decode(RecordLineSchema(), line.txt));
    return;
  }

  if (decoder_.IsMatch(FieldLineSchema(), line.txt)) {
    ParseField(line, decoder_.Decode(FieldLineSchema(), line.txt));
    return;
  }

  logger::debug() << "couldn't parse: " << line.txt << std::endl;
  throw ConfigError("line %d is invalid: '%s'", line.lineno,
                    line.txt.c_str());
}

void Schemas::ParseRecord(const file::line_t &line, const Record &directive) {
  Finish();

  const std::string &name = directive.Get("name").AsString();
  const std::string &pattern = directive.Get("pattern").AsString();
  if (Find(name) != nullptr) {
    throw ConfigError("line %d: record '%s' is declared twice", line.lineno,
                      name.c_str());
  }

  try {
    cache_.CompileOrGet(pattern);
  } catch (const CompileError &e) {
    throw ConfigError("line %d: %s", line.lineno, e.what());
  }

  pending_ = Pending{name, pattern, line.lineno, {}};
}

void Schemas::ParseField(const file::line_t &line, const Record &directive) {
  const std::string &name = directive.Get("name").AsString();
  if (!pending_) {
    throw ConfigError("line %d: field '%s' is declared outside of a record",
                      line.lineno, name.c_str());
  }
  for (const FieldSpec &spec : pending_->fields) {
    if (spec.name == name) {
      throw ConfigError("line %d: field '%s' is declared twice in '%s'",
                        line.lineno, name.c_str(), pending_->name.c_str());
    }
  }

  Shape shape{ResolveType(line, directive.Get("type").AsString())};
  if (!directive.Get("optional").IsNone()) {
    shape = Shape::Optional(shape);
  }

  FieldSpec spec{name, shape};
  if (!directive.Get("capture").IsNone()) {
    spec.capture = directive.Get("capture").AsString();
  }

  const Value &fallback = directive.Get("default");
  if (!fallback.IsNone()) {
    try {
      spec.fallback = Coerce(fallback.AsString(), shape, name, &decoder_);
    } catch (const FieldError &e) {
      throw ConfigError("line %d: bad default for field '%s': %s",
                        line.lineno, name.c_str(), e.what());
    }
  }

  auto re = cache_.CompileOrGet(pending_->pattern);
  const auto &groups = re->NamedCapturingGroups();
  if (groups.find(spec.CaptureName()) == groups.end()) {
    if (!shape.IsOptional() && !spec.fallback) {
      throw ConfigError("line %d: pattern of '%s' has no group named '%s'",
                        line.lineno, pending_->name.c_str(),
                        spec.CaptureName().c_str());
    }
    logger::warning() << "line " << line.lineno << ": pattern of '"
                      << pending_->name << "' has no group named '"
                      << spec.CaptureName() << "'" << std::endl;
  }

  pending_->fields.emplace_back(std::move(spec));
}

Shape Schemas::ResolveType(const file::line_t &line,
                           const std::string &type) const {
  ScalarType scalar;
  if (ParseScalarType(type, &scalar)) {
    return Shape::Scalar(scalar);
  }

  for (const auto &schema : schemas_) {
    if (schema->Name() == type) {
      return Shape::Struct(schema);
    }
  }

  throw ConfigError("line %d: unknown type '%s'", line.lineno, type.c_str());
}

void Schemas::Finish() {
  if (!pending_) {
    return;
  }

  schemas_.emplace_back(std::make_shared<const Schema>(
      pending_->name, pending_->pattern, std::move(pending_->fields)));
  logger::debug() << "record '" << pending_->name << "' declared on line "
                  << pending_->lineno << " has "
                  << schemas_.back()->Fields().size() << " fields"
                  << std::endl;
  pending_.reset();
}

const Schema *Schemas::Find(const std::string &name) const {
  for (const auto &schema : schemas_) {
    if (schema->Name() == name) {
      return schema.get();
    }
  }
  return nullptr;
}

const Schema &Schemas::Get(const std::string &name) const {
  const Schema *schema = Find(name);
  if (schema == nullptr) {
    throw ConfigError("no record named '%s'", name.c_str());
  }
  return *schema;
}

const Schema &Schemas::Main() const {
  if (schemas_.empty()) {
    throw ConfigError("no records declared");
  }
  return *schemas_.back();
}

const Schema &caprec::conf::RecordLineSchema() {
  static const auto schema =
      Schema::Builder(
          "record",
          R"(^\s*record\s+(?P<name>[A-Za-z_][A-Za-z0-9_]*)\s+(?P<pattern>\S.*?)\s*$)")
          .Field("name", ScalarType::kString)
          .Field("pattern", ScalarType::kString)
          .Build();
  return *schema;
}

const Schema &caprec::conf::FieldLineSchema() {
  static const auto schema =
      Schema::Builder(
          "field",
          R"(^\s*field\s+(?P<name>[A-Za-z_][A-Za-z0-9_]*)\s+(?P<optional>\?)?(?P<type>[A-Za-z_][A-Za-z0-9_]*)(?:\s+from\s+(?P<capture>[A-Za-z_][A-Za-z0-9_]*))?(?:\s+default\s+(?P<default>.*?))?\s*$)")
          .Field("name", ScalarType::kString)
          .Optional("optional", ScalarType::kString)
          .Field("type", ScalarType::kString)
          .Optional("capture", ScalarType::kString)
          .Optional("default", ScalarType::kString)
          .Build();
  return *schema;
}

const re2::RE2 &caprec::conf::CommentLineRegex() {
  static const re2::RE2 re{R"(^[\t ]*#.*)"};
  if (!re.ok()) {
    throw std::runtime_error("comment regex failed to compile");
  }
  return re;
}

const re2::RE2 &caprec::conf::EmptyLineRegex() {
  static const re2::RE2 re{R"(^[\t ]*)"};
  if (!re.ok()) {
    throw std::runtime_error("empty line regex failed to compile");
  }
  return re;
}

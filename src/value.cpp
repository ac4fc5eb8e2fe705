#include <algorithm>
#include <exceptions.hpp>
#include <iomanip>
#include <value.hpp>

using caprec::Record;
using caprec::Value;

namespace {
template <typename T, typename Data>
const T &Expect(const Data &data, Value::Kind want) {
  const T *v = std::get_if<T>(&data);
  if (v == nullptr) {
    throw caprec::CaprecError(
        "value is %s, not %s",
        caprec::KindName(static_cast<Value::Kind>(data.index())),
        caprec::KindName(want));
  }
  return *v;
}
}  // namespace

const char *caprec::KindName(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::kNone:
      return "none";
    case Value::Kind::kBool:
      return "bool";
    case Value::Kind::kSigned:
      return "signed integer";
    case Value::Kind::kUnsigned:
      return "unsigned integer";
    case Value::Kind::kFloat:
      return "float";
    case Value::Kind::kString:
      return "string";
    case Value::Kind::kRecord:
      return "record";
  }
  return "unknown";
}

Value Value::Bool(bool b) { return Value(Data{b}); }

Value Value::Signed(int64_t n) { return Value(Data{n}); }

Value Value::Unsigned(uint64_t n) { return Value(Data{n}); }

Value Value::Float(double d) { return Value(Data{d}); }

Value Value::String(std::string s) {
  return Value(Data{std::in_place_type<std::string>, std::move(s)});
}

Value Value::Nested(Record record) {
  return Value(Data{std::make_shared<const Record>(std::move(record))});
}

bool Value::AsBool() const { return Expect<bool>(data_, Kind::kBool); }

int64_t Value::AsSigned() const {
  return Expect<int64_t>(data_, Kind::kSigned);
}

uint64_t Value::AsUnsigned() const {
  return Expect<uint64_t>(data_, Kind::kUnsigned);
}

double Value::AsFloat() const { return Expect<double>(data_, Kind::kFloat); }

const std::string &Value::AsString() const {
  return Expect<std::string>(data_, Kind::kString);
}

const Record &Value::AsRecord() const {
  return *Expect<std::shared_ptr<const Record>>(data_, Kind::kRecord);
}

bool Value::operator==(const Value &other) const {
  if (GetKind() != other.GetKind()) {
    return false;
  }
  if (GetKind() == Kind::kRecord) {
    return AsRecord() == other.AsRecord();
  }
  return data_ == other.data_;
}

void Record::Set(const std::string &field, Value value) {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&](const auto &kv) { return kv.first == field; });
  if (it != fields_.end()) {
    it->second = std::move(value);
    return;
  }
  fields_.emplace_back(field, std::move(value));
}

bool Record::Contains(const std::string &field) const {
  return std::any_of(fields_.begin(), fields_.end(),
                     [&](const auto &kv) { return kv.first == field; });
}

const Value &Record::Get(const std::string &field) const {
  for (const auto &kv : fields_) {
    if (kv.first == field) {
      return kv.second;
    }
  }
  throw CaprecError("record '%s' has no field '%s'", name_.c_str(),
                    field.c_str());
}

bool Record::operator==(const Record &other) const {
  return name_ == other.name_ && fields_ == other.fields_;
}

std::ostream &caprec::operator<<(std::ostream &os, const Value &value) {
  switch (value.GetKind()) {
    case Value::Kind::kNone:
      return os << "none";
    case Value::Kind::kBool:
      return os << (value.AsBool() ? "true" : "false");
    case Value::Kind::kSigned:
      return os << value.AsSigned();
    case Value::Kind::kUnsigned:
      return os << value.AsUnsigned();
    case Value::Kind::kFloat:
      return os << value.AsFloat();
    case Value::Kind::kString:
      return os << std::quoted(value.AsString());
    case Value::Kind::kRecord:
      return os << value.AsRecord();
  }
  return os;
}

std::ostream &caprec::operator<<(std::ostream &os, const Record &record) {
  os << record.Name() << " {";
  bool first{true};
  for (const auto &kv : record) {
    os << (first ? " " : ", ") << kv.first << ": " << kv.second;
    first = false;
  }
  return os << (record.Empty() ? "}" : " }");
}

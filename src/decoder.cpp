#include <decoder.hpp>
#include <exceptions.hpp>
#include <rx.hpp>

using caprec::Decoder;
using caprec::Record;

Record Decoder::Decode(const Schema &schema, const std::string &input) const {
  return Decode(schema.Pattern(), schema.Fields(), input, schema.Name());
}

Record Decoder::Decode(const std::string &pattern,
                       const std::vector<FieldSpec> &fields,
                       const std::string &input) const {
  return Decode(pattern, fields, input, "");
}

Record Decoder::Decode(const std::string &pattern,
                       const std::vector<FieldSpec> &fields,
                       const std::string &input,
                       const std::string &name) const {
  auto re = cache_.CompileOrGet(pattern);
  CaptureSource source{rx::Extract(*re, input), pattern, input};
  return Decode(source, fields, name);
}

Record Decoder::Decode(const ValueSource &source,
                       const std::vector<FieldSpec> &fields,
                       const std::string &name) const {
  Record record{name};
  for (const FieldSpec &spec : fields) {
    try {
      auto raw = source.GetScalar(spec.CaptureName());
      if (!raw && spec.fallback) {
        record.Set(spec.name, *spec.fallback);
        continue;
      }
      record.Set(spec.name, Coerce(raw, spec.shape, spec.name, this));
    } catch (FieldError &e) {
      e.AttachContext(source.Origin(), source.Input());
      throw;
    }
  }
  return record;
}

bool Decoder::IsMatch(const Schema &schema, const std::string &input) const {
  return rx::IsMatch(*cache_.CompileOrGet(schema.Pattern()), input);
}

Record Decoder::DecodeNested(const Schema &schema,
                             const std::string &text) const {
  return Decode(schema, text);
}

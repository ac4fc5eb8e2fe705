#include <exceptions.hpp>

using caprec::FieldError;
using caprec::TypeMismatchError;

FieldError::FieldError(std::string field, std::string reason)
    : CaprecError(reason), field_{std::move(field)}, reason_{std::move(reason)} {
  Format();
}

void FieldError::AttachContext(const std::string &pattern,
                               const std::string &input) {
  pattern_ = pattern;
  excerpt_ = Excerpt(input);
  Format();
}

void FieldError::Format() {
  message_ = Sprintf("field '%s': %s", field_.c_str(), reason_.c_str());
  if (!pattern_.empty()) {
    message_ += Sprintf(" (pattern '%s', input '%s')", pattern_.c_str(),
                        excerpt_.c_str());
  }
}

TypeMismatchError::TypeMismatchError(const std::string &field,
                                     const std::string &type,
                                     const std::string &raw,
                                     const std::string &detail)
    : FieldError(field,
                 detail.empty()
                     ? Sprintf("can't parse '%s' as %s", raw.c_str(),
                               type.c_str())
                     : Sprintf("can't parse '%s' as %s: %s", raw.c_str(),
                               type.c_str(), detail.c_str())),
      type_{type},
      raw_{raw},
      detail_{detail} {}

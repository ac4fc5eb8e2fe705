#pragma once
#include <fmt.hpp>
#include <stdexcept>
#include <string>

namespace caprec {

class CaprecError : public std::runtime_error {
 public:
  explicit CaprecError(const std::string &text) : runtime_error(text) {}

  template <typename... Args>
  explicit CaprecError(const std::string &format, Args &&... args)
      : runtime_error(Sprintf(format, std::forward<Args>(args)...)) {}
};

class InvalidUsage : public CaprecError {
 public:
  explicit InvalidUsage() : CaprecError("") {}
};

class IOError : public CaprecError {
 public:
  explicit IOError(const std::string &text) : CaprecError(text) {}
  template <typename... Args>
  explicit IOError(const std::string &format, Args &&... args)
      : CaprecError(format, std::forward<Args>(args)...) {}
};

class ConfigError : public CaprecError {
 public:
  explicit ConfigError(const std::string &text) : CaprecError(text) {}
  template <typename... Args>
  explicit ConfigError(const std::string &format, Args &&... args)
      : CaprecError(format, std::forward<Args>(args)...) {}
};

/// The pattern text is not a valid RE2 pattern.
class CompileError : public CaprecError {
 public:
  CompileError(const std::string &pattern, const std::string &reason)
      : CaprecError("invalid pattern '%s': %s", pattern.c_str(),
                    reason.c_str()),
        pattern_{pattern},
        reason_{reason} {}

  const std::string &Pattern() const { return pattern_; }

  const std::string &Reason() const { return reason_; }

 private:
  std::string pattern_;
  std::string reason_;
};

/// The input does not satisfy the pattern.
class NoMatchError : public CaprecError {
 public:
  NoMatchError(const std::string &pattern, const std::string &input)
      : CaprecError("no match for pattern '%s' in '%s'", pattern.c_str(),
                    Excerpt(input).c_str()),
        pattern_{pattern},
        excerpt_{Excerpt(input)} {}

  const std::string &Pattern() const { return pattern_; }

  const std::string &InputExcerpt() const { return excerpt_; }

 private:
  std::string pattern_;
  std::string excerpt_;
};

/// A single field could not be decoded. The decoder attaches the
/// pattern / input context before the error leaves Decode().
class FieldError : public CaprecError {
 public:
  const std::string &Field() const { return field_; }

  const std::string &Reason() const { return reason_; }

  const std::string &Pattern() const { return pattern_; }

  const std::string &InputExcerpt() const { return excerpt_; }

  void AttachContext(const std::string &pattern, const std::string &input);

  const char *what() const noexcept override { return message_.c_str(); }

 protected:
  FieldError(std::string field, std::string reason);

 private:
  void Format();

  std::string field_;
  std::string reason_;
  std::string pattern_{};
  std::string excerpt_{};
  std::string message_{};
};

class MissingFieldError : public FieldError {
 public:
  explicit MissingFieldError(const std::string &field)
      : FieldError(field, "required value is missing") {}
};

class TypeMismatchError : public FieldError {
 public:
  TypeMismatchError(const std::string &field, const std::string &type,
                    const std::string &raw, const std::string &detail = "");

  const std::string &TypeName() const { return type_; }

  const std::string &Raw() const { return raw_; }

  const std::string &Detail() const { return detail_; }

 private:
  std::string type_;
  std::string raw_;
  std::string detail_;
};
}  // namespace caprec

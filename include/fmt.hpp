#pragma once

#include <cstdio>
#include <memory>
#include <string>

#define EXCERPT_MAX_LENGTH 64

namespace caprec {

// https://stackoverflow.com/a/26221725/4579708
template <typename... Args>
std::string Sprintf(const std::string &format, Args &&... args) {
  // Extra space for '\0'
  size_t size = (size_t)snprintf(nullptr, 0, format.c_str(), args...) + 1;
  std::unique_ptr<char[]> buf(new char[size]);
  snprintf(buf.get(), size, format.c_str(), args...);
  // We don't want the '\0' inside
  return std::string(buf.get(), buf.get() + size - 1);
}

// cuts diagnostics text down to at most EXCERPT_MAX_LENGTH bytes, marking
// the cut with a trailing "...". Never splits a UTF-8 sequence.
inline std::string Excerpt(const std::string &text,
                           size_t max = EXCERPT_MAX_LENGTH) {
  if (text.size() <= max) {
    return text;
  }
  // back up over continuation bytes (10xxxxxx) to a lead byte
  while (max > 0 && (static_cast<unsigned char>(text[max]) & 0xC0) == 0x80) {
    --max;
  }
  return text.substr(0, max) + "...";
}
}  // namespace caprec

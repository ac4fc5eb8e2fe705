#pragma once

#include <fstream>
#include <iostream>
#include <ostream>
#include <string>

#define PATH_DEV_NULL "/dev/null"

namespace caprec::logger {

enum Type { DEBUG, INFO, WARNING, ERROR };

class Logger {
 public:
  static Logger &get(Type type);
  void VerboseOn() { verbose_ = true; }

  Logger(const Logger &) = delete;

  void operator=(const Logger &) = delete;

  ~Logger() = default;

  std::ostream &operator<<(const char *text);

  std::ostream &operator<<(const std::string &text);

 private:
  std::ostream &Stream() {
    static std::ofstream devnull{PATH_DEV_NULL};

    if (verbose_) {
      return std::clog;
    }
    return devnull;
  }

  explicit Logger(Type type);
  Type type_;
  bool verbose_{false};
};

Logger &debug();

Logger &info();

Logger &warning();

Logger &error();

// routes every level to std::clog
void VerboseOn();
}  // namespace caprec::logger

#include <logger.hpp>
#include <stdexcept>

using caprec::logger::Logger;
using caprec::logger::Type;

namespace {
const std::string TypeName(Type type) {
  switch (type) {
    case Type::DEBUG: {
      return "DEBUG";
    }
    case Type::INFO: {
      return "INFO";
    }
    case Type::WARNING: {
      return "WARNING";
    }
    case Type::ERROR: {
      return "ERROR";
    }
    default: { throw std::runtime_error("unknown logger"); }
  }
}
}  // namespace

Logger::Logger(Type type) : type_(type) {}

std::ostream &Logger::operator<<(const char *text) {
  std::string str{text};
  return *this << str;
}

std::ostream &Logger::operator<<(const std::string &text) {
  Stream() << TypeName(type_) << " - " << text;
  return Stream();
}

Logger &Logger::get(Type type) {
  static Logger debug = Logger(Type::DEBUG);
  static Logger info = Logger(Type::INFO);
  static Logger warning = Logger(Type::WARNING);
  static Logger error = Logger(Type::ERROR);

  switch (type) {
    case Type::DEBUG:
      return debug;
    case Type::INFO:
      return info;
    case Type::WARNING:
      return warning;
    case Type::ERROR:
      return error;
  }

  throw std::runtime_error("unknown logger type");
}

Logger &caprec::logger::debug() { return Logger::get(Type::DEBUG); }

Logger &caprec::logger::info() { return Logger::get(Type::INFO); }

Logger &caprec::logger::warning() { return Logger::get(Type::WARNING); }

Logger &caprec::logger::error() { return Logger::get(Type::ERROR); }

void caprec::logger::VerboseOn() {
  debug().VerboseOn();
  info().VerboseOn();
  warning().VerboseOn();
  error().VerboseOn();
}

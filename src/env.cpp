#include <cstdlib>
#include <env.hpp>

std::string caprec::env::Get(const std::string &env) {
  char *val = std::getenv(env.c_str());
  return val == nullptr ? "" : val;
}

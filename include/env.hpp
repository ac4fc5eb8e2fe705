#pragma once

#include <string>

#define ENV_SCHEMA "CAPREC_SCHEMA"

namespace caprec::env {
std::string Get(const std::string &env);
}  // namespace caprec::env

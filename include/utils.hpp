#pragma once

#include <gsl/gsl>

#define CONCAT_(a, b) a##b
#define CONCAT(a, b) CONCAT_(a, b)
#define DEFER(fn) auto CONCAT(__defer__, __LINE__) = gsl::finally([&] { fn; });

#pragma once

#include <decoder.hpp>
#include <file.hpp>
#include <ostream>
#include <shape.hpp>

namespace caprec {

struct Summary {
  int decoded{0};
  int skipped{0};
  int failed{0};
};

void ShowVersion();

void ShowUsage();

/// Decodes every line of `in` with `schema` and writes the records to `out`.
/// Lines the pattern does not match are skipped, lines with a bad field are
/// reported on `err`. In strict mode either aborts with a CaprecError naming
/// the line.
Summary DecodeLines(const Decoder &decoder, const Schema &schema,
                    const file::File &in, std::ostream &out, std::ostream &err,
                    bool strict);
}  // namespace caprec

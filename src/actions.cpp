#include <actions.hpp>
#include <exceptions.hpp>
#include <iostream>
#include <logger.hpp>

#ifndef VERSION
#define VERSION "unknown"
#endif

void caprec::ShowVersion() { std::cout << "caprec: " << VERSION << std::endl; }

void caprec::ShowUsage() {
  std::cout << "usage: caprec [-Vvs] [-f schema] [-r record] [input]"
            << std::endl;
}

caprec::Summary caprec::DecodeLines(const Decoder &decoder,
                                    const Schema &schema,
                                    const file::File &in, std::ostream &out,
                                    std::ostream &err, bool strict) {
  Summary summary;
  in.ReadLine([&](const file::line_t &line) {
    try {
      out << decoder.Decode(schema, line.txt) << std::endl;
      summary.decoded++;
    } catch (const NoMatchError &e) {
      if (strict) {
        throw CaprecError("line %d: %s", line.lineno, e.what());
      }
      logger::debug() << "line " << line.lineno << " doesn't match '"
                      << schema.Name() << "', skipping." << std::endl;
      summary.skipped++;
    } catch (const FieldError &e) {
      if (strict) {
        throw CaprecError("line %d: %s", line.lineno, e.what());
      }
      logger::warning() << "line " << line.lineno << " failed: " << e.what()
                        << std::endl;
      err << "line " << line.lineno << ": " << e.what() << std::endl;
      summary.failed++;
    }
  });

  logger::info() << "decoded " << summary.decoded << " lines of "
                 << in.String() << " (" << summary.skipped << " skipped, "
                 << summary.failed << " failed)" << std::endl;
  return summary;
}

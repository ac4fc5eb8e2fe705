#include <unistd.h>
#include <actions.hpp>
#include <backward-cpp/backward.hpp>
#include <conf.hpp>
#include <env.hpp>
#include <exceptions.hpp>
#include <iostream>
#include <logger.hpp>
#include <memory>
#include <optarg.hpp>

using caprec::CaprecError;
using caprec::InvalidUsage;
using caprec::optargs::OptArgs;

int Do(const OptArgs &opts) {
  if (opts.ShowVersion()) {
    caprec::ShowVersion();
    return 0;
  }

  if (opts.SchemaPath().empty()) {
    std::cerr << "no schema given, use -f or set " ENV_SCHEMA << std::endl;
    throw InvalidUsage();
  }

  caprec::conf::Schemas schemas;
  schemas.Load(opts.SchemaPath());
  const caprec::Schema &schema = opts.RecordName().empty()
                                     ? schemas.Main()
                                     : schemas.Get(opts.RecordName());

  std::unique_ptr<caprec::file::File> in;
  if (opts.InputPath() == "-") {
    in = std::make_unique<caprec::file::File>(STDIN_FILENO, "<stdin>");
  } else {
    in = std::make_unique<caprec::file::File>(opts.InputPath());
  }

  caprec::Decoder decoder;
  caprec::DecodeLines(decoder, schema, *in, std::cout, std::cerr,
                      opts.Strict());
  return 0;
}

int main(int argc, char *argv[]) {
  backward::SignalHandling sh;

  try {
    OptArgs opts{argc, argv};
    if (opts.VerboseMode()) {
      caprec::logger::VerboseOn();
    }
    return Do(opts);
  } catch (InvalidUsage &) {
    caprec::ShowUsage();
    return 1;
  } catch (CaprecError &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (std::exception &e) {
    std::cerr << "an unhandled error occurred: " << e.what() << std::endl;
    return 1;
  }
}

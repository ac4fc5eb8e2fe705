#include <env.hpp>
#include <exceptions.hpp>
#include <gsl/gsl>
#include <optarg.hpp>

using caprec::optargs::OptArgs;

OptArgs::OptArgs(int argc, char *argv[]) : schema_path_{env::Get(ENV_SCHEMA)} {
  int first = OptArgs::ParseOpts(argc, argv);
  auto positional = gsl::make_span(argv, argc).subspan(first);
  if (positional.size() > 1) {
    throw caprec::InvalidUsage();
  }
  if (!positional.empty()) {
    input_path_ = positional[0];
  }
}

int OptArgs::ParseOpts(int argc, char *argv[]) {
  int c;
  // getopt keeps its state in globals, start over on every parse
  optind = 1;
  while (true) {
    c = getopt(argc, argv, "f:r:sVv");
    if (c == -1) {
      return optind;
    }
    /* Detect the end of the options. */
    switch (c) {
      case 'f': {
        schema_path_ = optarg;
        break;
      }
      case 'r': {
        record_ = optarg;
        break;
      }
      case 's': {
        strict_ = true;
        break;
      }
      case 'V': {
        verbose_mode_ = true;
        break;
      }
      case 'v': {
        show_version_ = true;
        break;
      }
      default: {
        // getopt will write the error, thus not need to do anything here
        throw caprec::InvalidUsage();
      }
    }
  }
}

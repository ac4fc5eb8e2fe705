#pragma once
#include <getopt.h>
#include <string>

namespace caprec::optargs {

class OptArgs {
 public:
  OptArgs(int argc, char *argv[]);

  // "-" reads stdin
  const std::string &InputPath() const { return input_path_; }

  const std::string &SchemaPath() const { return schema_path_; }

  // empty selects the record declared last
  const std::string &RecordName() const { return record_; }

  bool Strict() const { return strict_; }

  bool ShowVersion() const { return show_version_; }

  bool VerboseMode() const { return verbose_mode_; }

 private:
  int ParseOpts(int argc, char *argv[]);

  std::string input_path_{"-"};
  std::string schema_path_;
  std::string record_{};
  bool strict_{false};
  bool show_version_{false};
  bool verbose_mode_{false};
};
}  // namespace caprec::optargs

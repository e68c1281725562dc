#pragma once

#include <optional>
#include <string>

#include "types.hpp"

struct CliRequest {
  fs::path input;
  WatermarkOptions options;
  std::optional<fs::path> config_file;
  std::optional<fs::path> save_config;
  std::optional<fs::path> log_file;
  bool interactive = false;
  bool dry_run = false;
  bool quiet = false;
  bool show_help = false;
};

namespace CommandLine {
std::string usage();

// Merges defaults, the optional --config template and explicit flags, in
// that order of precedence. Throws WatermarkError(InvalidOption).
CliRequest parse(int argc, const char* const argv[]);
}  // namespace CommandLine

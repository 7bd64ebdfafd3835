// Config parsing and structures
#pragma once
#include <promparse/promparse.hpp>

#include <string>
#include <string_view>

namespace promparse {

struct FileConfig {
  // parser
  bool capture_help = false;      // route "# HELP" text into Metric::help

  // logging
  std::string log_level = "warn"; // trace|debug|info|warn|error|critical|off
};

// Try to parse TOML file into FileConfig. Returns true on success, false on failure.
bool ParseConfigToml(const std::string& path, FileConfig& out, std::string& err);
// Same, for an in-memory document.
bool ParseConfigTomlString(std::string_view text, FileConfig& out, std::string& err);

ParseOptions ToParseOptions(const FileConfig& cfg);

// Apply the [logging] section to the promparse logger.
bool ApplyLogging(const FileConfig& cfg, std::string& err);

} // namespace promparse

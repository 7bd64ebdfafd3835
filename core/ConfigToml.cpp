// TOML config loader using toml++ (header-only)
#include "Config.hpp"
#include "Logging.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

namespace promparse {

namespace {

static bool ReadBool(const toml::node_view<toml::node>& nv, const char* key, bool& out, std::string& err) {
  if (!nv) return true; // keep default
  if (auto v = nv.value<bool>(); v && nv.is_boolean()) {
    out = *v;
    return true;
  }
  err = std::string(key) + " must be a boolean";
  return false;
}

static bool ReadString(const toml::node_view<toml::node>& nv, const char* key, std::string& out, std::string& err) {
  if (!nv) return true;
  if (auto v = nv.value<std::string>(); v && nv.is_string()) {
    out = *v;
    return true;
  }
  err = std::string(key) + " must be a string";
  return false;
}

static bool FromTable(toml::table& tbl, FileConfig& out, std::string& err) {
  FileConfig cfg;

  // parser
  if (auto parser = tbl["parser"]; parser.is_table()) {
    if (!ReadBool(parser["capture_help"], "parser.capture_help", cfg.capture_help, err)) return false;
  }

  // logging
  if (auto logging = tbl["logging"]; logging.is_table()) {
    if (!ReadString(logging["level"], "logging.level", cfg.log_level, err)) return false;
    if (!IsLogLevel(cfg.log_level)) {
      err = "logging.level: unknown level '" + cfg.log_level + "'";
      return false;
    }
  }

  out = std::move(cfg);
  return true;
}

static std::string DescribeError(const toml::parse_error& e) {
  const auto& where = e.source().begin;
  return std::string(e.description()) + " (line " + std::to_string(where.line) + ", column " +
         std::to_string(where.column) + ")";
}

} // namespace

bool ParseConfigToml(const std::string& path, FileConfig& out, std::string& err) {
  try {
    auto tbl = toml::parse_file(path);
    return FromTable(tbl, out, err);
  } catch (const toml::parse_error& e) {
    err = path + ": " + DescribeError(e);
  }
  return false;
}

bool ParseConfigTomlString(std::string_view text, FileConfig& out, std::string& err) {
  try {
    auto tbl = toml::parse(text);
    return FromTable(tbl, out, err);
  } catch (const toml::parse_error& e) {
    err = DescribeError(e);
  }
  return false;
}

ParseOptions ToParseOptions(const FileConfig& cfg) {
  ParseOptions opts;
  opts.capture_help = cfg.capture_help;
  return opts;
}

bool ApplyLogging(const FileConfig& cfg, std::string& err) {
  return SetLogLevel(cfg.log_level, err);
}

} // namespace promparse

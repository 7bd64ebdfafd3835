#include "Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <string_view>

namespace promparse {

namespace {
constexpr const char* kLoggerName = "promparse";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
} // namespace

std::shared_ptr<spdlog::logger> Log() {
  static std::shared_ptr<spdlog::logger> inst = [] {
    // Host may have registered its own sink under our name.
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::warn);
    return logger;
  }();
  return inst;
}

bool IsLogLevel(std::string_view level) {
  // from_str maps unknown names to off
  auto lvl = spdlog::level::from_str(std::string(level));
  return lvl != spdlog::level::off || level == "off";
}

bool SetLogLevel(std::string_view level, std::string& err) {
  if (!IsLogLevel(level)) {
    err = "unknown log level '" + std::string(level) + "'";
    return false;
  }
  Log()->set_level(spdlog::level::from_str(std::string(level)));
  return true;
}

} // namespace promparse

// Library logger (spdlog). One named logger, "promparse", on stderr.
#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace promparse {

// Returns the shared logger, creating it on first use (default level: warn).
std::shared_ptr<spdlog::logger> Log();

// True for spdlog level names: trace|debug|info|warn|error|critical|off.
bool IsLogLevel(std::string_view level);

// Returns false and fills `err` for an unknown level name.
bool SetLogLevel(std::string_view level, std::string& err);

} // namespace promparse

#pragma once

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace engram::core {

// Accepts trace, debug, info, warn/warning, error/err, critical/crit, off/none/silent.
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value);

// Applies a textual level to the default logger; unknown levels fall back to info.
void initLogging(std::string_view level);

} // namespace engram::core

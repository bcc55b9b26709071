#include <engram/core/logging.h>

#include <cctype>
#include <string>

namespace engram::core {

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view value) {
    std::string v;
    v.reserve(value.size());
    for (unsigned char c : value)
        v.push_back(static_cast<char>(std::tolower(c)));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void initLogging(std::string_view level) {
    if (auto lvl = parseLogLevel(level)) {
        spdlog::set_level(*lvl);
        return;
    }
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("Unknown log level '{}', using info", std::string(level));
}

} // namespace engram::core

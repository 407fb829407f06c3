// =============================================================================
// logging.cpp - spdlog Logger Setup
// =============================================================================

#include "perpcore/logging.hpp"
#include "perpcore/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <string>

namespace perpcore {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "perpcore";

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        instance = spdlog::get(LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stderr_color_mt(LOGGER_NAME);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

void set_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw ParamError("unknown log level: " + std::string(level));
    }
    logger()->set_level(parsed);
}

} // namespace logging
} // namespace perpcore

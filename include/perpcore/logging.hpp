#ifndef PERPCORE_LOGGING_HPP
#define PERPCORE_LOGGING_HPP

#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

namespace perpcore {
namespace logging {

// Shared "perpcore" logger; a stderr color sink is created on first use
std::shared_ptr<spdlog::logger> logger();

// trace | debug | info | warn | error | critical | off. Throws ParamError otherwise.
void set_level(std::string_view level);

} // namespace logging
} // namespace perpcore

#endif // PERPCORE_LOGGING_HPP

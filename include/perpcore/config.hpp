#ifndef PERPCORE_CONFIG_HPP
#define PERPCORE_CONFIG_HPP

#include "perpcore/market.hpp"
#include "perpcore/risk_params.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

namespace perpcore {

// =============================================================================
// Settings (JSON)
//
// {
//   "log_level": "info",
//   "market": { "address": "0x..", "fee_recipient": "0x.." },
//   "risk": { "k": "0.00000122", "cap_leverage": "5", "average_block_time": 14, ... }
// }
//
// X18 risk values are decimal strings or integers; second-valued parameters
// are integers. Omitted keys keep their defaults. Errors throw ParamError.
// =============================================================================

struct Settings {
    std::string log_level = "info";
    MarketConfig market{};
    RiskParams risk;

    static Settings from_file(std::string_view path);
    static Settings from_json_text(std::string_view content);
    static Settings from_json(const nlohmann::json& root);

    // Applies log_level to the perpcore logger
    void apply_logging() const;
};

} // namespace perpcore

#endif // PERPCORE_CONFIG_HPP

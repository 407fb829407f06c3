#ifndef PERPCORE_RISK_PARAMS_HPP
#define PERPCORE_RISK_PARAMS_HPP

#include "perpcore/types.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>

namespace perpcore {

// =============================================================================
// Risk Parameters (governance index order)
// =============================================================================

enum class RiskParameter : uint8_t {
    K = 0,                          // Funding constant per second (X18)
    LMBDA,                          // Market impact slope (X18)
    DELTA,                          // Static bid/ask spread (X18)
    CAP_PAYOFF,                     // Max long payoff multiple (X18)
    CAP_NOTIONAL,                   // Max notional per side (X18 quote)
    CAP_LEVERAGE,                   // Max leverage (X18)
    CIRCUIT_BREAKER_WINDOW,         // Seconds
    CIRCUIT_BREAKER_MINT_TARGET,    // X18 quote
    MAINTENANCE_MARGIN_FRACTION,    // X18
    MAINTENANCE_MARGIN_BURN_RATE,   // X18
    LIQUIDATION_FEE_RATE,           // X18
    TRADING_FEE_RATE,               // X18
    MIN_COLLATERAL,                 // X18 quote
    PRICE_DRIFT_UPPER_LIMIT,        // X18 per second
    AVERAGE_BLOCK_TIME              // Seconds
};

constexpr size_t RISK_PARAMETER_COUNT = 15;

struct ParamBounds {
    I128 min;
    I128 max;
};

const char* parameter_name(RiskParameter param);
std::optional<RiskParameter> parameter_from_name(std::string_view name);
std::optional<RiskParameter> parameter_from_index(size_t index);
ParamBounds parameter_bounds(RiskParameter param);

// Windows and block time hold plain seconds rather than X18
bool is_seconds(RiskParameter param);

// =============================================================================
// Risk Parameter Snapshot
// =============================================================================

class RiskParams {
public:
    // Built-in defaults, all within bounds
    RiskParams();

    I128 get(RiskParameter param) const {
        return values_[static_cast<size_t>(param)];
    }

    // Throws ParamError when value is outside parameter_bounds(param)
    void set(RiskParameter param, I128 value);

    I128 k() const { return get(RiskParameter::K); }
    I128 lmbda() const { return get(RiskParameter::LMBDA); }
    I128 delta() const { return get(RiskParameter::DELTA); }
    I128 cap_payoff() const { return get(RiskParameter::CAP_PAYOFF); }
    I128 cap_notional() const { return get(RiskParameter::CAP_NOTIONAL); }
    I128 cap_leverage() const { return get(RiskParameter::CAP_LEVERAGE); }
    uint64_t circuit_breaker_window() const {
        return static_cast<uint64_t>(get(RiskParameter::CIRCUIT_BREAKER_WINDOW));
    }
    I128 circuit_breaker_mint_target() const { return get(RiskParameter::CIRCUIT_BREAKER_MINT_TARGET); }
    I128 maintenance_margin_fraction() const { return get(RiskParameter::MAINTENANCE_MARGIN_FRACTION); }
    I128 maintenance_margin_burn_rate() const { return get(RiskParameter::MAINTENANCE_MARGIN_BURN_RATE); }
    I128 liquidation_fee_rate() const { return get(RiskParameter::LIQUIDATION_FEE_RATE); }
    I128 trading_fee_rate() const { return get(RiskParameter::TRADING_FEE_RATE); }
    I128 min_collateral() const { return get(RiskParameter::MIN_COLLATERAL); }
    I128 price_drift_upper_limit() const { return get(RiskParameter::PRICE_DRIFT_UPPER_LIMIT); }
    uint64_t average_block_time() const {
        return static_cast<uint64_t>(get(RiskParameter::AVERAGE_BLOCK_TIME));
    }

private:
    std::array<I128, RISK_PARAMETER_COUNT> values_;
};

// =============================================================================
// Params Store (versioned, governance-writable)
//
// Computation reads one immutable snapshot per operation; set() publishes a
// new snapshot and never mutates one already handed out.
// =============================================================================

class ParamsStore {
public:
    explicit ParamsStore(const RiskParams& initial = RiskParams());

    // Non-copyable
    ParamsStore(const ParamsStore&) = delete;
    ParamsStore& operator=(const ParamsStore&) = delete;

    std::shared_ptr<const RiskParams> snapshot() const;

    // Throws ParamError when out of bounds; the current snapshot is kept
    void set(RiskParameter param, I128 value);
    void set(size_t index, I128 value);

    uint64_t version() const;

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const RiskParams> current_;
    uint64_t version_ = 0;
};

} // namespace perpcore

#endif // PERPCORE_RISK_PARAMS_HPP

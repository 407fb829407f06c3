// =============================================================================
// risk_params.cpp - Risk Parameter Table and Versioned Store
// =============================================================================

#include "perpcore/risk_params.hpp"
#include "perpcore/errors.hpp"
#include "perpcore/fixed_point.hpp"
#include "perpcore/logging.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <string>

namespace perpcore {

namespace {

struct ParamSpec {
    RiskParameter param;
    const char* name;
    I128 default_value;
    ParamBounds bounds;
    bool seconds;
};

constexpr I128 E12 = 1000000000000LL;
constexpr I128 E14 = 100000000000000LL;
constexpr I128 E15 = 1000000000000000LL;
constexpr I128 E16 = 10000000000000000LL;
constexpr I128 E17 = 100000000000000000LL;

const std::array<ParamSpec, RISK_PARAMETER_COUNT> PARAM_TABLE = {{
    // param                                     name                            default                    min        max
    {RiskParameter::K,                            "k",                            1220000000000LL,           {0, 10 * E12},                 false},
    {RiskParameter::LMBDA,                        "lmbda",                        X18_ONE,                   {0, 10 * X18_ONE},             false},
    {RiskParameter::DELTA,                        "delta",                        25 * E14,                  {0, 2 * E16},                  false},
    {RiskParameter::CAP_PAYOFF,                   "cap_payoff",                   5 * X18_ONE,               {X18_ONE, 10 * X18_ONE},       false},
    {RiskParameter::CAP_NOTIONAL,                 "cap_notional",                 800000 * X18_ONE,          {0, 8000000 * X18_ONE},        false},
    {RiskParameter::CAP_LEVERAGE,                 "cap_leverage",                 5 * X18_ONE,               {X18_ONE, 20 * X18_ONE},       false},
    {RiskParameter::CIRCUIT_BREAKER_WINDOW,       "circuit_breaker_window",       2592000,                   {86400, 31536000},             true},
    {RiskParameter::CIRCUIT_BREAKER_MINT_TARGET,  "circuit_breaker_mint_target",  66670 * X18_ONE,           {0, 8000000 * X18_ONE},        false},
    {RiskParameter::MAINTENANCE_MARGIN_FRACTION,  "maintenance_margin_fraction",  E17,                       {0, 2 * E17},                  false},
    {RiskParameter::MAINTENANCE_MARGIN_BURN_RATE, "maintenance_margin_burn_rate", 5 * E16,                   {0, 5 * E17},                  false},
    {RiskParameter::LIQUIDATION_FEE_RATE,         "liquidation_fee_rate",         5 * E15,                   {0, 2 * E17},                  false},
    {RiskParameter::TRADING_FEE_RATE,             "trading_fee_rate",             750000000000000LL,         {0, 5 * E15},                  false},
    {RiskParameter::MIN_COLLATERAL,               "min_collateral",               E14,                       {1000000, 1000000 * X18_ONE},  false},
    {RiskParameter::PRICE_DRIFT_UPPER_LIMIT,      "price_drift_upper_limit",      E14,                       {0, E16},                      false},
    {RiskParameter::AVERAGE_BLOCK_TIME,           "average_block_time",           14,                        {1, 3600},                     true},
}};

const ParamSpec& spec_of(RiskParameter param) {
    return PARAM_TABLE[static_cast<size_t>(param)];
}

std::string render(RiskParameter param, I128 value) {
    return spec_of(param).seconds ? to_string(value) : x18::format(value);
}

} // anonymous namespace

// =============================================================================
// Parameter Metadata
// =============================================================================

const char* parameter_name(RiskParameter param) {
    return spec_of(param).name;
}

std::optional<RiskParameter> parameter_from_name(std::string_view name) {
    for (const auto& spec : PARAM_TABLE) {
        if (name == spec.name) return spec.param;
    }
    return std::nullopt;
}

std::optional<RiskParameter> parameter_from_index(size_t index) {
    if (index >= RISK_PARAMETER_COUNT) return std::nullopt;
    return static_cast<RiskParameter>(index);
}

ParamBounds parameter_bounds(RiskParameter param) {
    return spec_of(param).bounds;
}

bool is_seconds(RiskParameter param) {
    return spec_of(param).seconds;
}

// =============================================================================
// RiskParams
// =============================================================================

RiskParams::RiskParams() {
    for (const auto& spec : PARAM_TABLE) {
        values_[static_cast<size_t>(spec.param)] = spec.default_value;
    }
}

void RiskParams::set(RiskParameter param, I128 value) {
    const ParamSpec& spec = spec_of(param);
    if (value < spec.bounds.min || value > spec.bounds.max) {
        throw ParamError(std::string(spec.name) + " = " + render(param, value) +
                         " outside [" + render(param, spec.bounds.min) + ", " +
                         render(param, spec.bounds.max) + "]");
    }
    values_[static_cast<size_t>(param)] = value;
}

// =============================================================================
// ParamsStore
// =============================================================================

ParamsStore::ParamsStore(const RiskParams& initial)
    : current_(std::make_shared<const RiskParams>(initial)) {}

std::shared_ptr<const RiskParams> ParamsStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return current_;
}

void ParamsStore::set(RiskParameter param, I128 value) {
    std::unique_lock lock(mutex_);

    auto next = std::make_shared<RiskParams>(*current_);
    next->set(param, value);
    current_ = std::move(next);
    ++version_;

    logging::logger()->info("risk param {} set to {} (version {})",
                            parameter_name(param), render(param, value), version_);
}

void ParamsStore::set(size_t index, I128 value) {
    auto param = parameter_from_index(index);
    if (!param) {
        throw ParamError("unknown parameter index " + std::to_string(index));
    }
    set(*param, value);
}

uint64_t ParamsStore::version() const {
    std::shared_lock lock(mutex_);
    return version_;
}

} // namespace perpcore

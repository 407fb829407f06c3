#ifndef PERPCORE_ERRORS_HPP
#define PERPCORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace perpcore {

// =============================================================================
// Market Failure Reasons (closed taxonomy, stable strings)
// =============================================================================

enum class Reason : uint8_t {
    LEVERAGE_MIN,        // "lev<min"
    LEVERAGE_MAX,        // "lev>max"
    COLLATERAL_MIN,      // "collateral<min"
    OI_ZERO,             // "oi==0"
    OI_CAP,              // "oi>cap"
    LIQUIDATABLE,        // "liquidatable"
    NOT_LIQUIDATABLE,    // "!liquidatable"
    FRACTION_MIN,        // "fraction<min"
    FRACTION_MAX,        // "fraction>max"
    POSITION_NOT_FOUND,  // "!position" (missing, not owned, or liquidated)
    SLIPPAGE,            // "slippage>max"
    REENTRANT            // "reentrant"
};

const char* reason_string(Reason reason);

// =============================================================================
// Exceptions
// =============================================================================

// Precondition violation in a market operation. The enclosing call commits nothing.
class MarketError : public std::runtime_error {
public:
    explicit MarketError(Reason reason)
        : std::runtime_error(reason_string(reason)), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

// Overflow, division by zero or a time step backwards in fixed-point code
class ArithmeticError : public std::runtime_error {
public:
    explicit ArithmeticError(const std::string& msg)
        : std::runtime_error("arithmetic: " + msg) {}
};

// Settlement rejected by the token ledger
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& msg)
        : std::runtime_error("ledger: " + msg) {}
};

// Out-of-bounds risk parameter or malformed configuration
class ParamError : public std::invalid_argument {
public:
    explicit ParamError(const std::string& msg)
        : std::invalid_argument("params: " + msg) {}
};

} // namespace perpcore

#endif // PERPCORE_ERRORS_HPP

// =============================================================================
// types.cpp - Address and Integer Formatting
// =============================================================================

#include "perpcore/types.hpp"
#include "perpcore/errors.hpp"

#include <algorithm>

namespace perpcore {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address from_hex(const std::string& hex) {
    size_t start = (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) ? 2 : 0;
    if (hex.size() - start != 40) {
        throw ParamError("address must have 40 hex digits: " + hex);
    }

    Address addr = {};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[start + 2 * i]);
        int lo = hex_value(hex[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ParamError("invalid hex digit in address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

std::string to_string(I128 v) {
    if (v == 0) return "0";

    bool neg = v < 0;
    U128 u = neg ? U128(0) - static_cast<U128>(v) : static_cast<U128>(v);

    std::string out;
    while (u != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

const char* reason_string(Reason reason) {
    switch (reason) {
        case Reason::LEVERAGE_MIN:       return "lev<min";
        case Reason::LEVERAGE_MAX:       return "lev>max";
        case Reason::COLLATERAL_MIN:     return "collateral<min";
        case Reason::OI_ZERO:            return "oi==0";
        case Reason::OI_CAP:             return "oi>cap";
        case Reason::LIQUIDATABLE:       return "liquidatable";
        case Reason::NOT_LIQUIDATABLE:   return "!liquidatable";
        case Reason::FRACTION_MIN:       return "fraction<min";
        case Reason::FRACTION_MAX:       return "fraction>max";
        case Reason::POSITION_NOT_FOUND: return "!position";
        case Reason::SLIPPAGE:           return "slippage>max";
        case Reason::REENTRANT:          return "reentrant";
    }
    return "unknown";
}

} // namespace perpcore

#ifndef PERPCORE_TYPES_HPP
#define PERPCORE_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>

namespace perpcore {

// =============================================================================
// Fixed-Point Scalars (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 X18_TWO = 2 * X18_ONE;

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

// =============================================================================
// Accounts (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Zero address: source of mints and sink of burns in the transfer journal
constexpr Address BURN = {};

// Helper to create a test/simulation address from a small integer
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

inline uint64_t hash(const Address& addr) {
    uint64_t h = 0;
    for (auto b : addr) h = h * 31 + b;
    return h;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x"; throws ParamError on malformed input
Address from_hex(const std::string& hex);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& addr) const {
        return static_cast<size_t>(addresses::hash(addr));
    }
};

// =============================================================================
// Helpers
// =============================================================================

inline I128 abs128(I128 x) { return x < 0 ? -x : x; }

// Decimal rendering of a 128-bit integer (for logs and error messages)
std::string to_string(I128 v);

} // namespace perpcore

#endif // PERPCORE_TYPES_HPP

#ifndef PERPCORE_FIXED_POINT_HPP
#define PERPCORE_FIXED_POINT_HPP

#include "perpcore/types.hpp"

#include <string>

namespace perpcore {

// =============================================================================
// X18 Fixed-Point Arithmetic
//
// All products and quotients go through a 256-bit intermediate. Results round
// the magnitude down unless the function name says "up". Overflow of the
// 127-bit result and division by zero throw ArithmeticError.
// =============================================================================

namespace x18 {

constexpr I128 LN2 = 693147180559945309LL;  // ln(2) * 1e18

// exp() arguments above this overflow the result; below MIN_EXP_INPUT the
// result floors to zero
constexpr I128 MAX_EXP_INPUT = 46 * X18_ONE;
constexpr I128 MIN_EXP_INPUT = -42 * X18_ONE;

// Largest impact exponent a trade may pay (e^20 ~ 4.85e8)
constexpr I128 MAX_NATURAL_EXPONENT = 20 * X18_ONE;

I128 add(I128 a, I128 b);
I128 sub(I128 a, I128 b);

// a * b / denom with a 256-bit product
I128 mul_div(I128 a, I128 b, I128 denom);
I128 mul_div_up(I128 a, I128 b, I128 denom);

inline I128 mul_down(I128 a, I128 b) { return mul_div(a, b, X18_ONE); }
inline I128 mul_up(I128 a, I128 b) { return mul_div_up(a, b, X18_ONE); }
inline I128 div_down(I128 a, I128 b) { return mul_div(a, X18_ONE, b); }
inline I128 div_up(I128 a, I128 b) { return mul_div_up(a, X18_ONE, b); }

// e^x for signed x. Range reduction x = k*ln2 + r, Taylor series on r.
I128 exp(I128 x);

// Natural log for x > 0. Normalizes to [1, 2) and sums the atanh series.
I128 ln(I128 x);

inline I128 min(I128 a, I128 b) { return a < b ? a : b; }
inline I128 max(I128 a, I128 b) { return a > b ? a : b; }

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// Exact decimal text ("-12.5", "0.00125") to X18. Throws ParamError when the
// text is malformed, carries more than 18 fractional digits, or overflows.
I128 parse(const std::string& text);

// X18 to decimal text with trailing zeros trimmed
std::string format(I128 v);

} // namespace x18

} // namespace perpcore

#endif // PERPCORE_FIXED_POINT_HPP

// =============================================================================
// fixed_point.cpp - X18 Arithmetic, exp/ln
// =============================================================================

#include "perpcore/fixed_point.hpp"
#include "perpcore/errors.hpp"

namespace perpcore {
namespace x18 {

namespace {

// Magnitude of a signed value; well-defined for the most negative I128
inline U128 magnitude(I128 x) {
    return x < 0 ? U128(0) - static_cast<U128>(x) : static_cast<U128>(x);
}

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;
    U128 hi;
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

// Divide U256 by a nonzero denom <= 2^127. Throws if the quotient needs more
// than 128 bits. Sets inexact when the remainder is nonzero.
U128 div_u256_u128(const U256& num, U128 denom, bool& inexact) {
    if (num.hi == 0) {
        inexact = (num.lo % denom) != 0;
        return num.lo / denom;
    }
    if (num.hi >= denom) {
        throw ArithmeticError("mul_div overflow");
    }

    // rem < denom <= 2^127 throughout, so the shift below never drops a bit
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    inexact = rem != 0;
    return quot;
}

I128 to_signed(U128 mag, bool neg) {
    if (mag > static_cast<U128>(I128_MAX)) {
        throw ArithmeticError("result exceeds 127 bits");
    }
    I128 v = static_cast<I128>(mag);
    return neg ? -v : v;
}

I128 mul_div_impl(I128 a, I128 b, I128 denom, bool round_up) {
    if (denom == 0) {
        throw ArithmeticError("division by zero");
    }

    bool neg = (a < 0) ^ (b < 0) ^ (denom < 0);
    bool inexact = false;
    U128 quot = div_u256_u128(mul_u128(magnitude(a), magnitude(b)), magnitude(denom), inexact);

    if (round_up && inexact) {
        if (quot == ~U128(0)) throw ArithmeticError("mul_div overflow");
        quot += 1;
    }
    return to_signed(quot, neg && quot != 0);
}

} // anonymous namespace

// =============================================================================
// Checked Add/Sub
// =============================================================================

I128 add(I128 a, I128 b) {
    I128 r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw ArithmeticError("add overflow");
    }
    return r;
}

I128 sub(I128 a, I128 b) {
    I128 r;
    if (__builtin_sub_overflow(a, b, &r)) {
        throw ArithmeticError("sub overflow");
    }
    return r;
}

I128 mul_div(I128 a, I128 b, I128 denom) {
    return mul_div_impl(a, b, denom, false);
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    return mul_div_impl(a, b, denom, true);
}

// =============================================================================
// Exponential / Logarithm
// =============================================================================

I128 exp(I128 x) {
    if (x > MAX_EXP_INPUT) {
        throw ArithmeticError("exp overflow: " + format(x));
    }
    if (x < MIN_EXP_INPUT) return 0;
    if (x == 0) return X18_ONE;

    // k = round(x / ln2), |r| <= ln2 / 2
    I128 half = x >= 0 ? LN2 / 2 : -LN2 / 2;
    I128 k = (x + half) / LN2;
    I128 r = x - k * LN2;

    // Taylor series; |term * r| < 1e36 so the products fit
    I128 sum = X18_ONE;
    I128 term = X18_ONE;
    for (int n = 1; n < 64; ++n) {
        term = term * r / X18_ONE / n;
        if (term == 0) break;
        sum += term;
    }

    if (k >= 0) {
        U128 scaled = static_cast<U128>(sum) << static_cast<int>(k);
        if ((scaled >> static_cast<int>(k)) != static_cast<U128>(sum) ||
            scaled > static_cast<U128>(I128_MAX)) {
            throw ArithmeticError("exp overflow: " + format(x));
        }
        return static_cast<I128>(scaled);
    }
    if (k <= -127) return 0;
    return sum >> static_cast<int>(-k);
}

I128 ln(I128 x) {
    if (x <= 0) {
        throw ArithmeticError("ln of non-positive value: " + format(x));
    }

    // x = y * 2^k with y in [1, 2)
    I128 y = x;
    I128 k = 0;
    while (y >= X18_TWO) {
        y >>= 1;
        ++k;
    }
    while (y < X18_ONE) {
        y <<= 1;
        --k;
    }

    // ln(y) = 2 * atanh(s), s = (y - 1) / (y + 1) in [0, 1/3)
    I128 s = (y - X18_ONE) * X18_ONE / (y + X18_ONE);
    I128 s2 = s * s / X18_ONE;
    I128 sum = s;
    I128 term = s;
    for (int n = 3; n < 200; n += 2) {
        term = term * s2 / X18_ONE;
        if (term == 0) break;
        sum += term / n;
    }

    return k * LN2 + 2 * sum;
}

// =============================================================================
// Decimal Text
// =============================================================================

I128 parse(const std::string& text) {
    size_t i = 0;
    bool neg = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        neg = text[i] == '-';
        ++i;
    }

    U128 whole = 0;
    size_t int_digits = 0;
    for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i, ++int_digits) {
        whole = whole * 10 + static_cast<U128>(text[i] - '0');
        if (whole > static_cast<U128>(I128_MAX / X18_ONE)) {
            throw ParamError("decimal overflows X18: " + text);
        }
    }

    U128 frac = 0;
    size_t frac_digits = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i, ++frac_digits) {
            if (frac_digits == 18) {
                throw ParamError("more than 18 fractional digits: " + text);
            }
            frac = frac * 10 + static_cast<U128>(text[i] - '0');
        }
    }

    if (i != text.size() || (int_digits == 0 && frac_digits == 0)) {
        throw ParamError("malformed decimal: '" + text + "'");
    }

    for (size_t d = frac_digits; d < 18; ++d) frac *= 10;

    U128 mag = whole * static_cast<U128>(X18_ONE) + frac;
    if (mag > static_cast<U128>(I128_MAX)) {
        throw ParamError("decimal overflows X18: " + text);
    }
    I128 v = static_cast<I128>(mag);
    return neg ? -v : v;
}

std::string format(I128 v) {
    U128 mag = magnitude(v);
    U128 whole = mag / static_cast<U128>(X18_ONE);
    U128 frac = mag % static_cast<U128>(X18_ONE);

    std::string out = (v < 0 ? "-" : "") + to_string(static_cast<I128>(whole));
    if (frac != 0) {
        std::string digits = to_string(static_cast<I128>(frac));
        digits.insert(0, 18 - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return out;
}

} // namespace x18
} // namespace perpcore

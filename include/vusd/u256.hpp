#ifndef VUSD_U256_HPP
#define VUSD_U256_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace vusd {

using I128 = __int128;
using U128 = unsigned __int128;

// =============================================================================
// U256 - Unsigned 256-bit Integer (two U128 limbs)
// =============================================================================
//
// Arithmetic operators wrap modulo 2^256. Ledger code goes through the
// checked helpers in namespace u256 instead, which report overflow.

class U256 {
public:
    constexpr U256() : lo_(0), hi_(0) {}
    constexpr U256(uint64_t v) : lo_(v), hi_(0) {}
    constexpr U256(U128 lo, U128 hi) : lo_(lo), hi_(hi) {}

    static constexpr U256 from_u128(U128 v) { return U256(v, 0); }
    static constexpr U256 max() { return U256(~U128(0), ~U128(0)); }

    // Parse a base-10 string; nullopt on empty input, bad digits or overflow
    static std::optional<U256> from_string(std::string_view dec);

    std::string to_string() const;

    constexpr U128 lo() const { return lo_; }
    constexpr U128 hi() const { return hi_; }
    constexpr bool is_zero() const { return lo_ == 0 && hi_ == 0; }

    // Number of significant bits (0 for zero)
    int bit_length() const;
    bool bit(int i) const;

    constexpr bool operator==(const U256& o) const { return lo_ == o.lo_ && hi_ == o.hi_; }
    constexpr bool operator!=(const U256& o) const { return !(*this == o); }
    constexpr bool operator<(const U256& o) const {
        return hi_ < o.hi_ || (hi_ == o.hi_ && lo_ < o.lo_);
    }
    constexpr bool operator>(const U256& o) const { return o < *this; }
    constexpr bool operator<=(const U256& o) const { return !(o < *this); }
    constexpr bool operator>=(const U256& o) const { return !(*this < o); }

    U256 operator+(const U256& o) const;
    U256 operator-(const U256& o) const;
    U256 operator*(const U256& o) const;
    U256 operator/(const U256& o) const;
    U256 operator%(const U256& o) const;
    U256 operator<<(int shift) const;
    U256 operator>>(int shift) const;

    U256& operator+=(const U256& o) { return *this = *this + o; }
    U256& operator-=(const U256& o) { return *this = *this - o; }

private:
    U128 lo_;
    U128 hi_;
};

std::ostream& operator<<(std::ostream& os, const U256& v);

// =============================================================================
// U512 - Wide Product for mul_div
// =============================================================================

struct U512 {
    U256 lo;
    U256 hi;

    bool operator==(const U512& o) const { return lo == o.lo && hi == o.hi; }
    bool operator<(const U512& o) const {
        return hi < o.hi || (hi == o.hi && lo < o.lo);
    }
    bool operator>=(const U512& o) const { return !(*this < o); }
};

// =============================================================================
// Checked / Wide Operations
// =============================================================================

namespace u256 {

// Each returns false on overflow/underflow and leaves out untouched
bool checked_add(const U256& a, const U256& b, U256& out);
bool checked_sub(const U256& a, const U256& b, U256& out);
bool checked_mul(const U256& a, const U256& b, U256& out);

// Full 512-bit product
U512 mul_wide(const U256& a, const U256& b);

// 512 - 512, caller guarantees a >= b
U512 sub_wide(const U512& a, const U512& b);

// Divide 512 by 256; quotient is 512 bits wide. Divisor must be non-zero.
void divmod_wide(const U512& num, const U256& denom, U512& quot, U256& rem);

// floor(a * b / denom) with a 512-bit intermediate.
// nullopt when denom is zero or the quotient does not fit in 256 bits.
std::optional<U256> mul_div(const U256& a, const U256& b, const U256& denom);

// 10^exp, nullopt when exp > 77
std::optional<U256> pow10(unsigned exp);

} // namespace u256

} // namespace vusd

#endif // VUSD_U256_HPP

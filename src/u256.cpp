// =============================================================================
// u256.cpp - 256-bit Unsigned Arithmetic
// =============================================================================

#include "vusd/u256.hpp"

namespace vusd {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

// Multiply two U128 values into a 256-bit (lo, hi) pair
inline void mul_u128(U128 a, U128 b, U128& lo, U128& hi) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    lo = (p0 & MASK64) | (mid << 64);
    hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
}

// acc += v, counting the carry out
inline void add_carry(U128& acc, U128 v, U128& carry) {
    acc += v;
    if (acc < v) ++carry;
}

inline int u128_bit_length(U128 v) {
    int n = 0;
    while (v != 0) { v >>= 1; ++n; }
    return n;
}

// Binary long division, 256 by 256
void divmod(const U256& num, const U256& denom, U256& quot, U256& rem) {
    quot = U256();
    rem = U256();
    if (denom.is_zero()) return;
    if (num < denom) {
        rem = num;
        return;
    }
    if (num.hi() == 0) {
        // denom <= num, so denom fits in 128 bits as well
        quot = U256::from_u128(num.lo() / denom.lo());
        rem = U256::from_u128(num.lo() % denom.lo());
        return;
    }

    for (int i = num.bit_length() - 1; i >= 0; --i) {
        bool carry = rem.bit(255);
        rem = rem << 1;
        if (num.bit(i)) rem = rem + U256(1);
        quot = quot << 1;
        // With the carry set the true remainder is rem + 2^256 > denom;
        // the wrapping subtraction below still yields the right value.
        if (carry || rem >= denom) {
            rem = rem - denom;
            quot = quot + U256(1);
        }
    }
}

} // anonymous namespace

// =============================================================================
// U256 Members
// =============================================================================

std::optional<U256> U256::from_string(std::string_view dec) {
    if (dec.empty()) return std::nullopt;

    U256 value;
    for (char c : dec) {
        if (c < '0' || c > '9') return std::nullopt;
        U256 next;
        if (!u256::checked_mul(value, U256(10), next)) return std::nullopt;
        if (!u256::checked_add(next, U256(static_cast<uint64_t>(c - '0')), value)) {
            return std::nullopt;
        }
    }
    return value;
}

std::string U256::to_string() const {
    if (is_zero()) return "0";

    // Peel off base-1e19 chunks, least significant first
    const U256 chunk_base(10000000000000000000ULL);
    std::string out;
    U256 value = *this;
    while (!value.is_zero()) {
        U256 q;
        U256 r;
        divmod(value, chunk_base, q, r);
        std::string digits = std::to_string(static_cast<uint64_t>(r.lo()));
        if (!q.is_zero()) {
            digits.insert(0, 19 - digits.size(), '0');
        }
        out.insert(0, digits);
        value = q;
    }
    return out;
}

int U256::bit_length() const {
    if (hi_ != 0) return 128 + u128_bit_length(hi_);
    return u128_bit_length(lo_);
}

bool U256::bit(int i) const {
    if (i < 0 || i >= 256) return false;
    if (i < 128) return ((lo_ >> i) & 1) != 0;
    return ((hi_ >> (i - 128)) & 1) != 0;
}

U256 U256::operator+(const U256& o) const {
    U128 lo = lo_ + o.lo_;
    U128 carry = lo < lo_ ? 1 : 0;
    return U256(lo, hi_ + o.hi_ + carry);
}

U256 U256::operator-(const U256& o) const {
    U128 borrow = lo_ < o.lo_ ? 1 : 0;
    return U256(lo_ - o.lo_, hi_ - o.hi_ - borrow);
}

U256 U256::operator*(const U256& o) const {
    return u256::mul_wide(*this, o).lo;
}

// Division by zero yields zero
U256 U256::operator/(const U256& o) const {
    U256 q;
    U256 r;
    divmod(*this, o, q, r);
    return q;
}

U256 U256::operator%(const U256& o) const {
    U256 q;
    U256 r;
    divmod(*this, o, q, r);
    return r;
}

U256 U256::operator<<(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return U256();
    if (shift >= 128) return U256(0, lo_ << (shift - 128));
    return U256(lo_ << shift, (hi_ << shift) | (lo_ >> (128 - shift)));
}

U256 U256::operator>>(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return U256();
    if (shift >= 128) return U256(hi_ >> (shift - 128), 0);
    return U256((lo_ >> shift) | (hi_ << (128 - shift)), hi_ >> shift);
}

std::ostream& operator<<(std::ostream& os, const U256& v) {
    return os << v.to_string();
}

// =============================================================================
// Checked / Wide Operations
// =============================================================================

namespace u256 {

bool checked_add(const U256& a, const U256& b, U256& out) {
    U256 sum = a + b;
    if (sum < a) return false;
    out = sum;
    return true;
}

bool checked_sub(const U256& a, const U256& b, U256& out) {
    if (a < b) return false;
    out = a - b;
    return true;
}

bool checked_mul(const U256& a, const U256& b, U256& out) {
    U512 p = mul_wide(a, b);
    if (!p.hi.is_zero()) return false;
    out = p.lo;
    return true;
}

U512 mul_wide(const U256& a, const U256& b) {
    U128 l00, h00, l01, h01, l10, h10, l11, h11;
    mul_u128(a.lo(), b.lo(), l00, h00);
    mul_u128(a.lo(), b.hi(), l01, h01);
    mul_u128(a.hi(), b.lo(), l10, h10);
    mul_u128(a.hi(), b.hi(), l11, h11);

    U128 w0 = l00;

    U128 w1 = h00;
    U128 c1 = 0;
    add_carry(w1, l01, c1);
    add_carry(w1, l10, c1);

    U128 w2 = h01;
    U128 c2 = 0;
    add_carry(w2, h10, c2);
    add_carry(w2, l11, c2);
    add_carry(w2, c1, c2);

    // Cannot carry out: the full product fits in 512 bits
    U128 w3 = h11 + c2;

    return U512{U256(w0, w1), U256(w2, w3)};
}

U512 sub_wide(const U512& a, const U512& b) {
    U256 lo = a.lo - b.lo;
    U256 borrow = a.lo < b.lo ? U256(1) : U256();
    return U512{lo, a.hi - b.hi - borrow};
}

void divmod_wide(const U512& num, const U256& denom, U512& quot, U256& rem) {
    quot = U512{};
    rem = U256();
    if (denom.is_zero()) return;

    if (num.hi.is_zero()) {
        divmod(num.lo, denom, quot.lo, rem);
        return;
    }

    int top = 256 + num.hi.bit_length() - 1;
    for (int i = top; i >= 0; --i) {
        bool carry = rem.bit(255);
        rem = rem << 1;
        bool in = i >= 256 ? num.hi.bit(i - 256) : num.lo.bit(i);
        if (in) rem = rem + U256(1);

        quot.hi = (quot.hi << 1) + (quot.lo.bit(255) ? U256(1) : U256());
        quot.lo = quot.lo << 1;
        if (carry || rem >= denom) {
            rem = rem - denom;
            quot.lo = quot.lo + U256(1);
        }
    }
}

std::optional<U256> mul_div(const U256& a, const U256& b, const U256& denom) {
    if (denom.is_zero()) return std::nullopt;

    U512 product = mul_wide(a, b);
    U512 quot;
    U256 rem;
    divmod_wide(product, denom, quot, rem);
    if (!quot.hi.is_zero()) return std::nullopt;
    return quot.lo;
}

std::optional<U256> pow10(unsigned exp) {
    if (exp > 77) return std::nullopt;
    U256 result(1);
    for (unsigned i = 0; i < exp; ++i) {
        result = result * U256(10);
    }
    return result;
}

} // namespace u256

} // namespace vusd

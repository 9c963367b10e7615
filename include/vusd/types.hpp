#ifndef VUSD_TYPES_HPP
#define VUSD_TYPES_HPP

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "u256.hpp"

namespace vusd {

// =============================================================================
// Addresses (EVM-style 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Deterministic address with the id in the low two bytes, for fixtures and
// well-known deployments: 0x000000000000000000000000000000000000IIII
constexpr Address from_id(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Parse "0x" + 40 hex digits (prefix optional, case-insensitive)
std::optional<Address> from_hex(std::string_view hex);

// Lowercase "0x"-prefixed rendering
std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

namespace x18 {

constexpr uint8_t DECIMALS = 18;

constexpr U256 SCALE{1000000000000000000ULL};                    // 1e18
constexpr U256 COLLATERALIZATION_RATIO{1500000000000000000ULL};  // 1.50
constexpr U256 LIQUIDATION_THRESHOLD{1100000000000000000ULL};    // 1.10

// Whole units to X18
inline U256 from_int(uint64_t v) {
    return U256(v) * SCALE;
}

// Whole units plus a fractional part given in 1e-18 steps
inline U256 from_parts(uint64_t whole, uint64_t frac_x18) {
    return U256(whole) * SCALE + U256(frac_x18);
}

} // namespace x18

// =============================================================================
// Vault Health Classification
// =============================================================================

enum class VaultStatus : uint8_t {
    HEALTHY = 0,       // at or above the collateralization ratio
    AT_RISK = 1,       // below the ratio, at or above the liquidation threshold
    LIQUIDATABLE = 2   // below the liquidation threshold
};

const char* to_string(VaultStatus status);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t NO_SUCH_VAULT = -1;
constexpr int32_t ALREADY_EXISTS = -2;
constexpr int32_t ZERO_AMOUNT = -3;
constexpr int32_t INSUFFICIENT_COLLATERAL = -4;
constexpr int32_t EXCEEDS_DEBT = -5;
constexpr int32_t RATIO_VIOLATION = -6;
constexpr int32_t NOT_LIQUIDATABLE = -7;
constexpr int32_t AMOUNT_MISMATCH = -8;
constexpr int32_t ARITHMETIC_OVERFLOW = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INVALID_PRICE = -22;
constexpr int32_t TRANSFER_FAILED = -23;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t UNAUTHORIZED = -40;

const char* to_string(int32_t code);
}

} // namespace vusd

#endif // VUSD_TYPES_HPP

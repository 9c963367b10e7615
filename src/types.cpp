// =============================================================================
// types.cpp - Address Helpers, Status and Error Names
// =============================================================================

#include "vusd/types.hpp"

namespace vusd {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

const char* to_string(VaultStatus status) {
    switch (status) {
        case VaultStatus::HEALTHY: return "healthy";
        case VaultStatus::AT_RISK: return "at_risk";
        case VaultStatus::LIQUIDATABLE: return "liquidatable";
    }
    return "unknown";
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case NO_SUCH_VAULT: return "no_such_vault";
        case ALREADY_EXISTS: return "already_exists";
        case ZERO_AMOUNT: return "zero_amount";
        case INSUFFICIENT_COLLATERAL: return "insufficient_collateral";
        case EXCEEDS_DEBT: return "exceeds_debt";
        case RATIO_VIOLATION: return "ratio_violation";
        case NOT_LIQUIDATABLE: return "not_liquidatable";
        case AMOUNT_MISMATCH: return "amount_mismatch";
        case ARITHMETIC_OVERFLOW: return "arithmetic_overflow";
        case INSUFFICIENT_BALANCE: return "insufficient_balance";
        case INVALID_PRICE: return "invalid_price";
        case TRANSFER_FAILED: return "transfer_failed";
        case REENTRANCY: return "reentrancy";
        case UNAUTHORIZED: return "unauthorized";
        default: return "unknown_error";
    }
}

} // namespace errors

} // namespace vusd

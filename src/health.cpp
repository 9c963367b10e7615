// =============================================================================
// health.cpp - Collateralization Predicates
// =============================================================================

#include "vusd/health.hpp"

namespace vusd {
namespace health {

namespace {

// floor(collateral * price / SCALE) * SCALE, kept at 512 bits
U512 truncated_value_x18(const U256& collateral, const U256& price_x18) {
    U512 product = u256::mul_wide(collateral, price_x18);
    U512 quot;
    U256 rem;
    u256::divmod_wide(product, x18::SCALE, quot, rem);
    return u256::sub_wide(product, U512{rem, U256()});
}

} // anonymous namespace

std::optional<U256> collateral_value(const U256& collateral, const U256& price_x18) {
    return u256::mul_div(collateral, price_x18, x18::SCALE);
}

bool is_healthy(const U256& collateral, const U256& debt, const U256& price_x18) {
    if (debt.is_zero()) return true;

    U512 value = truncated_value_x18(collateral, price_x18);
    U512 required = u256::mul_wide(debt, x18::COLLATERALIZATION_RATIO);
    return value >= required;
}

bool is_liquidatable(const U256& collateral, const U256& debt, const U256& price_x18) {
    if (debt.is_zero()) return false;

    U512 value = truncated_value_x18(collateral, price_x18);
    U512 threshold = u256::mul_wide(debt, x18::LIQUIDATION_THRESHOLD);
    return value < threshold;
}

VaultStatus classify(const U256& collateral, const U256& debt, const U256& price_x18) {
    if (is_healthy(collateral, debt, price_x18)) return VaultStatus::HEALTHY;
    if (is_liquidatable(collateral, debt, price_x18)) return VaultStatus::LIQUIDATABLE;
    return VaultStatus::AT_RISK;
}

std::optional<U256> max_debt(const U256& collateral, const U256& price_x18) {
    return u256::mul_div(collateral, price_x18, x18::COLLATERALIZATION_RATIO);
}

std::optional<U256> collateral_ratio(const U256& collateral, const U256& debt,
                                     const U256& price_x18) {
    if (debt.is_zero()) return std::nullopt;

    U512 value = truncated_value_x18(collateral, price_x18);
    U512 quot;
    U256 rem;
    u256::divmod_wide(value, debt, quot, rem);
    if (!quot.hi.is_zero()) return std::nullopt;
    return quot.lo;
}

} // namespace health
} // namespace vusd

#ifndef VUSD_HEALTH_HPP
#define VUSD_HEALTH_HPP

#include <optional>

#include "types.hpp"

namespace vusd {

// =============================================================================
// Health Math (pure functions of collateral, debt and a 1e18 unit price)
// =============================================================================
//
// Collateral value is floor(collateral * price / SCALE). Truncation only ever
// lowers the value, so a vault never looks healthier than the feed says.
//
//   healthy:       debt == 0  or  value * SCALE >= debt * COLLATERALIZATION_RATIO
//   liquidatable:  debt != 0  and value * SCALE <  debt * LIQUIDATION_THRESHOLD
//
// Between the two lies the grace band (110% to 150%) where neither holds.
// Products are evaluated in 512 bits and cannot overflow.

namespace health {

// floor(collateral * price / SCALE); nullopt if it does not fit in 256 bits
std::optional<U256> collateral_value(const U256& collateral, const U256& price_x18);

bool is_healthy(const U256& collateral, const U256& debt, const U256& price_x18);

bool is_liquidatable(const U256& collateral, const U256& debt, const U256& price_x18);

VaultStatus classify(const U256& collateral, const U256& debt, const U256& price_x18);

// floor(collateral * price / COLLATERALIZATION_RATIO)
std::optional<U256> max_debt(const U256& collateral, const U256& price_x18);

// Collateral value over debt in X18 (1.5e18 = 150%); nullopt when debt is
// zero or the ratio does not fit in 256 bits
std::optional<U256> collateral_ratio(const U256& collateral, const U256& debt,
                                     const U256& price_x18);

} // namespace health

} // namespace vusd

#endif // VUSD_HEALTH_HPP

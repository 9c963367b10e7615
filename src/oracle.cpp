// =============================================================================
// oracle.cpp - Price Feed and Normalizer
// =============================================================================

#include "vusd/oracle.hpp"

#include <mutex>

namespace vusd {

// =============================================================================
// ManualPriceFeed
// =============================================================================

ManualPriceFeed::ManualPriceFeed(I128 answer, uint8_t decimals)
    : reading_{answer, decimals} {}

PriceReading ManualPriceFeed::latest_answer() const {
    std::shared_lock lock(mutex_);
    return reading_;
}

void ManualPriceFeed::set_answer(I128 answer) {
    std::unique_lock lock(mutex_);
    reading_.answer = answer;
    updates_.fetch_add(1, std::memory_order_relaxed);
}

void ManualPriceFeed::set_reading(const PriceReading& reading) {
    std::unique_lock lock(mutex_);
    reading_ = reading;
    updates_.fetch_add(1, std::memory_order_relaxed);
}

// =============================================================================
// PriceNormalizer
// =============================================================================

PriceNormalizer::PriceNormalizer(const IPriceFeed& feed) : feed_(feed) {}

std::optional<U256> PriceNormalizer::unit_price() const {
    return normalize(feed_.latest_answer());
}

std::optional<U256> PriceNormalizer::normalize(const PriceReading& reading) {
    if (reading.answer <= 0) {
        return std::nullopt;
    }

    U256 raw = U256::from_u128(static_cast<U128>(reading.answer));

    if (reading.decimals == x18::DECIMALS) {
        return raw;
    }

    if (reading.decimals < x18::DECIMALS) {
        // answer < 2^127 and the factor is at most 1e18: cannot overflow
        auto factor = u256::pow10(x18::DECIMALS - reading.decimals);
        return raw * *factor;
    }

    auto divisor = u256::pow10(reading.decimals - x18::DECIMALS);
    if (!divisor) {
        return std::nullopt;  // 10^78 and up exceeds any I128 answer
    }
    U256 price = raw / *divisor;
    if (price.is_zero()) {
        return std::nullopt;
    }
    return price;
}

} // namespace vusd

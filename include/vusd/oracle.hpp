#ifndef VUSD_ORACLE_HPP
#define VUSD_ORACLE_HPP

#include <atomic>
#include <optional>
#include <shared_mutex>

#include "types.hpp"

namespace vusd {

// =============================================================================
// Raw Price Reading
// =============================================================================

struct PriceReading {
    I128 answer;       // Signed raw answer, Chainlink-style
    uint8_t decimals;  // Decimal places of answer
};

// =============================================================================
// Price Feed Interface
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    // Latest reading; read in full on every call
    virtual PriceReading latest_answer() const = 0;
};

// Feed whose reading is set by its operator (tests, local deployments)
class ManualPriceFeed : public IPriceFeed {
public:
    explicit ManualPriceFeed(I128 answer = 0, uint8_t decimals = 8);

    PriceReading latest_answer() const override;

    void set_answer(I128 answer);
    void set_reading(const PriceReading& reading);

    uint64_t update_count() const { return updates_.load(std::memory_order_relaxed); }

private:
    PriceReading reading_;
    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> updates_{0};
};

// =============================================================================
// PriceNormalizer - Raw Feed Reading to 1e18 Unit Price
// =============================================================================

class PriceNormalizer {
public:
    explicit PriceNormalizer(const IPriceFeed& feed);

    // Non-copyable
    PriceNormalizer(const PriceNormalizer&) = delete;
    PriceNormalizer& operator=(const PriceNormalizer&) = delete;

    // Current unit price, nullopt when the feed reading is invalid
    std::optional<U256> unit_price() const;

    // Rescale a reading to 18 decimals. Fewer decimals multiply up exactly;
    // more decimals divide down with truncation, biasing the price low.
    // Non-positive answers and answers that truncate to zero are rejected.
    static std::optional<U256> normalize(const PriceReading& reading);

private:
    const IPriceFeed& feed_;
};

} // namespace vusd

#endif // VUSD_ORACLE_HPP

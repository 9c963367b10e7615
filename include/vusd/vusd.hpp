#ifndef VUSD_VUSD_HPP
#define VUSD_VUSD_HPP

// =============================================================================
// VaultUSD - Single Deployment
//
//   ManualPriceFeed -> PriceNormalizer -> VaultLedger <- VaultStore
//                                           |      |
//                                 LiabilityToken  NativeAsset
//
// The ledger address is the token's only minter and the custodian of all
// locked collateral.
// =============================================================================

#include <memory>

#include "types.hpp"
#include "u256.hpp"
#include "health.hpp"
#include "oracle.hpp"
#include "token.hpp"
#include "asset.hpp"
#include "vault.hpp"
#include "config.hpp"
#include "log.hpp"

namespace vusd {

class VaultUSD {
public:
    VaultUSD();
    explicit VaultUSD(const Config& config);
    ~VaultUSD();

    // Non-copyable
    VaultUSD(const VaultUSD&) = delete;
    VaultUSD& operator=(const VaultUSD&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    VaultLedger& ledger() { return *ledger_; }
    const VaultLedger& ledger() const { return *ledger_; }

    LiabilityToken& token() { return *token_; }
    const LiabilityToken& token() const { return *token_; }

    NativeAsset& asset() { return *asset_; }
    const NativeAsset& asset() const { return *asset_; }

    ManualPriceFeed& feed() { return *feed_; }
    const ManualPriceFeed& feed() const { return *feed_; }

    const PriceNormalizer& normalizer() const { return *normalizer_; }

    const Config& config() const { return config_; }
    const Address& address() const { return config_.ledger_address; }

    // Update the raw feed answer, keeping its decimals
    void set_price(I128 answer);

    // The Logger level is process-wide and shared by every deployment, so
    // construction leaves it alone; this installs config().log_level.
    void apply_log_level() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        VaultLedger::Stats ledger;
        U256 liability_supply;
        U256 collateral_locked;
    };
    Stats get_stats() const;

private:
    Config config_;

    std::unique_ptr<ManualPriceFeed> feed_;
    std::unique_ptr<PriceNormalizer> normalizer_;
    std::unique_ptr<NativeAsset> asset_;
    std::unique_ptr<LiabilityToken> token_;
    std::unique_ptr<VaultStore> store_;
    std::unique_ptr<VaultLedger> ledger_;
};

} // namespace vusd

#endif // VUSD_VUSD_HPP

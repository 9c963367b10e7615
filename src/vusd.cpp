// =============================================================================
// vusd.cpp - Deployment Wiring
// =============================================================================

#include "vusd/vusd.hpp"

namespace vusd {

VaultUSD::VaultUSD() : VaultUSD(Config{}) {}

VaultUSD::VaultUSD(const Config& config)
    : config_(config)
    , feed_(std::make_unique<ManualPriceFeed>(config.price_feed.answer, config.price_feed.decimals))
    , normalizer_(std::make_unique<PriceNormalizer>(*feed_))
    , asset_(std::make_unique<NativeAsset>())
    , token_(std::make_unique<LiabilityToken>(
          config.ledger_address,
          TokenInfo{config.liability_token.name, config.liability_token.symbol,
                    config.liability_token.decimals}))
    , store_(std::make_unique<VaultStore>())
    , ledger_(std::make_unique<VaultLedger>(config.ledger_address, *store_, *normalizer_,
                                            *token_, *asset_)) {
    VUSD_LOG_INFO("ledger deployed at " + addresses::to_hex(config.ledger_address) +
                  " collateral=" + config.collateral_symbol +
                  " liability=" + config.liability_token.symbol);
    if (!normalizer_->unit_price()) {
        VUSD_LOG_WARNING("initial price feed reading is invalid; price-dependent operations "
                         "will fail until it is set");
    }
}

VaultUSD::~VaultUSD() = default;

void VaultUSD::apply_log_level() const {
    Logger::set_level(config_.log_level);
}

void VaultUSD::set_price(I128 answer) {
    feed_->set_answer(answer);
    VUSD_LOG_DEBUG("feed answer set, decimals=" +
                   std::to_string(feed_->latest_answer().decimals));
}

VaultUSD::Stats VaultUSD::get_stats() const {
    Stats stats;
    stats.ledger = ledger_->get_stats();
    stats.liability_supply = token_->total_supply();
    stats.collateral_locked = asset_->balance_of(config_.ledger_address);
    return stats;
}

} // namespace vusd

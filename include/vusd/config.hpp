// VaultUSD - Deployment Configuration
// Loaded from JSON; ratio parameters are compile-time constants and not part
// of the configuration.

#ifndef VUSD_CONFIG_HPP
#define VUSD_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"
#include "log.hpp"

namespace vusd {

struct PriceFeedConfig {
    I128 answer = 0;        // Initial raw answer
    uint8_t decimals = 8;
};

struct LiabilityTokenConfig {
    std::string name = "VaultUSD";
    std::string symbol = "vUSD";
    uint8_t decimals = 18;
};

struct Config {
    Address ledger_address = addresses::from_id(0x9030);
    std::string collateral_symbol = "ETH";
    LiabilityTokenConfig liability_token;
    PriceFeedConfig price_feed;
    LogLevel log_level = LogLevel::INFO;

    // Load from JSON file; throws std::runtime_error on I/O or format errors
    static Config from_file(std::string_view path);

    // Parse a JSON document; missing keys keep their defaults
    static Config from_json(std::string_view content);
};

} // namespace vusd

#endif // VUSD_CONFIG_HPP

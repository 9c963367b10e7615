// VaultUSD - Shared Test Fixtures

#pragma once

#include <vusd/vusd.hpp>

#include <vector>

namespace vusd::test {

constexpr Address ALICE = addresses::from_id(0xA11C);
constexpr Address BOB = addresses::from_id(0x0B0B);
constexpr Address CAROL = addresses::from_id(0xCA20);
constexpr Address KEEPER = addresses::from_id(0x4EE9);

// Feed answers carry 8 decimals, Chainlink-style
inline I128 usd(int64_t whole) {
    return static_cast<I128>(whole) * 100000000;
}

inline U256 eth(uint64_t whole) { return x18::from_int(whole); }
inline U256 vusd_units(uint64_t whole) { return x18::from_int(whole); }

inline Config test_config(int64_t price_usd = 2000) {
    Config config;
    config.price_feed.answer = usd(price_usd);
    config.price_feed.decimals = 8;
    config.log_level = LogLevel::ERROR;
    return config;
}

// One deployment with funded accounts
struct Deployment {
    VaultUSD vusd;
    VaultLedger& ledger;

    explicit Deployment(int64_t price_usd = 2000)
        : vusd(test_config(price_usd))
        , ledger(vusd.ledger()) {
        vusd.apply_log_level();
        for (const Address& who : {ALICE, BOB, CAROL, KEEPER}) {
            vusd.asset().credit(who, eth(1000));
        }
    }

    void set_price(int64_t price_usd) { vusd.set_price(usd(price_usd)); }

    // create + deposit + mint, each required to succeed
    int32_t open(const Address& owner, const U256& collateral, const U256& debt) {
        int32_t rc = ledger.create_vault(owner);
        if (rc != errors::OK) return rc;
        rc = ledger.deposit_collateral(owner, collateral);
        if (rc != errors::OK || debt.is_zero()) return rc;
        return ledger.mint_debt(owner, debt);
    }

    Vault vault(const Address& owner) const {
        auto v = ledger.get_vault(owner);
        return v ? *v : Vault{false, U256(), U256()};
    }
};

// Collects every event the ledger emits
struct EventLog {
    std::vector<VaultEvent> events;

    void attach(VaultLedger& ledger) {
        ledger.subscribe([this](const VaultEvent& e) { events.push_back(e); });
    }

    std::vector<VaultEventType> types() const {
        std::vector<VaultEventType> out;
        for (const auto& e : events) out.push_back(e.type);
        return out;
    }
};

} // namespace vusd::test

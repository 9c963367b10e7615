#ifndef VUSD_VAULT_HPP
#define VUSD_VAULT_HPP

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "types.hpp"
#include "oracle.hpp"
#include "token.hpp"
#include "asset.hpp"

namespace vusd {

// =============================================================================
// Vault
// =============================================================================

struct Vault {
    bool exists;      // created; zero balances are a valid state
    U256 collateral;  // native units locked
    U256 debt;        // liability units outstanding
};

// =============================================================================
// Lifecycle Events
// =============================================================================

enum class VaultEventType : uint8_t {
    CREATED = 0,
    COLLATERAL_DEPOSITED = 1,
    COLLATERAL_WITHDRAWN = 2,
    DEBT_MINTED = 3,
    DEBT_REPAID = 4,
    LIQUIDATED = 5
};

struct VaultEvent {
    VaultEventType type;
    Address owner;              // Acting owner, or the liquidated owner
    Address liquidator;         // LIQUIDATED only
    U256 amount;                // Amount moved; repaid debt for LIQUIDATED
    U256 collateral_seized;     // LIQUIDATED only
};

// =============================================================================
// System Snapshot
// =============================================================================

struct SystemState {
    U256 total_collateral;
    U256 total_debt;
    std::optional<U256> price_x18;                   // nullopt on invalid feed
    std::optional<U256> collateralization_ratio_x18; // nullopt without debt or price
    size_t vault_count;
};

// =============================================================================
// VaultStore - Owner-keyed Vault Storage
// =============================================================================
//
// Plain storage with no synchronization of its own; VaultLedger serializes
// every access. Vaults are never removed, so pointers returned by find()
// stay valid for the store's lifetime.

class VaultStore {
public:
    VaultStore() = default;

    // Non-copyable
    VaultStore(const VaultStore&) = delete;
    VaultStore& operator=(const VaultStore&) = delete;

    bool contains(const Address& owner) const;
    Vault* find(const Address& owner);
    const Vault* find(const Address& owner) const;

    // Inserts a zero vault; false if one already exists
    bool insert(const Address& owner);

    // Every owner that created a vault, in creation order
    const std::vector<Address>& owners() const { return owners_; }
    size_t size() const { return owners_.size(); }

private:
    std::map<Address, Vault> vaults_;
    std::vector<Address> owners_;
};

// =============================================================================
// VaultLedger - Collateralized Debt Engine
// =============================================================================

class VaultLedger {
public:
    using EventCallback = std::function<void(const VaultEvent&)>;

    // self is the ledger's own identity: the address that holds locked
    // collateral and the authorized minter of the liability token
    VaultLedger(const Address& self, VaultStore& store, const PriceNormalizer& normalizer,
                ILiabilityToken& token, INativeAsset& asset);
    ~VaultLedger() = default;

    // Non-copyable
    VaultLedger(const VaultLedger&) = delete;
    VaultLedger& operator=(const VaultLedger&) = delete;

    // =========================================================================
    // Vault Lifecycle
    // =========================================================================

    int32_t create_vault(const Address& owner);

    // =========================================================================
    // Collateral
    // =========================================================================

    // Pulls amount of the native asset from owner; the ledger's received
    // balance must match amount exactly
    int32_t deposit_collateral(const Address& owner, const U256& amount);

    // State is committed before the asset leaves the ledger
    int32_t withdraw_collateral(const Address& owner, const U256& amount);

    // =========================================================================
    // Debt
    // =========================================================================

    int32_t mint_debt(const Address& owner, const U256& amount);
    int32_t repay_debt(const Address& owner, const U256& amount);

    // =========================================================================
    // Liquidation
    // =========================================================================

    // Full liquidation: liquidator burns the whole debt and receives the
    // whole collateral
    int32_t liquidate(const Address& liquidator, const Address& target);

    // =========================================================================
    // Health Queries (current price, recomputed on every call)
    // =========================================================================

    // Invalid price: a vault with debt is reported neither healthy nor
    // liquidatable
    bool is_healthy(const U256& collateral, const U256& debt) const;
    bool is_liquidatable(const U256& collateral, const U256& debt) const;

    // nullopt on invalid price or if the result exceeds 256 bits
    std::optional<U256> max_debt(const U256& collateral) const;

    std::optional<VaultStatus> classify(const Address& owner) const;
    std::optional<U256> collateral_ratio(const Address& owner) const;
    std::optional<U256> collateral_price() const;

    // =========================================================================
    // Vault Queries
    // =========================================================================

    std::optional<Vault> get_vault(const Address& owner) const;
    bool vault_exists(const Address& owner) const;
    std::vector<Address> owners() const;
    size_t vault_count() const;

    // Owners whose vaults are liquidatable at the current price, in creation
    // order. Empty when the price is invalid.
    std::vector<Address> liquidatable_owners() const;

    SystemState system_state() const;

    // =========================================================================
    // Events
    // =========================================================================

    // Callbacks run on the writing thread after the operation is final;
    // mutating calls made from a callback fail with REENTRANCY. A
    // std::exception thrown by a callback is logged at ERROR and does not
    // reach the caller of the operation.
    // Returns REENTRANCY when called from a callback.
    int32_t subscribe(EventCallback callback);

    const Address& address() const { return self_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_vaults;
        uint64_t total_liquidations;
        uint64_t rejected_operations;
        U256 total_minted;
        U256 total_burned;
        U256 total_collateral_seized;
    };
    Stats get_stats() const;

private:
    class WriteScope;
    class ReadScope;

    const Address self_;
    VaultStore& store_;
    const PriceNormalizer& normalizer_;
    ILiabilityToken& token_;
    INativeAsset& asset_;

    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> writer_{std::thread::id()};

    std::vector<EventCallback> subscribers_;

    // Statistics (guarded by mutex_ except the counters)
    std::atomic<uint64_t> total_liquidations_{0};
    std::atomic<uint64_t> rejected_operations_{0};
    U256 total_minted_;
    U256 total_burned_;
    U256 total_collateral_seized_;

    int32_t reject(const char* op, const Address& owner, int32_t code);
    void emit(const VaultEvent& event) const;
};

} // namespace vusd

#endif // VUSD_VAULT_HPP

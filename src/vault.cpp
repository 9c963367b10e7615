// =============================================================================
// vault.cpp - VaultLedger Collateralized Debt Engine
// =============================================================================

#include "vusd/vault.hpp"
#include "vusd/health.hpp"
#include "vusd/log.hpp"

#include <exception>
#include <mutex>
#include <string>
#include <utility>

namespace vusd {

// =============================================================================
// VaultStore
// =============================================================================

bool VaultStore::contains(const Address& owner) const {
    return vaults_.find(owner) != vaults_.end();
}

Vault* VaultStore::find(const Address& owner) {
    auto it = vaults_.find(owner);
    return it != vaults_.end() ? &it->second : nullptr;
}

const Vault* VaultStore::find(const Address& owner) const {
    auto it = vaults_.find(owner);
    return it != vaults_.end() ? &it->second : nullptr;
}

bool VaultStore::insert(const Address& owner) {
    if (!vaults_.emplace(owner, Vault{true, U256(), U256()}).second) {
        return false;
    }
    owners_.push_back(owner);
    return true;
}

// =============================================================================
// Write / Read Scopes
// =============================================================================
//
// One writer at a time holds mutex_ exclusively and records its thread in
// writer_. A second entry from that same thread (an external callback calling
// back in) is refused instead of deadlocking. Readers on the writing thread
// skip the lock: everything they can see has already been committed.

class VaultLedger::WriteScope {
public:
    explicit WriteScope(VaultLedger& ledger) : ledger_(ledger) {
        if (ledger_.writer_.load() == std::this_thread::get_id()) {
            return;
        }
        lock_ = std::unique_lock<std::shared_mutex>(ledger_.mutex_);
        ledger_.writer_.store(std::this_thread::get_id());
        acquired_ = true;
    }

    ~WriteScope() {
        if (acquired_) {
            ledger_.writer_.store(std::thread::id());
        }
    }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    bool acquired() const { return acquired_; }

private:
    VaultLedger& ledger_;
    std::unique_lock<std::shared_mutex> lock_;
    bool acquired_ = false;
};

class VaultLedger::ReadScope {
public:
    explicit ReadScope(const VaultLedger& ledger) {
        if (ledger.writer_.load() != std::this_thread::get_id()) {
            lock_ = std::shared_lock<std::shared_mutex>(ledger.mutex_);
        }
    }

    ReadScope(const ReadScope&) = delete;
    ReadScope& operator=(const ReadScope&) = delete;

private:
    std::shared_lock<std::shared_mutex> lock_;
};

// =============================================================================
// Constructor
// =============================================================================

VaultLedger::VaultLedger(const Address& self, VaultStore& store,
                         const PriceNormalizer& normalizer,
                         ILiabilityToken& token, INativeAsset& asset)
    : self_(self)
    , store_(store)
    , normalizer_(normalizer)
    , token_(token)
    , asset_(asset) {}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t VaultLedger::reject(const char* op, const Address& owner, int32_t code) {
    rejected_operations_.fetch_add(1, std::memory_order_relaxed);
    if (code == errors::REENTRANCY) {
        VUSD_LOG_ERROR(std::string(op) + " re-entered by " + addresses::to_hex(owner));
    } else {
        VUSD_LOG_DEBUG(std::string(op) + " rejected owner=" + addresses::to_hex(owner) +
                       " error=" + errors::to_string(code));
    }
    return code;
}

// The operation is already final here; a throwing subscriber is logged and
// the remaining subscribers still run
void VaultLedger::emit(const VaultEvent& event) const {
    for (size_t i = 0; i < subscribers_.size(); ++i) {
        try {
            subscribers_[i](event);
        } catch (const std::exception& e) {
            VUSD_LOG_ERROR("event subscriber " + std::to_string(i) + " threw: " + e.what());
        }
    }
}

// =============================================================================
// Vault Lifecycle
// =============================================================================

int32_t VaultLedger::create_vault(const Address& owner) {
    WriteScope scope(*this);
    if (!scope.acquired()) return reject("create_vault", owner, errors::REENTRANCY);

    if (!store_.insert(owner)) {
        return reject("create_vault", owner, errors::ALREADY_EXISTS);
    }

    VUSD_LOG_INFO("vault created owner=" + addresses::to_hex(owner));
    emit(VaultEvent{VaultEventType::CREATED, owner, addresses::ZERO, U256(), U256()});
    return errors::OK;
}

// =============================================================================
// Collateral
// =============================================================================

int32_t VaultLedger::deposit_collateral(const Address& owner, const U256& amount) {
    WriteScope scope(*this);
    if (!scope.acquired()) return reject("deposit_collateral", owner, errors::REENTRANCY);

    Vault* vault = store_.find(owner);
    if (!vault) return reject("deposit_collateral", owner, errors::NO_SUCH_VAULT);
    if (amount.is_zero()) return reject("deposit_collateral", owner, errors::ZERO_AMOUNT);

    U256 new_collateral;
    if (!u256::checked_add(vault->collateral, amount, new_collateral)) {
        return reject("deposit_collateral", owner, errors::ARITHMETIC_OVERFLOW);
    }

    // Credit only what actually arrived. owner is the acting identity, so the
    // pull is made on its authority.
    U256 before = asset_.balance_of(self_);
    int32_t rc = asset_.transfer(owner, owner, self_, amount);
    if (rc != errors::OK) {
        return reject("deposit_collateral", owner, errors::TRANSFER_FAILED);
    }
    U256 after = asset_.balance_of(self_);
    U256 received = after > before ? after - before : U256();

    if (received != amount) {
        if (!received.is_zero()) {
            int32_t refund = asset_.transfer(self_, self_, owner, received);
            if (refund != errors::OK) {
                VUSD_LOG_CRITICAL("deposit refund failed owner=" + addresses::to_hex(owner) +
                                  " amount=" + received.to_string() +
                                  " error=" + errors::to_string(refund));
            }
        }
        VUSD_LOG_WARNING("deposit mismatch owner=" + addresses::to_hex(owner) +
                         " claimed=" + amount.to_string() +
                         " received=" + received.to_string());
        return reject("deposit_collateral", owner, errors::AMOUNT_MISMATCH);
    }

    vault->collateral = new_collateral;

    VUSD_LOG_INFO("collateral deposited owner=" + addresses::to_hex(owner) +
                  " amount=" + amount.to_string());
    emit(VaultEvent{VaultEventType::COLLATERAL_DEPOSITED, owner, addresses::ZERO, amount, U256()});
    return errors::OK;
}

int32_t VaultLedger::withdraw_collateral(const Address& owner, const U256& amount) {
    WriteScope scope(*this);
    if (!scope.acquired()) return reject("withdraw_collateral", owner, errors::REENTRANCY);

    Vault* vault = store_.find(owner);
    if (!vault) return reject("withdraw_collateral", owner, errors::NO_SUCH_VAULT);
    if (amount.is_zero()) return reject("withdraw_collateral", owner, errors::ZERO_AMOUNT);
    if (amount > vault->collateral) {
        return reject("withdraw_collateral", owner, errors::INSUFFICIENT_COLLATERAL);
    }

    auto price = normalizer_.unit_price();
    if (!price) return reject("withdraw_collateral", owner, errors::INVALID_PRICE);

    U256 new_collateral = vault->collateral - amount;
    if (!health::is_healthy(new_collateral, vault->debt, *price)) {
        return reject("withdraw_collateral", owner, errors::RATIO_VIOLATION);
    }

    // Commit before the asset leaves
    vault->collateral = new_collateral;

    int32_t rc = asset_.transfer(self_, self_, owner, amount);
    if (rc != errors::OK) {
        vault->collateral += amount;
        VUSD_LOG_WARNING("withdraw rolled back owner=" + addresses::to_hex(owner) +
                         " error=" + errors::to_string(rc));
        return reject("withdraw_collateral", owner, errors::TRANSFER_FAILED);
    }

    VUSD_LOG_INFO("collateral withdrawn owner=" + addresses::to_hex(owner) +
                  " amount=" + amount.to_string());
    emit(VaultEvent{VaultEventType::COLLATERAL_WITHDRAWN, owner, addresses::ZERO, amount, U256()});
    return errors::OK;
}

// =============================================================================
// Debt
// =============================================================================

int32_t VaultLedger::mint_debt(const Address& owner, const U256& amount) {
    WriteScope scope(*this);
    if (!scope.acquired()) return reject("mint_debt", owner, errors::REENTRANCY);

    Vault* vault = store_.find(owner);
    if (!vault) return reject("mint_debt", owner, errors::NO_SUCH_VAULT);
    if (amount.is_zero()) return reject("mint_debt", owner, errors::ZERO_AMOUNT);

    auto price = normalizer_.unit_price();
    if (!price) return reject("mint_debt", owner, errors::INVALID_PRICE);

    U256 new_debt;
    if (!u256::checked_add(vault->debt, amount, new_debt)) {
        return reject("mint_debt", owner, errors::ARITHMETIC_OVERFLOW);
    }
    if (!health::is_healthy(vault->collateral, new_debt, *price)) {
        return reject("mint_debt", owner, errors::RATIO_VIOLATION);
    }

    U256 prior_debt = vault->debt;
    vault->debt = new_debt;

    int32_t rc = token_.mint(self_, owner, amount);
    if (rc != errors::OK) {
        vault->debt = prior_debt;
        VUSD_LOG_WARNING("mint rolled back owner=" + addresses::to_hex(owner) +
                         " error=" + errors::to_string(rc));
        return reject("mint_debt", owner, errors::TRANSFER_FAILED);
    }
    total_minted_ += amount;

    VUSD_LOG_INFO("debt minted owner=" + addresses::to_hex(owner) +
                  " amount=" + amount.to_string() + " debt=" + new_debt.to_string());
    emit(VaultEvent{VaultEventType::DEBT_MINTED, owner, addresses::ZERO, amount, U256()});
    return errors::OK;
}

int32_t VaultLedger::repay_debt(const Address& owner, const U256& amount) {
    WriteScope scope(*this);
    if (!scope.acquired()) return reject("repay_debt", owner, errors::REENTRANCY);

    Vault* vault = store_.find(owner);
    if (!vault) return reject("repay_debt", owner, errors::NO_SUCH_VAULT);
    if (amount.is_zero()) return reject("repay_debt", owner, errors::ZERO_AMOUNT);
    if (amount > vault->debt) return reject("repay_debt", owner, errors::EXCEEDS_DEBT);

    vault->debt -= amount;

    int32_t rc = token_.burn(self_, owner, amount);
    if (rc != errors::OK) {
        vault->debt += amount;
        VUSD_LOG_WARNING("repay rolled back owner=" + addresses::to_hex(owner) +
                         " error=" + errors::to_string(rc));
        return reject("repay_debt", owner, errors::TRANSFER_FAILED);
    }
    total_burned_ += amount;

    VUSD_LOG_INFO("debt repaid owner=" + addresses::to_hex(owner) +
                  " amount=" + amount.to_string() + " debt=" + vault->debt.to_string());
    emit(VaultEvent{VaultEventType::DEBT_REPAID, owner, addresses::ZERO, amount, U256()});
    return errors::OK;
}

// =============================================================================
// Liquidation
// =============================================================================

int32_t VaultLedger::liquidate(const Address& liquidator, const Address& target) {
    WriteScope scope(*this);
    if (!scope.acquired()) return reject("liquidate", target, errors::REENTRANCY);

    Vault* vault = store_.find(target);
    if (!vault) return reject("liquidate", target, errors::NO_SUCH_VAULT);

    auto price = normalizer_.unit_price();
    if (!price) return reject("liquidate", target, errors::INVALID_PRICE);

    if (!health::is_liquidatable(vault->collateral, vault->debt, *price)) {
        return reject("liquidate", target, errors::NOT_LIQUIDATABLE);
    }

    const U256 debt = vault->debt;
    const U256 seized = vault->collateral;

    // Liquidator repays the whole debt first
    int32_t rc = token_.burn(self_, liquidator, debt);
    if (rc != errors::OK) {
        VUSD_LOG_DEBUG("liquidation burn failed liquidator=" + addresses::to_hex(liquidator) +
                       " error=" + errors::to_string(rc));
        return reject("liquidate", target, errors::TRANSFER_FAILED);
    }

    vault->collateral = U256();
    vault->debt = U256();

    rc = asset_.transfer(self_, self_, liquidator, seized);
    if (rc != errors::OK) {
        vault->collateral = seized;
        vault->debt = debt;
        int32_t remint = token_.mint(self_, liquidator, debt);
        if (remint != errors::OK) {
            VUSD_LOG_CRITICAL("liquidation burn not restored liquidator=" +
                              addresses::to_hex(liquidator) + " amount=" + debt.to_string() +
                              " error=" + errors::to_string(remint));
        }
        VUSD_LOG_WARNING("liquidation rolled back target=" + addresses::to_hex(target) +
                         " error=" + errors::to_string(rc));
        return reject("liquidate", target, errors::TRANSFER_FAILED);
    }

    total_burned_ += debt;
    total_collateral_seized_ += seized;
    total_liquidations_.fetch_add(1, std::memory_order_relaxed);

    VUSD_LOG_INFO("vault liquidated target=" + addresses::to_hex(target) +
                  " liquidator=" + addresses::to_hex(liquidator) +
                  " debt=" + debt.to_string() + " seized=" + seized.to_string());
    emit(VaultEvent{VaultEventType::LIQUIDATED, target, liquidator, debt, seized});
    return errors::OK;
}

// =============================================================================
// Health Queries
// =============================================================================

bool VaultLedger::is_healthy(const U256& collateral, const U256& debt) const {
    if (debt.is_zero()) return true;
    auto price = normalizer_.unit_price();
    if (!price) return false;
    return health::is_healthy(collateral, debt, *price);
}

bool VaultLedger::is_liquidatable(const U256& collateral, const U256& debt) const {
    if (debt.is_zero()) return false;
    auto price = normalizer_.unit_price();
    if (!price) return false;
    return health::is_liquidatable(collateral, debt, *price);
}

std::optional<U256> VaultLedger::max_debt(const U256& collateral) const {
    auto price = normalizer_.unit_price();
    if (!price) return std::nullopt;
    return health::max_debt(collateral, *price);
}

std::optional<VaultStatus> VaultLedger::classify(const Address& owner) const {
    ReadScope scope(*this);
    const Vault* vault = store_.find(owner);
    if (!vault) return std::nullopt;
    if (vault->debt.is_zero()) return VaultStatus::HEALTHY;

    auto price = normalizer_.unit_price();
    if (!price) return std::nullopt;
    return health::classify(vault->collateral, vault->debt, *price);
}

std::optional<U256> VaultLedger::collateral_ratio(const Address& owner) const {
    ReadScope scope(*this);
    const Vault* vault = store_.find(owner);
    if (!vault || vault->debt.is_zero()) return std::nullopt;

    auto price = normalizer_.unit_price();
    if (!price) return std::nullopt;
    return health::collateral_ratio(vault->collateral, vault->debt, *price);
}

std::optional<U256> VaultLedger::collateral_price() const {
    return normalizer_.unit_price();
}

// =============================================================================
// Vault Queries
// =============================================================================

std::optional<Vault> VaultLedger::get_vault(const Address& owner) const {
    ReadScope scope(*this);
    const Vault* vault = store_.find(owner);
    if (!vault) return std::nullopt;
    return *vault;
}

bool VaultLedger::vault_exists(const Address& owner) const {
    ReadScope scope(*this);
    return store_.contains(owner);
}

std::vector<Address> VaultLedger::owners() const {
    ReadScope scope(*this);
    return store_.owners();
}

size_t VaultLedger::vault_count() const {
    ReadScope scope(*this);
    return store_.size();
}

std::vector<Address> VaultLedger::liquidatable_owners() const {
    std::vector<Address> result;

    auto price = normalizer_.unit_price();
    if (!price) return result;

    ReadScope scope(*this);
    for (const Address& owner : store_.owners()) {
        const Vault* vault = store_.find(owner);
        if (vault && health::is_liquidatable(vault->collateral, vault->debt, *price)) {
            result.push_back(owner);
        }
    }
    return result;
}

SystemState VaultLedger::system_state() const {
    SystemState state{};
    state.price_x18 = normalizer_.unit_price();

    ReadScope scope(*this);
    for (const Address& owner : store_.owners()) {
        const Vault* vault = store_.find(owner);
        if (!vault) continue;
        state.total_collateral += vault->collateral;
        state.total_debt += vault->debt;
    }
    state.vault_count = store_.size();

    if (state.price_x18) {
        state.collateralization_ratio_x18 =
            health::collateral_ratio(state.total_collateral, state.total_debt, *state.price_x18);
    }
    return state;
}

// =============================================================================
// Events
// =============================================================================

int32_t VaultLedger::subscribe(EventCallback callback) {
    WriteScope scope(*this);
    if (!scope.acquired()) {
        VUSD_LOG_ERROR("subscribe called from an event callback");
        return errors::REENTRANCY;
    }
    subscribers_.push_back(std::move(callback));
    return errors::OK;
}

// =============================================================================
// Statistics
// =============================================================================

VaultLedger::Stats VaultLedger::get_stats() const {
    ReadScope scope(*this);
    Stats stats;
    stats.total_vaults = store_.size();
    stats.total_liquidations = total_liquidations_.load(std::memory_order_relaxed);
    stats.rejected_operations = rejected_operations_.load(std::memory_order_relaxed);
    stats.total_minted = total_minted_;
    stats.total_burned = total_burned_;
    stats.total_collateral_seized = total_collateral_seized_;
    return stats;
}

} // namespace vusd

// =============================================================================
// token.cpp - LiabilityToken Implementation
// =============================================================================

#include "vusd/token.hpp"

#include <mutex>
#include <utility>

namespace vusd {

LiabilityToken::LiabilityToken(const Address& minter, TokenInfo info)
    : minter_(minter)
    , info_(std::move(info)) {}

int32_t LiabilityToken::mint(const Address& caller, const Address& to, const U256& amount) {
    if (caller != minter_) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);

    U256 new_supply;
    if (!u256::checked_add(total_supply_, amount, new_supply)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    // Balance cannot overflow once the supply did not
    balances_[to] += amount;
    total_supply_ = new_supply;
    return errors::OK;
}

int32_t LiabilityToken::burn(const Address& caller, const Address& from, const U256& amount) {
    if (caller != minter_) {
        return errors::UNAUTHORIZED;
    }

    if (amount.is_zero()) {
        return errors::OK;
    }

    std::unique_lock lock(mutex_);

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount;
    total_supply_ -= amount;
    if (it->second.is_zero()) {
        balances_.erase(it);
    }
    return errors::OK;
}

U256 LiabilityToken::balance_of(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : U256();
}

U256 LiabilityToken::total_supply() const {
    std::shared_lock lock(mutex_);
    return total_supply_;
}

size_t LiabilityToken::holder_count() const {
    std::shared_lock lock(mutex_);
    return balances_.size();
}

} // namespace vusd

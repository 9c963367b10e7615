// =============================================================================
// asset.cpp - NativeAsset Implementation
// =============================================================================

#include "vusd/asset.hpp"

namespace vusd {

int32_t NativeAsset::credit(const Address& account, const U256& amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    U256 issued;
    if (!u256::checked_add(total_issued_, amount, issued)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    balances_[account] += amount;
    total_issued_ = issued;
    return errors::OK;
}

int32_t NativeAsset::transfer(const Address& caller, const Address& from, const Address& to,
                              const U256& amount) {
    if (caller != from) {
        return errors::UNAUTHORIZED;
    }

    IAssetReceiver* receiver = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(from);
        U256 available = it != balances_.end() ? it->second : U256();
        if (available < amount) {
            return errors::INSUFFICIENT_BALANCE;
        }
        auto hook = receivers_.find(to);
        if (hook != receivers_.end()) receiver = hook->second;
    }

    // Call receiver without holding the lock
    if (receiver && !receiver->on_receive(from, amount)) {
        return errors::TRANSFER_FAILED;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // The receiver may have moved funds in the meantime
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return amount.is_zero() ? errors::OK : errors::INSUFFICIENT_BALANCE;
    }
    it->second -= amount;
    balances_[to] += amount;
    return errors::OK;
}

U256 NativeAsset::balance_of(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : U256();
}

U256 NativeAsset::total_issued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_issued_;
}

void NativeAsset::set_receiver(const Address& account, IAssetReceiver* receiver) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (receiver) {
        receivers_[account] = receiver;
    } else {
        receivers_.erase(account);
    }
}

} // namespace vusd

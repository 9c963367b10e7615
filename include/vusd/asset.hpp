#ifndef VUSD_ASSET_HPP
#define VUSD_ASSET_HPP

#include <map>
#include <mutex>

#include "types.hpp"

namespace vusd {

// =============================================================================
// Native Asset Interface (collateral value transfers)
// =============================================================================

class INativeAsset {
public:
    virtual ~INativeAsset() = default;

    // caller is the identity invoking the transfer; only the holder of the
    // funds may move them (caller == from)
    virtual int32_t transfer(const Address& caller, const Address& from, const Address& to,
                             const U256& amount) = 0;
    virtual U256 balance_of(const Address& account) const = 0;
};

// =============================================================================
// Receiver Hook
// =============================================================================
//
// Invoked on the recipient before a transfer is credited, outside the asset's
// lock, so the receiver may call back into anything (including the ledger
// that is paying it). Returning false rejects the transfer.

class IAssetReceiver {
public:
    virtual ~IAssetReceiver() = default;
    virtual bool on_receive(const Address& from, const U256& amount) = 0;
};

// =============================================================================
// NativeAsset - In-process Native Balance Book
// =============================================================================

class NativeAsset : public INativeAsset {
public:
    NativeAsset() = default;

    // Non-copyable
    NativeAsset(const NativeAsset&) = delete;
    NativeAsset& operator=(const NativeAsset&) = delete;

    // Issue new units to an account (genesis funding)
    int32_t credit(const Address& account, const U256& amount);

    int32_t transfer(const Address& caller, const Address& from, const Address& to,
                     const U256& amount) override;
    U256 balance_of(const Address& account) const override;

    U256 total_issued() const;

    // Receivers are not owned; pass nullptr to clear
    void set_receiver(const Address& account, IAssetReceiver* receiver);

private:
    std::map<Address, U256> balances_;
    std::map<Address, IAssetReceiver*> receivers_;
    U256 total_issued_;
    mutable std::mutex mutex_;
};

} // namespace vusd

#endif // VUSD_ASSET_HPP

#ifndef VUSD_TOKEN_HPP
#define VUSD_TOKEN_HPP

#include <map>
#include <shared_mutex>
#include <string>

#include "types.hpp"

namespace vusd {

// =============================================================================
// Liability Token Interface
// =============================================================================

class ILiabilityToken {
public:
    virtual ~ILiabilityToken() = default;

    // caller is the identity invoking the primitive; only the configured
    // minter is accepted
    virtual int32_t mint(const Address& caller, const Address& to, const U256& amount) = 0;
    virtual int32_t burn(const Address& caller, const Address& from, const U256& amount) = 0;

    virtual U256 balance_of(const Address& account) const = 0;
    virtual U256 total_supply() const = 0;
};

struct TokenInfo {
    std::string name;
    std::string symbol;
    uint8_t decimals;
};

// =============================================================================
// LiabilityToken - Pegged Liability Balance Book
// =============================================================================

class LiabilityToken : public ILiabilityToken {
public:
    // minter is fixed for the lifetime of the token
    LiabilityToken(const Address& minter, TokenInfo info);

    // Non-copyable
    LiabilityToken(const LiabilityToken&) = delete;
    LiabilityToken& operator=(const LiabilityToken&) = delete;

    int32_t mint(const Address& caller, const Address& to, const U256& amount) override;
    int32_t burn(const Address& caller, const Address& from, const U256& amount) override;

    U256 balance_of(const Address& account) const override;
    U256 total_supply() const override;

    const Address& minter() const { return minter_; }
    const TokenInfo& info() const { return info_; }
    size_t holder_count() const;

private:
    const Address minter_;
    const TokenInfo info_;

    std::map<Address, U256> balances_;
    U256 total_supply_;
    mutable std::shared_mutex mutex_;
};

} // namespace vusd

#endif // VUSD_TOKEN_HPP

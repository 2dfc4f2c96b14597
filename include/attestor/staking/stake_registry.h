// ATTESTOR - Stake Registry
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Bonded validator stake. A validator is qualified to attest and vote while
// its active stake is at least the minimum. Withdrawals wait out a delay;
// slashing authorities can burn active stake into the treasury.

#ifndef ATTESTOR_STAKING_STAKE_REGISTRY_H
#define ATTESTOR_STAKING_STAKE_REGISTRY_H

#include "attestor/consensus/params.h"
#include "attestor/core/serialize.h"
#include "attestor/core/status.h"
#include "attestor/core/types.h"
#include "attestor/ledger/ledger.h"
#include "attestor/util/time.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace attestor {
namespace staking {

// ============================================================================
// Stake Account
// ============================================================================

struct StakeAccount {
    ValidatorId validator;

    /// Stake counting towards qualification
    Amount activeStake{0};

    /// Stake waiting out the withdrawal delay
    Amount pendingWithdrawal{0};

    /// Earliest time the pending amount can be released
    Timestamp withdrawalUnlockTime{0};

    /// Lifetime slashed amount
    Amount totalSlashed{0};

    uint32_t slashCount{0};

    bool HasPendingWithdrawal() const { return pendingWithdrawal > 0; }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, validator);
        ::attestor::Serialize(s, activeStake);
        ::attestor::Serialize(s, pendingWithdrawal);
        ::attestor::Serialize(s, withdrawalUnlockTime);
        ::attestor::Serialize(s, totalSlashed);
        ::attestor::Serialize(s, slashCount);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::attestor::Unserialize(s, validator);
        ::attestor::Unserialize(s, activeStake);
        ::attestor::Unserialize(s, pendingWithdrawal);
        ::attestor::Unserialize(s, withdrawalUnlockTime);
        ::attestor::Unserialize(s, totalSlashed);
        ::attestor::Unserialize(s, slashCount);
    }
};

// ============================================================================
// Slash Event
// ============================================================================

struct SlashEvent {
    /// Position in the registry's slash log
    uint64_t sequence{0};
    ValidatorId validator;
    Address authority;
    /// Amount the authority asked for
    Amount requested{0};
    /// Amount actually removed (capped at active stake)
    Amount slashed{0};
    std::string reason;
    Timestamp time{0};

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, sequence);
        ::attestor::Serialize(s, validator);
        ::attestor::Serialize(s, authority);
        ::attestor::Serialize(s, requested);
        ::attestor::Serialize(s, slashed);
        ::attestor::Serialize(s, reason);
        ::attestor::Serialize(s, time);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::attestor::Unserialize(s, sequence);
        ::attestor::Unserialize(s, validator);
        ::attestor::Unserialize(s, authority);
        ::attestor::Unserialize(s, requested);
        ::attestor::Unserialize(s, slashed);
        ::attestor::Unserialize(s, reason);
        ::attestor::Unserialize(s, time);
    }
};

/// Outcome of CompleteWithdrawal
struct WithdrawalResult {
    Status status;
    Amount released{0};
};

/// Outcome of Slash
struct SlashResult {
    Status status;
    Amount slashed{0};
};

// ============================================================================
// Stake Registry
// ============================================================================

/**
 * Owns every StakeAccount. Not internally synchronized: the protocol engine
 * serializes all calls.
 */
class StakeRegistry {
public:
    StakeRegistry(const consensus::ProtocolParams& params,
                  ledger::ValueLedger& ledger,
                  const util::Clock& clock);

    // === Operations ===

    /// Move amount from the validator's balance into custody
    Status Deposit(const ValidatorId& validator, Amount amount);

    /// Move amount from active to pending and restart the withdrawal delay
    Status RequestWithdrawal(const ValidatorId& validator, Amount amount);

    /// Release the whole pending amount once the delay has passed
    WithdrawalResult CompleteWithdrawal(const ValidatorId& validator);

    /// Remove up to amount of active stake into the treasury
    SlashResult Slash(const Address& caller, const ValidatorId& validator,
                      Amount amount, const std::string& reason);

    // === Queries ===

    bool IsQualified(const ValidatorId& validator) const;
    std::optional<StakeAccount> GetAccount(const ValidatorId& validator) const;

    /// Sum of active stake over all accounts
    Amount GetTotalStaked() const;

    /// Sum of pending withdrawals over all accounts
    Amount GetTotalPending() const;

    size_t GetQualifiedCount() const;
    size_t GetAccountCount() const { return accounts_.size(); }

    const std::vector<SlashEvent>& GetSlashEvents() const { return slashEvents_; }
    std::vector<SlashEvent> GetSlashEvents(const ValidatorId& validator) const;

    // === Administration ===

    void AddSlashingAuthority(const Address& authority);
    void RemoveSlashingAuthority(const Address& authority);
    bool IsSlashingAuthority(const Address& authority) const;
    const std::set<Address>& GetSlashingAuthorities() const { return authorities_; }

    // === Restore from storage ===

    void RestoreAccount(const StakeAccount& account);
    void RestoreSlashEvent(const SlashEvent& event);

private:
    const consensus::ProtocolParams& params_;
    ledger::ValueLedger& ledger_;
    const util::Clock& clock_;

    std::map<ValidatorId, StakeAccount> accounts_;
    std::set<Address> authorities_;
    std::vector<SlashEvent> slashEvents_;
};

} // namespace staking
} // namespace attestor

#endif // ATTESTOR_STAKING_STAKE_REGISTRY_H

// ATTESTOR - Dispute Resolver
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Bonded challenges against pending contributions. A dispute blocks
// finalization until qualified validators have voted on it in two phases:
//
//   commit:  now <  commitDeadline                  SHA256(vote || salt)
//   reveal:  commitDeadline <= now < revealDeadline (vote, salt)
//   resolve: now >= revealDeadline
//
// A strict majority of Invalid votes overturns the contribution and returns
// the bond. Anything else upholds it and forfeits the bond to the treasury.

#ifndef ATTESTOR_DISPUTE_DISPUTE_RESOLVER_H
#define ATTESTOR_DISPUTE_DISPUTE_RESOLVER_H

#include "attestor/consensus/params.h"
#include "attestor/core/serialize.h"
#include "attestor/core/status.h"
#include "attestor/core/types.h"
#include "attestor/ledger/ledger.h"
#include "attestor/oracle/contribution_oracle.h"
#include "attestor/staking/stake_registry.h"
#include "attestor/util/time.h"

#include <cstdint>
#include <ios>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace attestor {
namespace dispute {

/// A validator's judgement of the disputed contribution
enum class Vote : uint8_t {
    Invalid = 0,
    Valid = 1,
};

enum class Ruling : uint8_t {
    Unresolved = 0,
    /// Contribution stands; bond forfeited
    Upheld = 1,
    /// Contribution cancelled; bond returned
    Overturned = 2,
};

const char* RulingToString(Ruling ruling);

/// SHA256(vote byte || salt)
Hash256 ComputeCommitment(Vote vote, const Hash256& salt);

// ============================================================================
// Dispute
// ============================================================================

struct Dispute {
    ContributionKey key;
    Address challenger;
    Amount bond{0};
    std::string reason;

    /// Validator -> commitment
    std::map<ValidatorId, Hash256> commits;

    /// Validator -> true if the validator judged the contribution valid
    std::map<ValidatorId, bool> reveals;

    Timestamp openedAt{0};
    Timestamp commitDeadline{0};
    Timestamp revealDeadline{0};

    Ruling ruling{Ruling::Unresolved};
    bool resolved{false};
    uint32_t validVotes{0};
    uint32_t invalidVotes{0};
    Timestamp resolvedAt{0};

    bool HasCommitted(const ValidatorId& validator) const {
        return commits.count(validator) > 0;
    }
    bool HasRevealed(const ValidatorId& validator) const {
        return reveals.count(validator) > 0;
    }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, key);
        ::attestor::Serialize(s, challenger);
        ::attestor::Serialize(s, bond);
        ::attestor::Serialize(s, reason);
        ::attestor::Serialize(s, commits);
        ::attestor::Serialize(s, reveals);
        ::attestor::Serialize(s, openedAt);
        ::attestor::Serialize(s, commitDeadline);
        ::attestor::Serialize(s, revealDeadline);
        ::attestor::Serialize(s, static_cast<uint8_t>(ruling));
        ::attestor::Serialize(s, resolved);
        ::attestor::Serialize(s, validVotes);
        ::attestor::Serialize(s, invalidVotes);
        ::attestor::Serialize(s, resolvedAt);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::attestor::Unserialize(s, key);
        ::attestor::Unserialize(s, challenger);
        ::attestor::Unserialize(s, bond);
        ::attestor::Unserialize(s, reason);
        ::attestor::Unserialize(s, commits);
        ::attestor::Unserialize(s, reveals);
        ::attestor::Unserialize(s, openedAt);
        ::attestor::Unserialize(s, commitDeadline);
        ::attestor::Unserialize(s, revealDeadline);
        uint8_t r = 0;
        ::attestor::Unserialize(s, r);
        if (r > static_cast<uint8_t>(Ruling::Overturned)) {
            throw std::ios_base::failure("invalid dispute ruling");
        }
        ruling = static_cast<Ruling>(r);
        ::attestor::Unserialize(s, resolved);
        ::attestor::Unserialize(s, validVotes);
        ::attestor::Unserialize(s, invalidVotes);
        ::attestor::Unserialize(s, resolvedAt);
    }
};

/// Outcome of ResolveDispute
struct ResolveResult {
    Status status;
    Ruling ruling{Ruling::Unresolved};

    /// Status of the settlement applied to the contribution; an Upheld
    /// ruling whose finalization is deferred reports it here
    Status settlement;

    /// Confirmers slashed after an Overturned ruling
    std::vector<ValidatorId> slashed;
};

// ============================================================================
// Dispute Resolver
// ============================================================================

class DisputeResolver : public oracle::DisputeView {
public:
    DisputeResolver(const consensus::ProtocolParams& params,
                    staking::StakeRegistry& stakes,
                    oracle::SettlementTarget& settlement,
                    ledger::ValueLedger& ledger,
                    const util::Clock& clock);

    // === Operations ===

    /// Escrow the bond and open the voting windows
    Status RaiseDispute(const Address& challenger, const ContributionKey& key,
                        const std::string& reason);

    Status CommitVote(const ValidatorId& validator, const ContributionKey& key,
                      const Hash256& commitment);

    Status RevealVote(const ValidatorId& validator, const ContributionKey& key,
                      Vote vote, const Hash256& salt);

    /// Tally revealed votes, settle the bond and apply the ruling
    ResolveResult ResolveDispute(const ContributionKey& key);

    // === Queries ===

    bool HasUnresolvedDispute(const ContributionKey& key) const override;
    std::optional<Dispute> GetDispute(const ContributionKey& key) const;
    size_t GetDisputeCount() const { return disputes_.size(); }

    /// Ledger account that escrows bonds; also the slashing authority used
    /// for overturned contributions
    const Address& GetAuthority() const { return params_.disputeCustody; }

    // === Restore from storage ===

    void RestoreDispute(const Dispute& dispute);

private:
    const consensus::ProtocolParams& params_;
    staking::StakeRegistry& stakes_;
    oracle::SettlementTarget& settlement_;
    ledger::ValueLedger& ledger_;
    const util::Clock& clock_;

    std::map<ContributionKey, Dispute> disputes_;
};

} // namespace dispute
} // namespace attestor

#endif // ATTESTOR_DISPUTE_DISPUTE_RESOLVER_H

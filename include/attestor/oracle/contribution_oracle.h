// ATTESTOR - Contribution Oracle
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Collects validator attestations for worker contributions and pays them out
// once enough distinct validators confirmed and the finalization delay passed.
//
// Record lifecycle:
//   Proposed -> Finalizable -> Finalized
//   Proposed -> Disputed -> Upheld -> Finalized
//                        -> Overturned -> Cancelled

#ifndef ATTESTOR_ORACLE_CONTRIBUTION_ORACLE_H
#define ATTESTOR_ORACLE_CONTRIBUTION_ORACLE_H

#include "attestor/consensus/params.h"
#include "attestor/core/serialize.h"
#include "attestor/core/status.h"
#include "attestor/core/types.h"
#include "attestor/identity/registry.h"
#include "attestor/ledger/ledger.h"
#include "attestor/oracle/payout.h"
#include "attestor/oracle/proof.h"
#include "attestor/staking/stake_registry.h"
#include "attestor/util/time.h"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace attestor {
namespace oracle {

// ============================================================================
// Contribution Record
// ============================================================================

struct ContributionRecord {
    ContributionKey key;
    BuildingId buildingId;
    WorkerId workerId;

    /// Building payout wallet as registered when the record was created
    Address buildingWallet;

    Amount amount{0};

    /// Distinct validators that attested this contribution
    std::set<ValidatorId> confirmingValidators;

    Timestamp proposedAt{0};
    Timestamp finalizedAt{0};

    bool finalized{false};

    /// Set together with finalized when a dispute overturned the record
    bool cancelled{false};

    /// Advisory flag raised by a validator
    bool disputed{false};
    ValidatorId flaggedBy;
    std::string flagReason;

    bool IsTerminal() const { return finalized; }
    size_t ConfirmationCount() const { return confirmingValidators.size(); }
    bool HasConfirmed(const ValidatorId& validator) const {
        return confirmingValidators.count(validator) > 0;
    }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, key);
        ::attestor::Serialize(s, buildingId);
        ::attestor::Serialize(s, workerId);
        ::attestor::Serialize(s, buildingWallet);
        ::attestor::Serialize(s, amount);
        ::attestor::Serialize(s, confirmingValidators);
        ::attestor::Serialize(s, proposedAt);
        ::attestor::Serialize(s, finalizedAt);
        ::attestor::Serialize(s, finalized);
        ::attestor::Serialize(s, cancelled);
        ::attestor::Serialize(s, disputed);
        ::attestor::Serialize(s, flaggedBy);
        ::attestor::Serialize(s, flagReason);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::attestor::Unserialize(s, key);
        ::attestor::Unserialize(s, buildingId);
        ::attestor::Unserialize(s, workerId);
        ::attestor::Unserialize(s, buildingWallet);
        ::attestor::Unserialize(s, amount);
        ::attestor::Unserialize(s, confirmingValidators);
        ::attestor::Unserialize(s, proposedAt);
        ::attestor::Unserialize(s, finalizedAt);
        ::attestor::Unserialize(s, finalized);
        ::attestor::Unserialize(s, cancelled);
        ::attestor::Unserialize(s, disputed);
        ::attestor::Unserialize(s, flaggedBy);
        ::attestor::Unserialize(s, flagReason);
    }
};

// ============================================================================
// Collaborator Interfaces
// ============================================================================

/// Read-only view of bonded disputes, consulted before finalizing
class DisputeView {
public:
    virtual ~DisputeView() = default;
    virtual bool HasUnresolvedDispute(const ContributionKey& key) const = 0;
};

/// Operations a dispute ruling applies to a contribution
class SettlementTarget {
public:
    virtual ~SettlementTarget() = default;

    virtual std::optional<ContributionRecord> GetContribution(const ContributionKey& key) const = 0;

    /**
     * Apply an Upheld ruling: clear the advisory flag and finalize, skipping
     * the dispute check. Timing and quorum still apply; when they fail the
     * record stays open for a later Finalize.
     */
    virtual Status SettleUpheld(const ContributionKey& key) = 0;

    /// Apply an Overturned ruling: close the record without paying
    virtual Status SettleOverturned(const ContributionKey& key) = 0;
};

// ============================================================================
// Contribution Oracle
// ============================================================================

/// Outcome of a successful finalization
struct FinalizeResult {
    Status status;
    PayoutSplit payout;
};

class ContributionOracle : public SettlementTarget {
public:
    ContributionOracle(const consensus::ProtocolParams& params,
                       const staking::StakeRegistry& stakes,
                       const identity::IdentityRegistry& identity,
                       ledger::ValueLedger& ledger,
                       const util::Clock& clock);

    /// Attach the dispute view checked by Finalize (may be null)
    void SetDisputeView(const DisputeView* disputes) { disputes_ = disputes; }

    // === Operations ===

    /**
     * Record caller's confirmation of (buildingId, workerId, amount).
     * The first attestation creates the record; later ones from other
     * validators add confirmations. Each signed proof is accepted once.
     */
    Status Attest(const ValidatorId& caller,
                  const BuildingId& buildingId,
                  const WorkerId& workerId,
                  Amount amount,
                  const ContributionProof& proof,
                  const WorkerSignature& signature);

    /// Raise the advisory dispute flag on an open record
    Status RaiseFlag(const ValidatorId& caller, const ContributionKey& key,
                     const std::string& reason);

    /// Mint the payout split for a record that met quorum and delay
    FinalizeResult Finalize(const ContributionKey& key);

    // === SettlementTarget ===

    std::optional<ContributionRecord> GetContribution(const ContributionKey& key) const override;
    Status SettleUpheld(const ContributionKey& key) override;
    Status SettleOverturned(const ContributionKey& key) override;

    // === Queries ===

    bool IsProofConsumed(const Hash256& proofId) const {
        return consumedProofs_.count(proofId) > 0;
    }
    size_t GetContributionCount() const { return records_.size(); }
    size_t GetConsumedProofCount() const { return consumedProofs_.size(); }

    /// Domain separator workers sign against
    const Hash256& GetDomainSeparator() const { return domainSeparator_; }

    /// SHA256(buildingId || workerId || amount)
    static ContributionKey ComputeContributionKey(const BuildingId& buildingId,
                                                  const WorkerId& workerId,
                                                  Amount amount);

    // === Restore from storage ===

    void RestoreContribution(const ContributionRecord& record);
    void RestoreConsumedProof(const Hash256& proofId);

private:
    const consensus::ProtocolParams& params_;
    const staking::StakeRegistry& stakes_;
    const identity::IdentityRegistry& identity_;
    ledger::ValueLedger& ledger_;
    const util::Clock& clock_;
    const DisputeView* disputes_{nullptr};

    Hash256 domainSeparator_;

    std::map<ContributionKey, ContributionRecord> records_;
    std::set<Hash256> consumedProofs_;

    /// Timing and quorum checks shared by Finalize and SettleUpheld
    Status CheckFinalizable(const ContributionRecord& record) const;

    /// Mint the split and mark the record finalized
    FinalizeResult Payout(ContributionRecord& record);
};

} // namespace oracle
} // namespace attestor

#endif // ATTESTOR_ORACLE_CONTRIBUTION_ORACLE_H

// ATTESTOR - Protocol Engine
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// The single sequential executor of the protocol. The engine owns the stake
// registry, the contribution oracle and the dispute resolver, runs every
// operation under one mutex, and persists the rows each successful operation
// touched in one atomic batch.

#ifndef ATTESTOR_NODE_ENGINE_H
#define ATTESTOR_NODE_ENGINE_H

#include "attestor/consensus/params.h"
#include "attestor/core/status.h"
#include "attestor/core/types.h"
#include "attestor/db/database.h"
#include "attestor/dispute/dispute_resolver.h"
#include "attestor/identity/registry.h"
#include "attestor/ledger/ledger.h"
#include "attestor/oracle/contribution_oracle.h"
#include "attestor/staking/stake_registry.h"
#include "attestor/store/protocol_store.h"
#include "attestor/util/time.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace attestor {
namespace node {

// ============================================================================
// Events
// ============================================================================

enum class EventType {
    StakeDeposited,
    WithdrawalRequested,
    WithdrawalCompleted,
    StakeSlashed,
    ContributionAttested,
    ContributionFlagged,
    ContributionFinalized,
    ContributionCancelled,
    DisputeRaised,
    VoteCommitted,
    VoteRevealed,
    DisputeResolved,
};

const char* EventTypeToString(EventType type);

/// Published after every successful state transition
struct ProtocolEvent {
    EventType type;
    /// Contribution key, null for stake events
    Hash256 key;
    /// Account that performed the operation
    Address actor;
    /// Account the operation applied to (validator for stake events)
    Address subject;
    Amount amount{0};
};

using EventCallback = std::function<void(const ProtocolEvent&)>;

// ============================================================================
// Protocol Engine
// ============================================================================

class ProtocolEngine {
public:
    /**
     * @param params   Protocol constants; throws std::invalid_argument if invalid
     * @param ledger   Value ledger stake and bonds move through
     * @param identity Worker and building registry
     * @param clock    Source of "now"
     * @param database Optional persistent store; must outlive the engine
     */
    ProtocolEngine(const consensus::ProtocolParams& params,
                   ledger::ValueLedger& ledger,
                   const identity::IdentityRegistry& identity,
                   const util::Clock& clock,
                   db::Database* database = nullptr);

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    /// Restore every table from the database; a no-op without one
    db::Status Load();

    /// Subscriber invoked under the engine lock; it must not call back in
    void SetEventCallback(EventCallback callback);

    // ========================================================================
    // Stake Registry
    // ========================================================================

    Status Deposit(const ValidatorId& validator, Amount amount);
    Status RequestWithdrawal(const ValidatorId& validator, Amount amount);
    staking::WithdrawalResult CompleteWithdrawal(const ValidatorId& validator);
    staking::SlashResult Slash(const Address& caller, const ValidatorId& validator,
                               Amount amount, const std::string& reason);

    /// Trusted administration; callers are not authenticated here
    void AddSlashingAuthority(const Address& authority);
    void RemoveSlashingAuthority(const Address& authority);

    // ========================================================================
    // Contribution Oracle
    // ========================================================================

    Status Attest(const ValidatorId& caller,
                  const BuildingId& buildingId,
                  const WorkerId& workerId,
                  Amount amount,
                  const oracle::ContributionProof& proof,
                  const oracle::WorkerSignature& signature);

    Status RaiseFlag(const ValidatorId& caller, const ContributionKey& key,
                     const std::string& reason);

    oracle::FinalizeResult Finalize(const ContributionKey& key);

    // ========================================================================
    // Dispute Resolver
    // ========================================================================

    Status RaiseDispute(const Address& challenger, const ContributionKey& key,
                        const std::string& reason);
    Status CommitVote(const ValidatorId& validator, const ContributionKey& key,
                      const Hash256& commitment);
    Status RevealVote(const ValidatorId& validator, const ContributionKey& key,
                      dispute::Vote vote, const Hash256& salt);
    dispute::ResolveResult ResolveDispute(const ContributionKey& key);

    // ========================================================================
    // Queries
    // ========================================================================

    const consensus::ProtocolParams& GetParams() const { return params_; }
    Hash256 GetDomainSeparator() const;

    bool IsQualified(const ValidatorId& validator) const;
    bool IsSlashingAuthority(const Address& authority) const;
    std::optional<staking::StakeAccount> GetAccount(const ValidatorId& validator) const;
    Amount GetTotalStaked() const;
    size_t GetQualifiedCount() const;
    std::vector<staking::SlashEvent> GetSlashEvents() const;

    std::optional<oracle::ContributionRecord> GetContribution(const ContributionKey& key) const;
    bool IsProofConsumed(const Hash256& proofId) const;
    size_t GetContributionCount() const;

    std::optional<dispute::Dispute> GetDispute(const ContributionKey& key) const;
    bool HasUnresolvedDispute(const ContributionKey& key) const;
    size_t GetDisputeCount() const;

    /// Result of the most recent store commit (OK without a database)
    db::Status GetLastStoreStatus() const;

private:
    const consensus::ProtocolParams params_;
    ledger::ValueLedger& ledger_;
    const identity::IdentityRegistry& identity_;
    const util::Clock& clock_;

    staking::StakeRegistry stakes_;
    oracle::ContributionOracle oracle_;
    dispute::DisputeResolver resolver_;

    std::unique_ptr<store::ProtocolStore> store_;
    db::Status lastStoreStatus_;

    EventCallback callback_;
    mutable std::mutex mutex_;

    /// Rejected operations are logged at debug level
    void LogRejected(const char* op, const Status& status) const;

    void Publish(EventType type, const Hash256& key, const Address& actor,
                 const Address& subject, Amount amount);

    /// Commit batch through the store, if there is one
    void Persist(db::WriteBatch& batch);

    void StageAccount(db::WriteBatch& batch, const ValidatorId& validator) const;
    void StageContribution(db::WriteBatch& batch, const ContributionKey& key) const;
    void StageDispute(db::WriteBatch& batch, const ContributionKey& key) const;

    /// Stage slash events from index first onward and the slashed accounts
    void StageSlashEventsSince(db::WriteBatch& batch, size_t first) const;
};

} // namespace node
} // namespace attestor

#endif // ATTESTOR_NODE_ENGINE_H

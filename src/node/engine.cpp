// ATTESTOR - Protocol Engine Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/node/engine.h"
#include "attestor/util/logging.h"

#include <stdexcept>

namespace attestor {
namespace node {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::StakeDeposited: return "StakeDeposited";
        case EventType::WithdrawalRequested: return "WithdrawalRequested";
        case EventType::WithdrawalCompleted: return "WithdrawalCompleted";
        case EventType::StakeSlashed: return "StakeSlashed";
        case EventType::ContributionAttested: return "ContributionAttested";
        case EventType::ContributionFlagged: return "ContributionFlagged";
        case EventType::ContributionFinalized: return "ContributionFinalized";
        case EventType::ContributionCancelled: return "ContributionCancelled";
        case EventType::DisputeRaised: return "DisputeRaised";
        case EventType::VoteCommitted: return "VoteCommitted";
        case EventType::VoteRevealed: return "VoteRevealed";
        case EventType::DisputeResolved: return "DisputeResolved";
        default: return "Unknown";
    }
}

namespace {

const consensus::ProtocolParams& CheckedParams(const consensus::ProtocolParams& params) {
    std::string error;
    if (!params.Validate(&error)) {
        throw std::invalid_argument("invalid protocol parameters: " + error);
    }
    return params;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ProtocolEngine::ProtocolEngine(const consensus::ProtocolParams& params,
                               ledger::ValueLedger& ledger,
                               const identity::IdentityRegistry& identity,
                               const util::Clock& clock,
                               db::Database* database)
    : params_(CheckedParams(params))
    , ledger_(ledger)
    , identity_(identity)
    , clock_(clock)
    , stakes_(params_, ledger_, clock_)
    , oracle_(params_, stakes_, identity_, ledger_, clock_)
    , resolver_(params_, stakes_, oracle_, ledger_, clock_)
{
    oracle_.SetDisputeView(&resolver_);
    if (params_.overturnSlashAmount > 0) {
        stakes_.AddSlashingAuthority(resolver_.GetAuthority());
    }
    if (database) {
        store_ = std::make_unique<store::ProtocolStore>(*database);
    }

    LOG_INFO(util::LogCategory::ENGINE) << "protocol engine started on " << params_.networkId
        << " (chain " << params_.chainId << ", min stake " << params_.minStake
        << ", " << params_.minConfirmations << " confirmations"
        << (store_ ? ", persistent" : "") << ")";
}

db::Status ProtocolEngine::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_) {
        return db::Status::Ok();
    }

    store::ProtocolSnapshot snapshot;
    db::Status s = store_->Load(snapshot);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::ENGINE) << "failed to load protocol state: " << s.ToString();
        return s;
    }

    for (const auto& account : snapshot.accounts) {
        stakes_.RestoreAccount(account);
    }
    for (const auto& event : snapshot.slashEvents) {
        stakes_.RestoreSlashEvent(event);
    }
    for (const auto& authority : snapshot.slashingAuthorities) {
        stakes_.AddSlashingAuthority(authority);
    }
    for (const auto& record : snapshot.contributions) {
        oracle_.RestoreContribution(record);
    }
    for (const auto& proofId : snapshot.consumedProofs) {
        oracle_.RestoreConsumedProof(proofId);
    }
    for (const auto& d : snapshot.disputes) {
        resolver_.RestoreDispute(d);
    }
    return db::Status::Ok();
}

void ProtocolEngine::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

// ============================================================================
// Helpers
// ============================================================================

void ProtocolEngine::LogRejected(const char* op, const Status& status) const {
    LOG_DEBUG(util::LogCategory::ENGINE) << op << " rejected: " << status.ToString();
}

void ProtocolEngine::Publish(EventType type, const Hash256& key, const Address& actor,
                             const Address& subject, Amount amount) {
    if (!callback_) {
        return;
    }
    ProtocolEvent event;
    event.type = type;
    event.key = key;
    event.actor = actor;
    event.subject = subject;
    event.amount = amount;
    callback_(event);
}

void ProtocolEngine::Persist(db::WriteBatch& batch) {
    if (!store_) {
        return;
    }
    lastStoreStatus_ = store_->Commit(batch);
    if (!lastStoreStatus_.ok()) {
        LOG_ERROR(util::LogCategory::ENGINE) << "state change applied but not persisted: "
            << lastStoreStatus_.ToString();
    }
}

void ProtocolEngine::StageAccount(db::WriteBatch& batch, const ValidatorId& validator) const {
    if (!store_) return;
    if (auto account = stakes_.GetAccount(validator)) {
        store_->StageAccount(batch, *account);
    }
}

void ProtocolEngine::StageContribution(db::WriteBatch& batch, const ContributionKey& key) const {
    if (!store_) return;
    if (auto record = oracle_.GetContribution(key)) {
        store_->StageContribution(batch, *record);
    }
}

void ProtocolEngine::StageDispute(db::WriteBatch& batch, const ContributionKey& key) const {
    if (!store_) return;
    if (auto d = resolver_.GetDispute(key)) {
        store_->StageDispute(batch, *d);
    }
}

void ProtocolEngine::StageSlashEventsSince(db::WriteBatch& batch, size_t first) const {
    if (!store_) return;
    const auto& events = stakes_.GetSlashEvents();
    for (size_t i = first; i < events.size(); ++i) {
        store_->StageSlashEvent(batch, events[i]);
        StageAccount(batch, events[i].validator);
    }
}

// ============================================================================
// Stake Registry
// ============================================================================

Status ProtocolEngine::Deposit(const ValidatorId& validator, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = stakes_.Deposit(validator, amount);
    if (!s.ok()) {
        LogRejected("Deposit", s);
        return s;
    }
    db::WriteBatch batch;
    StageAccount(batch, validator);
    Persist(batch);
    Publish(EventType::StakeDeposited, Hash256(), validator, validator, amount);
    return s;
}

Status ProtocolEngine::RequestWithdrawal(const ValidatorId& validator, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = stakes_.RequestWithdrawal(validator, amount);
    if (!s.ok()) {
        LogRejected("RequestWithdrawal", s);
        return s;
    }
    db::WriteBatch batch;
    StageAccount(batch, validator);
    Persist(batch);
    Publish(EventType::WithdrawalRequested, Hash256(), validator, validator, amount);
    return s;
}

staking::WithdrawalResult ProtocolEngine::CompleteWithdrawal(const ValidatorId& validator) {
    std::lock_guard<std::mutex> lock(mutex_);
    staking::WithdrawalResult result = stakes_.CompleteWithdrawal(validator);
    if (!result.status.ok()) {
        LogRejected("CompleteWithdrawal", result.status);
        return result;
    }
    db::WriteBatch batch;
    StageAccount(batch, validator);
    Persist(batch);
    Publish(EventType::WithdrawalCompleted, Hash256(), validator, validator, result.released);
    return result;
}

staking::SlashResult ProtocolEngine::Slash(const Address& caller, const ValidatorId& validator,
                                           Amount amount, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = stakes_.GetSlashEvents().size();
    staking::SlashResult result = stakes_.Slash(caller, validator, amount, reason);
    if (!result.status.ok()) {
        LogRejected("Slash", result.status);
        return result;
    }
    db::WriteBatch batch;
    StageSlashEventsSince(batch, before);
    Persist(batch);
    Publish(EventType::StakeSlashed, Hash256(), caller, validator, result.slashed);
    return result;
}

void ProtocolEngine::AddSlashingAuthority(const Address& authority) {
    std::lock_guard<std::mutex> lock(mutex_);
    stakes_.AddSlashingAuthority(authority);
    if (store_) {
        db::WriteBatch batch;
        store_->StageSlashingAuthority(batch, authority, true);
        Persist(batch);
    }
}

void ProtocolEngine::RemoveSlashingAuthority(const Address& authority) {
    std::lock_guard<std::mutex> lock(mutex_);
    stakes_.RemoveSlashingAuthority(authority);
    if (store_) {
        db::WriteBatch batch;
        store_->StageSlashingAuthority(batch, authority, false);
        Persist(batch);
    }
}

// ============================================================================
// Contribution Oracle
// ============================================================================

Status ProtocolEngine::Attest(const ValidatorId& caller,
                              const BuildingId& buildingId,
                              const WorkerId& workerId,
                              Amount amount,
                              const oracle::ContributionProof& proof,
                              const oracle::WorkerSignature& signature) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = oracle_.Attest(caller, buildingId, workerId, amount, proof, signature);
    if (!s.ok()) {
        LogRejected("Attest", s);
        return s;
    }
    ContributionKey key = oracle::ContributionOracle::ComputeContributionKey(
        buildingId, workerId, amount);
    db::WriteBatch batch;
    StageContribution(batch, key);
    if (store_) {
        store_->StageConsumedProof(batch, oracle::ComputeProofId(proof, signature));
    }
    Persist(batch);
    Publish(EventType::ContributionAttested, key, caller, workerId, amount);
    return s;
}

Status ProtocolEngine::RaiseFlag(const ValidatorId& caller, const ContributionKey& key,
                                 const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = oracle_.RaiseFlag(caller, key, reason);
    if (!s.ok()) {
        LogRejected("RaiseFlag", s);
        return s;
    }
    db::WriteBatch batch;
    StageContribution(batch, key);
    Persist(batch);
    Publish(EventType::ContributionFlagged, key, caller, Address(), 0);
    return s;
}

oracle::FinalizeResult ProtocolEngine::Finalize(const ContributionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    oracle::FinalizeResult result = oracle_.Finalize(key);
    if (!result.status.ok()) {
        LogRejected("Finalize", result.status);
        return result;
    }
    db::WriteBatch batch;
    StageContribution(batch, key);
    Persist(batch);
    auto record = oracle_.GetContribution(key);
    Publish(EventType::ContributionFinalized, key, Address(),
            record ? record->workerId : Address(), result.payout.Total());
    return result;
}

// ============================================================================
// Dispute Resolver
// ============================================================================

Status ProtocolEngine::RaiseDispute(const Address& challenger, const ContributionKey& key,
                                    const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = resolver_.RaiseDispute(challenger, key, reason);
    if (!s.ok()) {
        LogRejected("RaiseDispute", s);
        return s;
    }
    db::WriteBatch batch;
    StageDispute(batch, key);
    Persist(batch);
    Publish(EventType::DisputeRaised, key, challenger, Address(), params_.disputeBond);
    return s;
}

Status ProtocolEngine::CommitVote(const ValidatorId& validator, const ContributionKey& key,
                                  const Hash256& commitment) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = resolver_.CommitVote(validator, key, commitment);
    if (!s.ok()) {
        LogRejected("CommitVote", s);
        return s;
    }
    db::WriteBatch batch;
    StageDispute(batch, key);
    Persist(batch);
    Publish(EventType::VoteCommitted, key, validator, Address(), 0);
    return s;
}

Status ProtocolEngine::RevealVote(const ValidatorId& validator, const ContributionKey& key,
                                  dispute::Vote vote, const Hash256& salt) {
    std::lock_guard<std::mutex> lock(mutex_);
    Status s = resolver_.RevealVote(validator, key, vote, salt);
    if (!s.ok()) {
        LogRejected("RevealVote", s);
        return s;
    }
    db::WriteBatch batch;
    StageDispute(batch, key);
    Persist(batch);
    Publish(EventType::VoteRevealed, key, validator, Address(), 0);
    return s;
}

dispute::ResolveResult ProtocolEngine::ResolveDispute(const ContributionKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = stakes_.GetSlashEvents().size();
    dispute::ResolveResult result = resolver_.ResolveDispute(key);
    if (!result.status.ok()) {
        LogRejected("ResolveDispute", result.status);
        return result;
    }

    db::WriteBatch batch;
    StageDispute(batch, key);
    StageContribution(batch, key);
    StageSlashEventsSince(batch, before);
    Persist(batch);

    auto d = resolver_.GetDispute(key);
    Address challenger = d ? d->challenger : Address();
    Publish(EventType::DisputeResolved, key, challenger, Address(), d ? d->bond : 0);

    auto record = oracle_.GetContribution(key);
    if (record && record->cancelled) {
        Publish(EventType::ContributionCancelled, key, Address(), record->workerId, 0);
    } else if (record && record->finalized) {
        Publish(EventType::ContributionFinalized, key, Address(), record->workerId,
                record->amount);
    }

    const auto& events = stakes_.GetSlashEvents();
    for (size_t i = before; i < events.size(); ++i) {
        Publish(EventType::StakeSlashed, key, events[i].authority, events[i].validator,
                events[i].slashed);
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

Hash256 ProtocolEngine::GetDomainSeparator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.GetDomainSeparator();
}

bool ProtocolEngine::IsQualified(const ValidatorId& validator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.IsQualified(validator);
}

bool ProtocolEngine::IsSlashingAuthority(const Address& authority) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.IsSlashingAuthority(authority);
}

std::optional<staking::StakeAccount> ProtocolEngine::GetAccount(const ValidatorId& validator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetAccount(validator);
}

Amount ProtocolEngine::GetTotalStaked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetTotalStaked();
}

size_t ProtocolEngine::GetQualifiedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetQualifiedCount();
}

std::vector<staking::SlashEvent> ProtocolEngine::GetSlashEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakes_.GetSlashEvents();
}

std::optional<oracle::ContributionRecord> ProtocolEngine::GetContribution(
    const ContributionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.GetContribution(key);
}

bool ProtocolEngine::IsProofConsumed(const Hash256& proofId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.IsProofConsumed(proofId);
}

size_t ProtocolEngine::GetContributionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.GetContributionCount();
}

std::optional<dispute::Dispute> ProtocolEngine::GetDispute(const ContributionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolver_.GetDispute(key);
}

bool ProtocolEngine::HasUnresolvedDispute(const ContributionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolver_.HasUnresolvedDispute(key);
}

size_t ProtocolEngine::GetDisputeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolver_.GetDisputeCount();
}

db::Status ProtocolEngine::GetLastStoreStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastStoreStatus_;
}

} // namespace node
} // namespace attestor

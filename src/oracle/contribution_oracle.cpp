// ATTESTOR - Contribution Oracle Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/oracle/contribution_oracle.h"
#include "attestor/crypto/sha256.h"
#include "attestor/util/logging.h"

#include <sstream>

namespace attestor {
namespace oracle {

// ============================================================================
// ContributionRecord
// ============================================================================

std::string ContributionRecord::ToString() const {
    std::ostringstream ss;
    ss << "ContributionRecord(key=" << key.ToHex().substr(0, 16) << "..."
       << ", worker=" << workerId.ToHex()
       << ", amount=" << amount
       << ", confirmations=" << confirmingValidators.size()
       << ", proposedAt=" << proposedAt;
    if (cancelled) {
        ss << ", cancelled";
    } else if (finalized) {
        ss << ", finalized";
    }
    if (disputed) {
        ss << ", flagged";
    }
    ss << ")";
    return ss.str();
}

// ============================================================================
// ContributionOracle
// ============================================================================

ContributionOracle::ContributionOracle(const consensus::ProtocolParams& params,
                                       const staking::StakeRegistry& stakes,
                                       const identity::IdentityRegistry& identity,
                                       ledger::ValueLedger& ledger,
                                       const util::Clock& clock)
    : params_(params)
    , stakes_(stakes)
    , identity_(identity)
    , ledger_(ledger)
    , clock_(clock)
    , domainSeparator_(ComputeDomainSeparator(params.chainId, params.oracleId)) {}

ContributionKey ContributionOracle::ComputeContributionKey(const BuildingId& buildingId,
                                                           const WorkerId& workerId,
                                                           Amount amount) {
    DataStream ss;
    ss << buildingId << workerId << amount;
    return SHA256Hash(ss.Data());
}

Status ContributionOracle::Attest(const ValidatorId& caller,
                                  const BuildingId& buildingId,
                                  const WorkerId& workerId,
                                  Amount amount,
                                  const ContributionProof& proof,
                                  const WorkerSignature& signature) {
    if (!stakes_.IsQualified(caller)) {
        return Status::Authorization("caller is not a qualified validator");
    }
    if (amount <= 0 || !MoneyRange(amount)) {
        return Status::Validation("contribution amount must be positive");
    }
    auto wallet = identity_.GetBuildingWallet(buildingId);
    if (!identity_.IsBuildingRegistered(buildingId) || !wallet) {
        return Status::NotFound("building not registered: " + buildingId.ToHex());
    }
    if (!identity_.IsWorkerActive(workerId)) {
        return Status::Validation("worker is not active: " + workerId.ToHex());
    }

    Hash256 proofId = ComputeProofId(proof, signature);
    if (IsProofConsumed(proofId)) {
        return Status::Replay("proof already consumed");
    }

    if (proof.buildingId != buildingId || proof.workerId != workerId ||
        proof.amount != amount) {
        return Status::Validation("proof does not match the attested contribution");
    }
    if (!VerifyWorkerSignature(domainSeparator_, proof, signature)) {
        return Status::Validation("invalid worker signature");
    }

    ContributionKey key = ComputeContributionKey(buildingId, workerId, amount);
    auto it = records_.find(key);
    if (it == records_.end()) {
        ContributionRecord record;
        record.key = key;
        record.buildingId = buildingId;
        record.workerId = workerId;
        record.buildingWallet = *wallet;
        record.amount = amount;
        record.confirmingValidators.insert(caller);
        record.proposedAt = clock_.Now();
        records_.emplace(key, record);

        LOG_INFO(util::LogCategory::ORACLE) << "contribution proposed " << key.ToHex()
            << " (worker=" << workerId.ToHex() << ", amount=" << amount
            << ") by " << caller.ToHex();
    } else {
        ContributionRecord& record = it->second;
        if (record.HasConfirmed(caller)) {
            return Status::Duplicate("validator already confirmed this contribution");
        }
        if (record.IsTerminal()) {
            return Status::State("contribution is already finalized");
        }
        record.confirmingValidators.insert(caller);

        LOG_INFO(util::LogCategory::ORACLE) << "contribution " << key.ToHex()
            << " confirmed by " << caller.ToHex()
            << " (" << record.ConfirmationCount() << " confirmations)";
    }

    consumedProofs_.insert(proofId);
    return Status::Ok();
}

Status ContributionOracle::RaiseFlag(const ValidatorId& caller, const ContributionKey& key,
                                     const std::string& reason) {
    if (!stakes_.IsQualified(caller)) {
        return Status::Authorization("caller is not a qualified validator");
    }
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Status::NotFound("unknown contribution " + key.ToHex());
    }
    ContributionRecord& record = it->second;
    if (record.IsTerminal()) {
        return Status::State("contribution is already finalized");
    }
    if (record.disputed) {
        return Status::State("contribution is already flagged");
    }

    record.disputed = true;
    record.flaggedBy = caller;
    record.flagReason = reason;

    LOG_INFO(util::LogCategory::ORACLE) << "contribution " << key.ToHex()
        << " flagged by " << caller.ToHex() << ": " << reason;
    return Status::Ok();
}

Status ContributionOracle::CheckFinalizable(const ContributionRecord& record) const {
    Timestamp now = clock_.Now();
    if (now - record.proposedAt < params_.finalizationDelay) {
        return Status::Timing("finalizable in " +
            util::FormatDuration(record.proposedAt + params_.finalizationDelay - now));
    }
    if (record.ConfirmationCount() < params_.minConfirmations) {
        return Status::Consensus("have " + std::to_string(record.ConfirmationCount()) +
            " of " + std::to_string(params_.minConfirmations) + " confirmations");
    }
    return Status::Ok();
}

FinalizeResult ContributionOracle::Payout(ContributionRecord& record) {
    FinalizeResult result;
    result.payout = ComputePayoutSplit(record.amount);

    ledger::LedgerBatch batch;
    if (result.payout.worker > 0) batch.Mint(record.workerId, result.payout.worker);
    if (result.payout.building > 0) batch.Mint(record.buildingWallet, result.payout.building);
    if (result.payout.maintainer > 0) batch.Mint(params_.maintainerPool, result.payout.maintainer);
    if (result.payout.treasury > 0) batch.Mint(params_.treasury, result.payout.treasury);

    result.status = ledger_.Apply(batch);
    if (!result.status.ok()) {
        result.payout = PayoutSplit();
        return result;
    }

    record.finalized = true;
    record.finalizedAt = clock_.Now();

    LOG_INFO(util::LogCategory::ORACLE) << "contribution " << record.key.ToHex()
        << " finalized: " << result.payout.ToString();
    return result;
}

FinalizeResult ContributionOracle::Finalize(const ContributionKey& key) {
    FinalizeResult result;
    auto it = records_.find(key);
    if (it == records_.end()) {
        result.status = Status::NotFound("unknown contribution " + key.ToHex());
        return result;
    }
    ContributionRecord& record = it->second;
    if (record.IsTerminal()) {
        result.status = Status::State("contribution is already finalized");
        return result;
    }
    result.status = CheckFinalizable(record);
    if (!result.status.ok()) {
        return result;
    }
    if (record.disputed) {
        result.status = Status::Disputed("contribution is flagged");
        return result;
    }
    if (disputes_ && disputes_->HasUnresolvedDispute(key)) {
        result.status = Status::Disputed("contribution has an unresolved dispute");
        return result;
    }
    return Payout(record);
}

std::optional<ContributionRecord> ContributionOracle::GetContribution(const ContributionKey& key) const {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Status ContributionOracle::SettleUpheld(const ContributionKey& key) {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Status::NotFound("unknown contribution " + key.ToHex());
    }
    ContributionRecord& record = it->second;
    if (record.IsTerminal()) {
        return Status::State("contribution is already finalized");
    }

    record.disputed = false;

    Status s = CheckFinalizable(record);
    if (!s.ok()) {
        LOG_INFO(util::LogCategory::ORACLE) << "contribution " << key.ToHex()
            << " upheld, finalization deferred: " << s.ToString();
        return s;
    }
    return Payout(record).status;
}

Status ContributionOracle::SettleOverturned(const ContributionKey& key) {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Status::NotFound("unknown contribution " + key.ToHex());
    }
    ContributionRecord& record = it->second;
    if (record.IsTerminal()) {
        return Status::State("contribution is already finalized");
    }

    record.finalized = true;
    record.cancelled = true;
    record.disputed = false;
    record.finalizedAt = clock_.Now();

    LOG_INFO(util::LogCategory::ORACLE) << "contribution " << key.ToHex() << " cancelled";
    return Status::Ok();
}

void ContributionOracle::RestoreContribution(const ContributionRecord& record) {
    records_[record.key] = record;
}

void ContributionOracle::RestoreConsumedProof(const Hash256& proofId) {
    consumedProofs_.insert(proofId);
}

} // namespace oracle
} // namespace attestor

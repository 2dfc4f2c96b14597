// ATTESTOR - Dispute Resolver Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/dispute/dispute_resolver.h"
#include "attestor/crypto/sha256.h"
#include "attestor/util/logging.h"

#include <sstream>

namespace attestor {
namespace dispute {

const char* RulingToString(Ruling ruling) {
    switch (ruling) {
        case Ruling::Unresolved: return "Unresolved";
        case Ruling::Upheld: return "Upheld";
        case Ruling::Overturned: return "Overturned";
        default: return "Unknown";
    }
}

Hash256 ComputeCommitment(Vote vote, const Hash256& salt) {
    Byte v = static_cast<Byte>(vote);
    SHA256 hasher;
    hasher.Write(&v, 1);
    hasher.Write(salt.data(), Hash256::SIZE);
    return hasher.Finalize();
}

std::string Dispute::ToString() const {
    std::ostringstream ss;
    ss << "Dispute(key=" << key.ToHex().substr(0, 16) << "..."
       << ", challenger=" << challenger.ToHex()
       << ", bond=" << bond
       << ", commits=" << commits.size()
       << ", reveals=" << reveals.size()
       << ", ruling=" << RulingToString(ruling);
    if (resolved) {
        ss << " (" << validVotes << " valid, " << invalidVotes << " invalid)";
    }
    ss << ")";
    return ss.str();
}

DisputeResolver::DisputeResolver(const consensus::ProtocolParams& params,
                                 staking::StakeRegistry& stakes,
                                 oracle::SettlementTarget& settlement,
                                 ledger::ValueLedger& ledger,
                                 const util::Clock& clock)
    : params_(params)
    , stakes_(stakes)
    , settlement_(settlement)
    , ledger_(ledger)
    , clock_(clock) {}

// ============================================================================
// Operations
// ============================================================================

Status DisputeResolver::RaiseDispute(const Address& challenger, const ContributionKey& key,
                                     const std::string& reason) {
    auto record = settlement_.GetContribution(key);
    if (!record) {
        return Status::NotFound("unknown contribution " + key.ToHex());
    }
    if (record->IsTerminal()) {
        return Status::State("contribution is already finalized");
    }
    // Only one live dispute per record; a resolved one on a record that is
    // still open (deferred Upheld payout) may be replaced
    auto existing = disputes_.find(key);
    if (existing != disputes_.end() && !existing->second.resolved) {
        return Status::State("contribution already has a dispute");
    }

    if (params_.disputeBond > 0) {
        Status s = ledger_.Transfer(challenger, params_.disputeCustody, params_.disputeBond);
        if (!s.ok()) {
            return Status::Validation("dispute bond transfer failed: " + s.message());
        }
    }

    Dispute dispute;
    dispute.key = key;
    dispute.challenger = challenger;
    dispute.bond = params_.disputeBond;
    dispute.reason = reason;
    dispute.openedAt = clock_.Now();
    dispute.commitDeadline = dispute.openedAt + params_.commitPeriod;
    dispute.revealDeadline = dispute.commitDeadline + params_.revealPeriod;
    disputes_[key] = dispute;

    LOG_INFO(util::LogCategory::DISPUTE) << "dispute raised on " << key.ToHex()
        << " by " << challenger.ToHex() << ", commits until "
        << util::FormatISO8601(dispute.commitDeadline) << ": " << reason;
    return Status::Ok();
}

Status DisputeResolver::CommitVote(const ValidatorId& validator, const ContributionKey& key,
                                   const Hash256& commitment) {
    if (!stakes_.IsQualified(validator)) {
        return Status::Authorization("caller is not a qualified validator");
    }
    auto it = disputes_.find(key);
    if (it == disputes_.end()) {
        return Status::NotFound("no dispute for " + key.ToHex());
    }
    Dispute& dispute = it->second;
    if (dispute.resolved) {
        return Status::State("dispute is resolved");
    }
    if (clock_.Now() >= dispute.commitDeadline) {
        return Status::Timing("commit phase has ended");
    }
    if (dispute.HasCommitted(validator)) {
        return Status::Duplicate("validator already committed");
    }
    for (const auto& [other, existing] : dispute.commits) {
        if (existing == commitment) {
            return Status::Replay("commitment already submitted by another validator");
        }
    }
    if (commitment.IsNull()) {
        return Status::Validation("commitment is null");
    }

    dispute.commits.emplace(validator, commitment);

    LOG_INFO(util::LogCategory::DISPUTE) << "vote committed on " << key.ToHex()
        << " by " << validator.ToHex();
    return Status::Ok();
}

Status DisputeResolver::RevealVote(const ValidatorId& validator, const ContributionKey& key,
                                   Vote vote, const Hash256& salt) {
    auto it = disputes_.find(key);
    if (it == disputes_.end()) {
        return Status::NotFound("no dispute for " + key.ToHex());
    }
    Dispute& dispute = it->second;
    if (dispute.resolved) {
        return Status::State("dispute is resolved");
    }
    Timestamp now = clock_.Now();
    if (now < dispute.commitDeadline) {
        return Status::Timing("reveal phase has not started");
    }
    if (now >= dispute.revealDeadline) {
        return Status::Timing("reveal phase has ended");
    }
    auto commit = dispute.commits.find(validator);
    if (commit == dispute.commits.end()) {
        return Status::NotFound("validator did not commit");
    }
    if (dispute.HasRevealed(validator)) {
        return Status::Duplicate("validator already revealed");
    }
    if (ComputeCommitment(vote, salt) != commit->second) {
        return Status::Validation("reveal does not match commitment");
    }

    dispute.reveals.emplace(validator, vote == Vote::Valid);

    LOG_INFO(util::LogCategory::DISPUTE) << "vote revealed on " << key.ToHex()
        << " by " << validator.ToHex() << ": "
        << (vote == Vote::Valid ? "valid" : "invalid");
    return Status::Ok();
}

ResolveResult DisputeResolver::ResolveDispute(const ContributionKey& key) {
    ResolveResult result;
    auto it = disputes_.find(key);
    if (it == disputes_.end()) {
        result.status = Status::NotFound("no dispute for " + key.ToHex());
        return result;
    }
    Dispute& dispute = it->second;
    if (dispute.resolved) {
        result.status = Status::State("dispute is resolved");
        return result;
    }
    Timestamp now = clock_.Now();
    if (now < dispute.revealDeadline) {
        result.status = Status::Timing("reveal phase ends in " +
            util::FormatDuration(dispute.revealDeadline - now));
        return result;
    }

    uint32_t valid = 0;
    uint32_t invalid = 0;
    for (const auto& [validator, judgedValid] : dispute.reveals) {
        if (judgedValid) {
            ++valid;
        } else {
            ++invalid;
        }
    }
    Ruling ruling = invalid > valid ? Ruling::Overturned : Ruling::Upheld;

    if (dispute.bond > 0) {
        const Address& recipient =
            ruling == Ruling::Overturned ? dispute.challenger : params_.treasury;
        Status s = ledger_.Transfer(params_.disputeCustody, recipient, dispute.bond);
        if (!s.ok()) {
            result.status = s;
            return result;
        }
    }

    // Confirmers of the record, read before the ruling closes it
    auto record = settlement_.GetContribution(key);

    dispute.resolved = true;
    dispute.ruling = ruling;
    dispute.validVotes = valid;
    dispute.invalidVotes = invalid;
    dispute.resolvedAt = now;
    result.ruling = ruling;

    LOG_INFO(util::LogCategory::DISPUTE) << "dispute on " << key.ToHex() << " resolved "
        << RulingToString(ruling) << " (" << valid << " valid, " << invalid << " invalid)";

    if (ruling == Ruling::Upheld) {
        result.settlement = settlement_.SettleUpheld(key);
    } else {
        result.settlement = settlement_.SettleOverturned(key);
    }
    if (!result.settlement.ok()) {
        LOG_WARN(util::LogCategory::DISPUTE) << "settlement of " << key.ToHex()
            << " not applied: " << result.settlement.ToString();
    }

    if (ruling == Ruling::Overturned && params_.overturnSlashAmount > 0 && record) {
        for (const auto& validator : record->confirmingValidators) {
            staking::SlashResult slash = stakes_.Slash(GetAuthority(), validator,
                params_.overturnSlashAmount, "confirmed overturned contribution " + key.ToHex());
            if (slash.status.ok()) {
                result.slashed.push_back(validator);
            } else {
                LOG_WARN(util::LogCategory::DISPUTE) << "could not slash confirmer "
                    << validator.ToHex() << ": " << slash.status.ToString();
            }
        }
    }

    return result;
}

// ============================================================================
// Queries
// ============================================================================

bool DisputeResolver::HasUnresolvedDispute(const ContributionKey& key) const {
    auto it = disputes_.find(key);
    return it != disputes_.end() && !it->second.resolved;
}

std::optional<Dispute> DisputeResolver::GetDispute(const ContributionKey& key) const {
    auto it = disputes_.find(key);
    if (it == disputes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DisputeResolver::RestoreDispute(const Dispute& dispute) {
    disputes_[dispute.key] = dispute;
}

} // namespace dispute
} // namespace attestor

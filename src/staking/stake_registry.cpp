// ATTESTOR - Stake Registry Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/staking/stake_registry.h"
#include "attestor/util/logging.h"

#include <algorithm>
#include <sstream>

namespace attestor {
namespace staking {

std::string StakeAccount::ToString() const {
    std::ostringstream ss;
    ss << "StakeAccount(" << validator.ToHex().substr(0, 16) << "..."
       << ", active=" << activeStake
       << ", pending=" << pendingWithdrawal
       << ", unlock=" << withdrawalUnlockTime
       << ", slashed=" << totalSlashed << "/" << slashCount << ")";
    return ss.str();
}

StakeRegistry::StakeRegistry(const consensus::ProtocolParams& params,
                             ledger::ValueLedger& ledger,
                             const util::Clock& clock)
    : params_(params), ledger_(ledger), clock_(clock) {}

// ============================================================================
// Operations
// ============================================================================

Status StakeRegistry::Deposit(const ValidatorId& validator, Amount amount) {
    if (amount <= 0) {
        return Status::Validation("deposit amount must be positive");
    }

    auto it = accounts_.find(validator);
    Amount current = it == accounts_.end() ? 0 : it->second.activeStake;
    if (!MoneyRange(amount) || current > MAX_MONEY - amount) {
        return Status::Validation("stake exceeds money range");
    }

    Status s = ledger_.Transfer(validator, params_.stakeCustody, amount);
    if (!s.ok()) {
        return s;
    }

    StakeAccount& account = accounts_[validator];
    account.validator = validator;
    account.activeStake += amount;

    LOG_INFO(util::LogCategory::STAKE) << "deposit " << amount << " by "
        << validator.ToHex() << " (active=" << account.activeStake << ")";
    return Status::Ok();
}

Status StakeRegistry::RequestWithdrawal(const ValidatorId& validator, Amount amount) {
    if (amount <= 0) {
        return Status::Validation("withdrawal amount must be positive");
    }
    auto it = accounts_.find(validator);
    if (it == accounts_.end()) {
        return Status::NotFound("no stake account for " + validator.ToHex());
    }
    StakeAccount& account = it->second;
    if (amount > account.activeStake) {
        return Status::Validation("withdrawal exceeds active stake");
    }

    account.activeStake -= amount;
    account.pendingWithdrawal += amount;
    account.withdrawalUnlockTime = clock_.Now() + params_.withdrawalDelay;

    LOG_INFO(util::LogCategory::STAKE) << "withdrawal of " << amount << " requested by "
        << validator.ToHex() << ", unlocks at "
        << util::FormatISO8601(account.withdrawalUnlockTime);
    return Status::Ok();
}

WithdrawalResult StakeRegistry::CompleteWithdrawal(const ValidatorId& validator) {
    WithdrawalResult result;
    auto it = accounts_.find(validator);
    if (it == accounts_.end()) {
        result.status = Status::NotFound("no stake account for " + validator.ToHex());
        return result;
    }
    StakeAccount& account = it->second;
    if (account.pendingWithdrawal <= 0) {
        result.status = Status::State("no pending withdrawal");
        return result;
    }
    Timestamp now = clock_.Now();
    if (now < account.withdrawalUnlockTime) {
        result.status = Status::Timing("withdrawal unlocks in " +
            util::FormatDuration(account.withdrawalUnlockTime - now));
        return result;
    }

    Status s = ledger_.Transfer(params_.stakeCustody, validator, account.pendingWithdrawal);
    if (!s.ok()) {
        result.status = s;
        return result;
    }

    result.released = account.pendingWithdrawal;
    account.pendingWithdrawal = 0;
    account.withdrawalUnlockTime = 0;

    LOG_INFO(util::LogCategory::STAKE) << "withdrawal of " << result.released
        << " completed by " << validator.ToHex();
    return result;
}

SlashResult StakeRegistry::Slash(const Address& caller, const ValidatorId& validator,
                                 Amount amount, const std::string& reason) {
    SlashResult result;
    if (!IsSlashingAuthority(caller)) {
        result.status = Status::Authorization("caller is not a slashing authority");
        return result;
    }
    if (amount <= 0) {
        result.status = Status::Validation("slash amount must be positive");
        return result;
    }
    auto it = accounts_.find(validator);
    if (it == accounts_.end()) {
        result.status = Status::NotFound("no stake account for " + validator.ToHex());
        return result;
    }
    StakeAccount& account = it->second;

    Amount slashed = std::min(amount, account.activeStake);
    if (slashed > 0) {
        Status s = ledger_.Transfer(params_.stakeCustody, params_.treasury, slashed);
        if (!s.ok()) {
            result.status = s;
            return result;
        }
    }

    account.activeStake -= slashed;
    account.totalSlashed += slashed;
    account.slashCount += 1;

    SlashEvent event;
    event.sequence = slashEvents_.size();
    event.validator = validator;
    event.authority = caller;
    event.requested = amount;
    event.slashed = slashed;
    event.reason = reason;
    event.time = clock_.Now();
    slashEvents_.push_back(event);

    result.slashed = slashed;
    LOG_WARN(util::LogCategory::STAKE) << "slashed " << slashed << " of " << amount
        << " from " << validator.ToHex() << ": " << reason;
    return result;
}

// ============================================================================
// Queries
// ============================================================================

bool StakeRegistry::IsQualified(const ValidatorId& validator) const {
    auto it = accounts_.find(validator);
    return it != accounts_.end() && it->second.activeStake >= params_.minStake;
}

std::optional<StakeAccount> StakeRegistry::GetAccount(const ValidatorId& validator) const {
    auto it = accounts_.find(validator);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Amount StakeRegistry::GetTotalStaked() const {
    Amount total = 0;
    for (const auto& [id, account] : accounts_) {
        total += account.activeStake;
    }
    return total;
}

Amount StakeRegistry::GetTotalPending() const {
    Amount total = 0;
    for (const auto& [id, account] : accounts_) {
        total += account.pendingWithdrawal;
    }
    return total;
}

size_t StakeRegistry::GetQualifiedCount() const {
    return static_cast<size_t>(std::count_if(accounts_.begin(), accounts_.end(),
        [this](const auto& entry) { return entry.second.activeStake >= params_.minStake; }));
}

std::vector<SlashEvent> StakeRegistry::GetSlashEvents(const ValidatorId& validator) const {
    std::vector<SlashEvent> events;
    for (const auto& event : slashEvents_) {
        if (event.validator == validator) {
            events.push_back(event);
        }
    }
    return events;
}

// ============================================================================
// Administration
// ============================================================================

void StakeRegistry::AddSlashingAuthority(const Address& authority) {
    if (authorities_.insert(authority).second) {
        LOG_INFO(util::LogCategory::STAKE) << "slashing authority added: " << authority.ToHex();
    }
}

void StakeRegistry::RemoveSlashingAuthority(const Address& authority) {
    if (authorities_.erase(authority) > 0) {
        LOG_INFO(util::LogCategory::STAKE) << "slashing authority removed: " << authority.ToHex();
    }
}

bool StakeRegistry::IsSlashingAuthority(const Address& authority) const {
    return authorities_.count(authority) > 0;
}

// ============================================================================
// Restore
// ============================================================================

void StakeRegistry::RestoreAccount(const StakeAccount& account) {
    accounts_[account.validator] = account;
}

void StakeRegistry::RestoreSlashEvent(const SlashEvent& event) {
    auto pos = std::lower_bound(slashEvents_.begin(), slashEvents_.end(), event,
        [](const SlashEvent& a, const SlashEvent& b) { return a.sequence < b.sequence; });
    slashEvents_.insert(pos, event);
}

} // namespace staking
} // namespace attestor

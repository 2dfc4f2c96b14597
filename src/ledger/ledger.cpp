// ATTESTOR - Value Ledger Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/ledger/ledger.h"
#include "attestor/util/logging.h"

namespace attestor {
namespace ledger {

Amount MemoryLedger::GetBalance(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Status MemoryLedger::Apply(const LedgerBatch& batch) {
    // Stage every touched balance, commit only if all operations succeed
    std::map<Address, Amount> staged;
    auto balance = [&](const Address& a) -> Amount& {
        auto it = staged.find(a);
        if (it == staged.end()) {
            it = staged.emplace(a, GetBalance(a)).first;
        }
        return it->second;
    };

    Amount minted = totalMinted_;
    for (const auto& op : batch.Ops()) {
        if (op.amount <= 0 || !MoneyRange(op.amount)) {
            return Status::Validation("ledger amount must be positive");
        }
        if (op.type == LedgerBatch::OpType::Transfer) {
            Amount& from = balance(op.from);
            if (from < op.amount) {
                return Status::Validation("insufficient balance in " + op.from.ToHex());
            }
            from -= op.amount;
        } else {
            if (minted > MAX_MONEY - op.amount) {
                return Status::Validation("mint exceeds supply limit");
            }
            minted += op.amount;
        }
        Amount& to = balance(op.to);
        if (to > MAX_MONEY - op.amount) {
            return Status::Validation("balance overflow in " + op.to.ToHex());
        }
        to += op.amount;
    }

    for (const auto& [account, amount] : staged) {
        balances_[account] = amount;
    }
    totalMinted_ = minted;
    LOG_TRACE(util::LogCategory::LEDGER) << "applied " << batch.Count() << " ledger ops";
    return Status::Ok();
}

Amount MemoryLedger::GetTotalSupply() const {
    Amount total = 0;
    for (const auto& [account, amount] : balances_) {
        total += amount;
    }
    return total;
}

} // namespace ledger
} // namespace attestor

// ATTESTOR - Value Ledger Interface
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// The token ledger the protocol moves value through. Stake and dispute bonds
// sit in custody accounts; finalization mints the payout split.

#ifndef ATTESTOR_LEDGER_LEDGER_H
#define ATTESTOR_LEDGER_LEDGER_H

#include "attestor/core/status.h"
#include "attestor/core/types.h"

#include <map>
#include <string>
#include <vector>

namespace attestor {
namespace ledger {

// ============================================================================
// LedgerBatch - transfers and mints applied all-or-nothing
// ============================================================================

class LedgerBatch {
public:
    enum class OpType { Transfer, Mint };

    struct Op {
        OpType type;
        Address from;     // null for Mint
        Address to;
        Amount amount;
    };

    void Transfer(const Address& from, const Address& to, Amount amount) {
        ops_.push_back({OpType::Transfer, from, to, amount});
    }

    void Mint(const Address& to, Amount amount) {
        ops_.push_back({OpType::Mint, Address(), to, amount});
    }

    const std::vector<Op>& Ops() const { return ops_; }
    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }
    void Clear() { ops_.clear(); }

private:
    std::vector<Op> ops_;
};

// ============================================================================
// ValueLedger
// ============================================================================

class ValueLedger {
public:
    virtual ~ValueLedger() = default;

    virtual Amount GetBalance(const Address& account) const = 0;

    /**
     * Apply every operation in order, or none of them.
     * Fails with ValidationError on a non-positive amount, an overdraft or
     * a balance leaving MoneyRange.
     */
    virtual Status Apply(const LedgerBatch& batch) = 0;

    Status Transfer(const Address& from, const Address& to, Amount amount) {
        LedgerBatch batch;
        batch.Transfer(from, to, amount);
        return Apply(batch);
    }

    Status Mint(const Address& to, Amount amount) {
        LedgerBatch batch;
        batch.Mint(to, amount);
        return Apply(batch);
    }
};

/// Balances held in a map
class MemoryLedger : public ValueLedger {
public:
    Amount GetBalance(const Address& account) const override;
    Status Apply(const LedgerBatch& batch) override;

    /// Sum of all balances
    Amount GetTotalSupply() const;

    /// Total created by Mint operations
    Amount GetTotalMinted() const { return totalMinted_; }

private:
    std::map<Address, Amount> balances_;
    Amount totalMinted_{0};
};

} // namespace ledger
} // namespace attestor

#endif // ATTESTOR_LEDGER_LEDGER_H

// ATTESTOR - Protocol State Store
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Maps the protocol tables onto a key-value Database. Each table has its own
// key prefix (see db::prefix). Writers stage rows into a WriteBatch which is
// committed atomically; readers iterate a whole table at startup.

#ifndef ATTESTOR_STORE_PROTOCOL_STORE_H
#define ATTESTOR_STORE_PROTOCOL_STORE_H

#include "attestor/db/database.h"
#include "attestor/dispute/dispute_resolver.h"
#include "attestor/oracle/contribution_oracle.h"
#include "attestor/staking/stake_registry.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace attestor {
namespace store {

/// Layout version written under the META prefix
constexpr uint32_t STORE_VERSION = 1;

/// Everything needed to rebuild the three components
struct ProtocolSnapshot {
    std::vector<staking::StakeAccount> accounts;
    std::vector<staking::SlashEvent> slashEvents;
    std::vector<Address> slashingAuthorities;
    std::vector<oracle::ContributionRecord> contributions;
    std::vector<Hash256> consumedProofs;
    std::vector<dispute::Dispute> disputes;

    bool Empty() const {
        return accounts.empty() && slashEvents.empty() && slashingAuthorities.empty() &&
               contributions.empty() && consumedProofs.empty() && disputes.empty();
    }
};

class ProtocolStore {
public:
    /// The database must outlive the store
    explicit ProtocolStore(db::Database& database);

    // ========================================================================
    // Staging
    // ========================================================================

    void StageAccount(db::WriteBatch& batch, const staking::StakeAccount& account) const;
    void StageSlashEvent(db::WriteBatch& batch, const staking::SlashEvent& event) const;

    /// Put the authority when present, delete it otherwise
    void StageSlashingAuthority(db::WriteBatch& batch, const Address& authority,
                                bool present) const;

    void StageContribution(db::WriteBatch& batch, const oracle::ContributionRecord& record) const;
    void StageConsumedProof(db::WriteBatch& batch, const Hash256& proofId) const;
    void StageDispute(db::WriteBatch& batch, const dispute::Dispute& dispute) const;

    /// Write batch atomically (synced); an empty batch is a no-op
    db::Status Commit(db::WriteBatch& batch);

    // ========================================================================
    // Loading
    // ========================================================================

    /**
     * Read every table. Fails with Corruption on an undecodable row or a
     * store written with a different layout version.
     */
    db::Status Load(ProtocolSnapshot& snapshot);

    /// Stored layout version, NotFound for a fresh database
    db::Status ReadVersion(uint32_t& version);

    uint64_t GetCommitCount() const { return commits_; }

private:
    db::Database& db_;
    uint64_t commits_{0};

    /// Visit every row under prefix; the callback receives the key without
    /// the prefix byte
    db::Status ForEach(char prefix,
                       const std::function<db::Status(const std::string&, const std::string&)>& fn);
};

} // namespace store
} // namespace attestor

#endif // ATTESTOR_STORE_PROTOCOL_STORE_H

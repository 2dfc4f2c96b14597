// ATTESTOR - Protocol State Store Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/store/protocol_store.h"
#include "attestor/util/logging.h"

#include <algorithm>

namespace attestor {
namespace store {

namespace {

const std::string VERSION_KEY = "version";

std::string MetaKey(const std::string& name) {
    return db::MakeKey(db::prefix::META) + name;
}

} // namespace

ProtocolStore::ProtocolStore(db::Database& database) : db_(database) {}

// ============================================================================
// Staging
// ============================================================================

void ProtocolStore::StageAccount(db::WriteBatch& batch,
                                 const staking::StakeAccount& account) const {
    batch.Put(db::MakeKey(db::prefix::STAKE_ACCOUNT, account.validator),
              db::SerializeToString(account));
}

void ProtocolStore::StageSlashEvent(db::WriteBatch& batch,
                                    const staking::SlashEvent& event) const {
    batch.Put(db::MakeKey(db::prefix::SLASH_EVENT, event.sequence),
              db::SerializeToString(event));
}

void ProtocolStore::StageSlashingAuthority(db::WriteBatch& batch, const Address& authority,
                                           bool present) const {
    std::string key = db::MakeKey(db::prefix::SLASH_AUTHORITY, authority);
    if (present) {
        batch.Put(key, "");
    } else {
        batch.Delete(key);
    }
}

void ProtocolStore::StageContribution(db::WriteBatch& batch,
                                      const oracle::ContributionRecord& record) const {
    batch.Put(db::MakeKey(db::prefix::CONTRIBUTION, record.key),
              db::SerializeToString(record));
}

void ProtocolStore::StageConsumedProof(db::WriteBatch& batch, const Hash256& proofId) const {
    batch.Put(db::MakeKey(db::prefix::CONSUMED_PROOF, proofId), "");
}

void ProtocolStore::StageDispute(db::WriteBatch& batch, const dispute::Dispute& dispute) const {
    batch.Put(db::MakeKey(db::prefix::DISPUTE, dispute.key),
              db::SerializeToString(dispute));
}

db::Status ProtocolStore::Commit(db::WriteBatch& batch) {
    if (batch.Empty()) {
        return db::Status::Ok();
    }

    if (commits_ == 0) {
        std::string stored;
        if (db_.Get(MetaKey(VERSION_KEY), &stored).IsNotFound()) {
            batch.Put(MetaKey(VERSION_KEY), db::SerializeToString(STORE_VERSION));
        }
    }

    db::WriteOptions opts;
    opts.sync = true;
    db::Status s = db_.Write(opts, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "protocol store commit failed: " << s.ToString();
        return s;
    }

    ++commits_;
    LOG_TRACE(util::LogCategory::DB) << "committed " << batch.Count() << " rows";
    return s;
}

// ============================================================================
// Loading
// ============================================================================

db::Status ProtocolStore::ReadVersion(uint32_t& version) {
    std::string value;
    db::Status s = db_.Get(MetaKey(VERSION_KEY), &value);
    if (!s.ok()) {
        return s;
    }
    return db::DeserializeFromString(value, version);
}

db::Status ProtocolStore::ForEach(
    char prefix,
    const std::function<db::Status(const std::string&, const std::string&)>& fn) {
    std::string start = db::MakeKey(prefix);
    std::unique_ptr<db::Iterator> it = db_.NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        std::string key = it->key().ToString().substr(1);
        db::Status s = fn(key, it->value().ToString());
        if (!s.ok()) {
            return s;
        }
    }
    return it->status();
}

db::Status ProtocolStore::Load(ProtocolSnapshot& snapshot) {
    snapshot = ProtocolSnapshot();

    uint32_t version = 0;
    db::Status s = ReadVersion(version);
    if (s.IsNotFound()) {
        return db::Status::Ok();
    }
    if (!s.ok()) {
        return s;
    }
    if (version != STORE_VERSION) {
        return db::Status::Corruption("unsupported store version " + std::to_string(version));
    }

    s = ForEach(db::prefix::STAKE_ACCOUNT, [&](const std::string&, const std::string& value) {
        staking::StakeAccount account;
        db::Status rs = db::DeserializeFromString(value, account);
        if (rs.ok()) snapshot.accounts.push_back(account);
        return rs;
    });
    if (!s.ok()) return s;

    s = ForEach(db::prefix::SLASH_EVENT, [&](const std::string&, const std::string& value) {
        staking::SlashEvent event;
        db::Status rs = db::DeserializeFromString(value, event);
        if (rs.ok()) snapshot.slashEvents.push_back(event);
        return rs;
    });
    if (!s.ok()) return s;
    // Sequence keys are little-endian, so iteration order is not log order
    std::sort(snapshot.slashEvents.begin(), snapshot.slashEvents.end(),
              [](const staking::SlashEvent& a, const staking::SlashEvent& b) {
                  return a.sequence < b.sequence;
              });

    s = ForEach(db::prefix::SLASH_AUTHORITY, [&](const std::string& key, const std::string&) {
        Address authority;
        db::Status rs = db::DeserializeFromString(key, authority);
        if (rs.ok()) snapshot.slashingAuthorities.push_back(authority);
        return rs;
    });
    if (!s.ok()) return s;

    s = ForEach(db::prefix::CONTRIBUTION, [&](const std::string&, const std::string& value) {
        oracle::ContributionRecord record;
        db::Status rs = db::DeserializeFromString(value, record);
        if (rs.ok()) snapshot.contributions.push_back(record);
        return rs;
    });
    if (!s.ok()) return s;

    s = ForEach(db::prefix::CONSUMED_PROOF, [&](const std::string& key, const std::string&) {
        Hash256 proofId;
        db::Status rs = db::DeserializeFromString(key, proofId);
        if (rs.ok()) snapshot.consumedProofs.push_back(proofId);
        return rs;
    });
    if (!s.ok()) return s;

    s = ForEach(db::prefix::DISPUTE, [&](const std::string&, const std::string& value) {
        dispute::Dispute d;
        db::Status rs = db::DeserializeFromString(value, d);
        if (rs.ok()) snapshot.disputes.push_back(d);
        return rs;
    });
    if (!s.ok()) return s;

    LOG_INFO(util::LogCategory::DB) << "loaded " << snapshot.accounts.size() << " accounts, "
        << snapshot.contributions.size() << " contributions, "
        << snapshot.disputes.size() << " disputes";
    return db::Status::Ok();
}

} // namespace store
} // namespace attestor

// ATTESTOR - Protocol Store Tests
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include <gtest/gtest.h>
#include "attestor/crypto/sha256.h"
#include "attestor/db/memory.h"
#include "attestor/store/protocol_store.h"

#include <array>
#include <string>

using namespace attestor;
using namespace attestor::store;

namespace {

Hash160 CreateTestAddress(uint8_t id) {
    std::array<Byte, 20> data{};
    data[0] = id;
    data[2] = 0x5e;
    return Hash160(data);
}

} // namespace

class ProtocolStoreTest : public ::testing::Test {
protected:
    db::MemoryDatabase db_;
    ProtocolStore store_{db_};
};

TEST_F(ProtocolStoreTest, FreshDatabaseLoadsEmpty) {
    ProtocolSnapshot snapshot;
    ASSERT_TRUE(store_.Load(snapshot).ok());
    EXPECT_TRUE(snapshot.Empty());

    uint32_t version = 0;
    EXPECT_TRUE(store_.ReadVersion(version).IsNotFound());
}

TEST_F(ProtocolStoreTest, EmptyBatchWritesNothing) {
    db::WriteBatch batch;
    ASSERT_TRUE(store_.Commit(batch).ok());
    EXPECT_EQ(db_.Size(), 0u);
    EXPECT_EQ(db_.BatchCount(), 0u);
    EXPECT_EQ(store_.GetCommitCount(), 0u);
}

TEST_F(ProtocolStoreTest, FirstCommitWritesVersion) {
    staking::StakeAccount account;
    account.validator = CreateTestAddress(1);
    account.activeStake = 1000;

    db::WriteBatch batch;
    store_.StageAccount(batch, account);
    ASSERT_TRUE(store_.Commit(batch).ok());
    EXPECT_EQ(store_.GetCommitCount(), 1u);
    EXPECT_EQ(db_.BatchCount(), 1u);

    uint32_t version = 0;
    ASSERT_TRUE(store_.ReadVersion(version).ok());
    EXPECT_EQ(version, STORE_VERSION);
}

TEST_F(ProtocolStoreTest, RoundTripAllTables) {
    db::WriteBatch batch;

    staking::StakeAccount account;
    account.validator = CreateTestAddress(1);
    account.activeStake = 900;
    account.totalSlashed = 100;
    account.slashCount = 1;
    store_.StageAccount(batch, account);

    // Sequences chosen so little-endian key order differs from log order
    for (uint64_t seq : {256u, 1u, 0u}) {
        staking::SlashEvent event;
        event.sequence = seq;
        event.validator = account.validator;
        event.slashed = static_cast<Amount>(seq);
        store_.StageSlashEvent(batch, event);
    }

    store_.StageSlashingAuthority(batch, CreateTestAddress(9), true);

    oracle::ContributionRecord record;
    record.key = SHA256Hash(std::string("record"));
    record.amount = 1000;
    record.confirmingValidators = {CreateTestAddress(1), CreateTestAddress(2)};
    record.disputed = true;
    record.flagReason = "check";
    store_.StageContribution(batch, record);

    Hash256 proofId = SHA256Hash(std::string("proof"));
    store_.StageConsumedProof(batch, proofId);

    dispute::Dispute d;
    d.key = record.key;
    d.challenger = CreateTestAddress(3);
    d.bond = 100;
    d.commits[CreateTestAddress(1)] = SHA256Hash(std::string("c1"));
    d.reveals[CreateTestAddress(1)] = false;
    store_.StageDispute(batch, d);

    ASSERT_TRUE(store_.Commit(batch).ok());

    ProtocolSnapshot snapshot;
    ASSERT_TRUE(store_.Load(snapshot).ok());

    ASSERT_EQ(snapshot.accounts.size(), 1u);
    EXPECT_EQ(snapshot.accounts[0].activeStake, 900);
    EXPECT_EQ(snapshot.accounts[0].slashCount, 1u);

    ASSERT_EQ(snapshot.slashEvents.size(), 3u);
    EXPECT_EQ(snapshot.slashEvents[0].sequence, 0u);
    EXPECT_EQ(snapshot.slashEvents[1].sequence, 1u);
    EXPECT_EQ(snapshot.slashEvents[2].sequence, 256u);

    ASSERT_EQ(snapshot.slashingAuthorities.size(), 1u);
    EXPECT_EQ(snapshot.slashingAuthorities[0], CreateTestAddress(9));

    ASSERT_EQ(snapshot.contributions.size(), 1u);
    EXPECT_EQ(snapshot.contributions[0].key, record.key);
    EXPECT_EQ(snapshot.contributions[0].confirmingValidators.size(), 2u);
    EXPECT_TRUE(snapshot.contributions[0].disputed);

    ASSERT_EQ(snapshot.consumedProofs.size(), 1u);
    EXPECT_EQ(snapshot.consumedProofs[0], proofId);

    ASSERT_EQ(snapshot.disputes.size(), 1u);
    EXPECT_EQ(snapshot.disputes[0].bond, 100);
    EXPECT_EQ(snapshot.disputes[0].commits.size(), 1u);
    EXPECT_FALSE(snapshot.disputes[0].reveals.begin()->second);
}

TEST_F(ProtocolStoreTest, RemovedAuthorityIsDeleted) {
    db::WriteBatch batch;
    store_.StageSlashingAuthority(batch, CreateTestAddress(9), true);
    ASSERT_TRUE(store_.Commit(batch).ok());

    db::WriteBatch removal;
    store_.StageSlashingAuthority(removal, CreateTestAddress(9), false);
    ASSERT_TRUE(store_.Commit(removal).ok());

    ProtocolSnapshot snapshot;
    ASSERT_TRUE(store_.Load(snapshot).ok());
    EXPECT_TRUE(snapshot.slashingAuthorities.empty());
}

TEST_F(ProtocolStoreTest, LaterRowReplacesEarlier) {
    staking::StakeAccount account;
    account.validator = CreateTestAddress(1);
    account.activeStake = 1000;
    db::WriteBatch first;
    store_.StageAccount(first, account);
    ASSERT_TRUE(store_.Commit(first).ok());

    account.activeStake = 400;
    db::WriteBatch second;
    store_.StageAccount(second, account);
    ASSERT_TRUE(store_.Commit(second).ok());

    ProtocolSnapshot snapshot;
    ASSERT_TRUE(store_.Load(snapshot).ok());
    ASSERT_EQ(snapshot.accounts.size(), 1u);
    EXPECT_EQ(snapshot.accounts[0].activeStake, 400);
}

TEST_F(ProtocolStoreTest, UnknownVersionIsCorruption) {
    db_.Put(db::Slice(db::MakeKey(db::prefix::META) + "version"),
            db::Slice(db::SerializeToString(static_cast<uint32_t>(99))));

    ProtocolSnapshot snapshot;
    EXPECT_TRUE(store_.Load(snapshot).IsCorruption());
}

TEST_F(ProtocolStoreTest, UndecodableRowIsCorruption) {
    staking::StakeAccount account;
    account.validator = CreateTestAddress(1);
    db::WriteBatch batch;
    store_.StageAccount(batch, account);
    ASSERT_TRUE(store_.Commit(batch).ok());

    db_.Put(db::Slice(db::MakeKey(db::prefix::STAKE_ACCOUNT, CreateTestAddress(2))),
            db::Slice("short"));

    ProtocolSnapshot snapshot;
    EXPECT_TRUE(store_.Load(snapshot).IsCorruption());
}

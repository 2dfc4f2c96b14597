// ATTESTOR - Stake Registry Tests
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include <gtest/gtest.h>
#include "attestor/staking/stake_registry.h"
#include "attestor/ledger/ledger.h"
#include "attestor/util/time.h"

#include <array>

using namespace attestor;
using namespace attestor::staking;

// ============================================================================
// Test Fixture
// ============================================================================

class StakeRegistryTest : public ::testing::Test {
protected:
    static constexpr int64_t START_TIME = 1700000000;

    void SetUp() override {
        params_ = consensus::ProtocolParams::RegTest();
        registry_ = std::make_unique<StakeRegistry>(params_, ledger_, clock_);

        alice_ = CreateTestAddress(1);
        bob_ = CreateTestAddress(2);
        authority_ = CreateTestAddress(9);

        ASSERT_TRUE(ledger_.Mint(alice_, 10000).ok());
        ASSERT_TRUE(ledger_.Mint(bob_, 10000).ok());
    }

    Hash160 CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return Hash160(data);
    }

    consensus::ProtocolParams params_;
    ledger::MemoryLedger ledger_;
    util::ManualClock clock_{START_TIME};
    std::unique_ptr<StakeRegistry> registry_;

    ValidatorId alice_;
    ValidatorId bob_;
    Address authority_;
};

// ============================================================================
// Deposit Tests
// ============================================================================

TEST_F(StakeRegistryTest, DepositQualifiesAtMinimum) {
    ASSERT_TRUE(registry_->Deposit(alice_, 999).ok());
    EXPECT_FALSE(registry_->IsQualified(alice_));

    ASSERT_TRUE(registry_->Deposit(alice_, 1).ok());
    EXPECT_TRUE(registry_->IsQualified(alice_));

    auto account = registry_->GetAccount(alice_);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->activeStake, 1000);
    EXPECT_EQ(ledger_.GetBalance(alice_), 9000);
    EXPECT_EQ(ledger_.GetBalance(params_.stakeCustody), 1000);
}

TEST_F(StakeRegistryTest, DepositRejectsNonPositive) {
    EXPECT_TRUE(registry_->Deposit(alice_, 0).IsValidation());
    EXPECT_TRUE(registry_->Deposit(alice_, -5).IsValidation());
    EXPECT_FALSE(registry_->GetAccount(alice_).has_value());
}

TEST_F(StakeRegistryTest, DepositFailsWithoutFunds) {
    Status s = registry_->Deposit(alice_, 20000);
    EXPECT_TRUE(s.IsValidation());
    EXPECT_FALSE(registry_->GetAccount(alice_).has_value());
    EXPECT_EQ(ledger_.GetBalance(alice_), 10000);
}

TEST_F(StakeRegistryTest, TotalsAndQualifiedCount) {
    registry_->Deposit(alice_, 1500);
    registry_->Deposit(bob_, 500);

    EXPECT_EQ(registry_->GetTotalStaked(), 2000);
    EXPECT_EQ(registry_->GetQualifiedCount(), 1u);
    EXPECT_EQ(registry_->GetAccountCount(), 2u);
}

// ============================================================================
// Withdrawal Tests
// ============================================================================

TEST_F(StakeRegistryTest, WithdrawalWaitsOutDelay) {
    ASSERT_TRUE(registry_->Deposit(alice_, 1500).ok());
    ASSERT_TRUE(registry_->RequestWithdrawal(alice_, 600).ok());

    // Pending stake no longer counts
    EXPECT_FALSE(registry_->IsQualified(alice_));
    EXPECT_EQ(registry_->GetTotalPending(), 600);

    auto account = registry_->GetAccount(alice_);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->activeStake, 900);
    EXPECT_EQ(account->pendingWithdrawal, 600);
    EXPECT_EQ(account->withdrawalUnlockTime, START_TIME + 7 * ONE_DAY);

    clock_.Advance(7 * ONE_DAY - 1);
    auto early = registry_->CompleteWithdrawal(alice_);
    EXPECT_TRUE(early.status.IsTiming());
    EXPECT_EQ(early.status.message(), "withdrawal unlocks in 1s");

    clock_.Advance(1);
    auto done = registry_->CompleteWithdrawal(alice_);
    ASSERT_TRUE(done.status.ok()) << done.status.ToString();
    EXPECT_EQ(done.released, 600);
    EXPECT_EQ(ledger_.GetBalance(alice_), 10000 - 900);
    EXPECT_EQ(registry_->GetAccount(alice_)->pendingWithdrawal, 0);
}

TEST_F(StakeRegistryTest, WithdrawalErrors) {
    EXPECT_TRUE(registry_->RequestWithdrawal(alice_, 1).IsNotFound());
    EXPECT_TRUE(registry_->CompleteWithdrawal(alice_).status.IsNotFound());

    registry_->Deposit(alice_, 1000);
    EXPECT_TRUE(registry_->RequestWithdrawal(alice_, 0).IsValidation());
    EXPECT_TRUE(registry_->RequestWithdrawal(alice_, 1001).IsValidation());
    EXPECT_TRUE(registry_->CompleteWithdrawal(alice_).status.IsState());
}

TEST_F(StakeRegistryTest, RepeatedRequestRestartsDelay) {
    registry_->Deposit(alice_, 1000);
    ASSERT_TRUE(registry_->RequestWithdrawal(alice_, 100).ok());

    clock_.Advance(6 * ONE_DAY);
    ASSERT_TRUE(registry_->RequestWithdrawal(alice_, 100).ok());

    auto account = registry_->GetAccount(alice_);
    EXPECT_EQ(account->pendingWithdrawal, 200);
    EXPECT_EQ(account->withdrawalUnlockTime, START_TIME + 13 * ONE_DAY);

    clock_.Advance(2 * ONE_DAY);
    EXPECT_TRUE(registry_->CompleteWithdrawal(alice_).status.IsTiming());
}

// ============================================================================
// Slashing Tests
// ============================================================================

TEST_F(StakeRegistryTest, SlashRequiresAuthority) {
    registry_->Deposit(alice_, 1000);
    auto result = registry_->Slash(authority_, alice_, 100, "double sign");
    EXPECT_TRUE(result.status.IsAuthorization());

    registry_->AddSlashingAuthority(authority_);
    EXPECT_TRUE(registry_->IsSlashingAuthority(authority_));
    result = registry_->Slash(authority_, alice_, 100, "double sign");
    EXPECT_TRUE(result.status.ok());

    registry_->RemoveSlashingAuthority(authority_);
    EXPECT_TRUE(registry_->Slash(authority_, alice_, 100, "again").status.IsAuthorization());
}

TEST_F(StakeRegistryTest, SlashMovesStakeToTreasury) {
    registry_->Deposit(alice_, 1200);
    registry_->AddSlashingAuthority(authority_);

    auto result = registry_->Slash(authority_, alice_, 300, "false attestation");
    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(result.slashed, 300);

    auto account = registry_->GetAccount(alice_);
    EXPECT_EQ(account->activeStake, 900);
    EXPECT_EQ(account->totalSlashed, 300);
    EXPECT_EQ(account->slashCount, 1u);
    EXPECT_FALSE(registry_->IsQualified(alice_));
    EXPECT_EQ(ledger_.GetBalance(params_.treasury), 300);
    EXPECT_EQ(ledger_.GetBalance(params_.stakeCustody), 900);

    const auto& events = registry_->GetSlashEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].sequence, 0u);
    EXPECT_EQ(events[0].authority, authority_);
    EXPECT_EQ(events[0].requested, 300);
    EXPECT_EQ(events[0].slashed, 300);
    EXPECT_EQ(events[0].reason, "false attestation");
    EXPECT_EQ(events[0].time, START_TIME);
}

TEST_F(StakeRegistryTest, SlashIsCappedAtActiveStake) {
    registry_->Deposit(alice_, 1000);
    registry_->RequestWithdrawal(alice_, 400);
    registry_->AddSlashingAuthority(authority_);

    auto result = registry_->Slash(authority_, alice_, 5000, "cap");
    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(result.slashed, 600);

    auto account = registry_->GetAccount(alice_);
    EXPECT_EQ(account->activeStake, 0);
    // Pending withdrawal is out of reach
    EXPECT_EQ(account->pendingWithdrawal, 400);

    // Nothing left to take, but the event is still recorded
    auto empty = registry_->Slash(authority_, alice_, 10, "empty");
    ASSERT_TRUE(empty.status.ok());
    EXPECT_EQ(empty.slashed, 0);
    EXPECT_EQ(registry_->GetAccount(alice_)->slashCount, 2u);
    EXPECT_EQ(registry_->GetSlashEvents().size(), 2u);
}

TEST_F(StakeRegistryTest, SlashErrors) {
    registry_->AddSlashingAuthority(authority_);
    EXPECT_TRUE(registry_->Slash(authority_, alice_, 10, "").status.IsNotFound());

    registry_->Deposit(alice_, 1000);
    EXPECT_TRUE(registry_->Slash(authority_, alice_, 0, "").status.IsValidation());
    EXPECT_TRUE(registry_->GetSlashEvents().empty());
}

TEST_F(StakeRegistryTest, SlashEventsPerValidator) {
    registry_->Deposit(alice_, 1000);
    registry_->Deposit(bob_, 1000);
    registry_->AddSlashingAuthority(authority_);

    registry_->Slash(authority_, alice_, 10, "a");
    registry_->Slash(authority_, bob_, 20, "b");
    registry_->Slash(authority_, alice_, 30, "c");

    auto events = registry_->GetSlashEvents(alice_);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].sequence, 0u);
    EXPECT_EQ(events[1].sequence, 2u);
}

// ============================================================================
// Restore Tests
// ============================================================================

TEST_F(StakeRegistryTest, RestoreRebuildsState) {
    StakeAccount account;
    account.validator = alice_;
    account.activeStake = 2000;

    SlashEvent second;
    second.sequence = 1;
    second.validator = alice_;
    SlashEvent first;
    first.sequence = 0;
    first.validator = alice_;

    registry_->RestoreAccount(account);
    registry_->RestoreSlashEvent(second);
    registry_->RestoreSlashEvent(first);

    EXPECT_TRUE(registry_->IsQualified(alice_));
    ASSERT_EQ(registry_->GetSlashEvents().size(), 2u);
    EXPECT_EQ(registry_->GetSlashEvents()[0].sequence, 0u);
    EXPECT_EQ(registry_->GetSlashEvents()[1].sequence, 1u);
}

TEST_F(StakeRegistryTest, AccountSerializationRoundTrip) {
    registry_->Deposit(alice_, 1234);
    registry_->RequestWithdrawal(alice_, 34);
    StakeAccount in = *registry_->GetAccount(alice_);

    DataStream ss;
    ss << in;
    StakeAccount out;
    ss >> out;

    EXPECT_EQ(out.validator, in.validator);
    EXPECT_EQ(out.activeStake, 1200);
    EXPECT_EQ(out.pendingWithdrawal, 34);
    EXPECT_EQ(out.withdrawalUnlockTime, in.withdrawalUnlockTime);
}

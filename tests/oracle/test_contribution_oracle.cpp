// ATTESTOR - Contribution Oracle Tests
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include <gtest/gtest.h>
#include "attestor/crypto/sha256.h"
#include "attestor/identity/registry.h"
#include "attestor/ledger/ledger.h"
#include "attestor/oracle/contribution_oracle.h"
#include "attestor/staking/stake_registry.h"
#include "attestor/util/time.h"

#include <array>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace attestor;
using namespace attestor::oracle;

namespace {

/// Dispute view driven directly by the test
class FakeDisputeView : public DisputeView {
public:
    bool HasUnresolvedDispute(const ContributionKey& key) const override {
        return open.count(key) > 0;
    }
    std::set<ContributionKey> open;
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ContributionOracleTest : public ::testing::Test {
protected:
    static constexpr int64_t START_TIME = 1700000000;

    void SetUp() override {
        params_ = consensus::ProtocolParams::RegTest();
        stakes_ = std::make_unique<staking::StakeRegistry>(params_, ledger_, clock_);
        oracle_ = std::make_unique<ContributionOracle>(params_, *stakes_, identity_,
                                                       ledger_, clock_);

        for (uint8_t i = 1; i <= 3; ++i) {
            ValidatorId v = CreateTestAddress(i);
            ASSERT_TRUE(ledger_.Mint(v, params_.minStake).ok());
            ASSERT_TRUE(stakes_->Deposit(v, params_.minStake).ok());
            validators_.push_back(v);
        }
        outsider_ = CreateTestAddress(50);

        std::array<Byte, 32> raw{};
        for (size_t i = 0; i < raw.size(); ++i) {
            raw[i] = static_cast<Byte>(0x20 + i);
        }
        workerKey_ = PrivateKey(raw);
        worker_ = workerKey_.GetPublicKey().GetHash160();
        identity_.AddWorker(worker_);

        building_ = SHA256Hash(std::string("building-1"));
        wallet_ = CreateTestAddress(77);
        identity_.RegisterBuilding(building_, wallet_);
    }

    Hash160 CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = 0xaa;
        return Hash160(data);
    }

    ContributionProof MakeProof(Amount amount, uint64_t nonce) const {
        ContributionProof proof;
        proof.buildingId = building_;
        proof.workerId = worker_;
        proof.amount = amount;
        proof.evidenceRoot = SHA256Hash(std::string("evidence-") + std::to_string(nonce));
        proof.capturedAt = START_TIME - 60;
        proof.nonce = nonce;
        return proof;
    }

    WorkerSignature Sign(const ContributionProof& proof) const {
        return SignContributionProof(workerKey_, oracle_->GetDomainSeparator(), proof);
    }

    /// Attest amount with a fresh proof
    Status AttestFresh(const ValidatorId& caller, Amount amount) {
        ContributionProof proof = MakeProof(amount, nextNonce_++);
        return oracle_->Attest(caller, building_, worker_, amount, proof, Sign(proof));
    }

    ContributionKey Key(Amount amount) const {
        return ContributionOracle::ComputeContributionKey(building_, worker_, amount);
    }

    consensus::ProtocolParams params_;
    ledger::MemoryLedger ledger_;
    identity::MemoryIdentityRegistry identity_;
    util::ManualClock clock_{START_TIME};
    std::unique_ptr<staking::StakeRegistry> stakes_;
    std::unique_ptr<ContributionOracle> oracle_;

    std::vector<ValidatorId> validators_;
    ValidatorId outsider_;
    PrivateKey workerKey_;
    WorkerId worker_;
    BuildingId building_;
    Address wallet_;
    uint64_t nextNonce_{1};
};

// ============================================================================
// Attest Tests
// ============================================================================

TEST_F(ContributionOracleTest, FirstAttestationCreatesRecord) {
    ContributionProof proof = MakeProof(1000, 1);
    WorkerSignature sig = Sign(proof);
    ASSERT_TRUE(oracle_->Attest(validators_[0], building_, worker_, 1000, proof, sig).ok());

    auto record = oracle_->GetContribution(Key(1000));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->key, Key(1000));
    EXPECT_EQ(record->workerId, worker_);
    EXPECT_EQ(record->buildingWallet, wallet_);
    EXPECT_EQ(record->amount, 1000);
    EXPECT_EQ(record->proposedAt, START_TIME);
    EXPECT_EQ(record->ConfirmationCount(), 1u);
    EXPECT_TRUE(record->HasConfirmed(validators_[0]));
    EXPECT_FALSE(record->finalized);

    EXPECT_TRUE(oracle_->IsProofConsumed(ComputeProofId(proof, sig)));
    EXPECT_EQ(oracle_->GetContributionCount(), 1u);
}

TEST_F(ContributionOracleTest, OtherValidatorsConfirm) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    clock_.Advance(ONE_HOUR);
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());

    auto record = oracle_->GetContribution(Key(1000));
    EXPECT_EQ(record->ConfirmationCount(), 2u);
    // Proposal time is not moved by later confirmations
    EXPECT_EQ(record->proposedAt, START_TIME);
    EXPECT_EQ(oracle_->GetConsumedProofCount(), 2u);
}

TEST_F(ContributionOracleTest, SameValidatorTwiceIsDuplicate) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());

    ContributionProof proof = MakeProof(1000, 99);
    WorkerSignature sig = Sign(proof);
    Status s = oracle_->Attest(validators_[0], building_, worker_, 1000, proof, sig);
    EXPECT_TRUE(s.IsDuplicate()) << s.ToString();
    // A rejected attestation does not burn the proof
    EXPECT_FALSE(oracle_->IsProofConsumed(ComputeProofId(proof, sig)));
}

TEST_F(ContributionOracleTest, ReusedProofIsReplay) {
    ContributionProof proof = MakeProof(1000, 1);
    WorkerSignature sig = Sign(proof);
    ASSERT_TRUE(oracle_->Attest(validators_[0], building_, worker_, 1000, proof, sig).ok());

    Status s = oracle_->Attest(validators_[1], building_, worker_, 1000, proof, sig);
    EXPECT_TRUE(s.IsReplay()) << s.ToString();
    EXPECT_EQ(oracle_->GetContribution(Key(1000))->ConfirmationCount(), 1u);
}

TEST_F(ContributionOracleTest, ReusedProofIsReplayForOtherAmount) {
    ContributionProof proof = MakeProof(1000, 1);
    WorkerSignature sig = Sign(proof);
    ASSERT_TRUE(oracle_->Attest(validators_[0], building_, worker_, 1000, proof, sig).ok());

    // Consumed proofs are rejected before the proof is matched to the triple
    Status s = oracle_->Attest(validators_[1], building_, worker_, 2000, proof, sig);
    EXPECT_TRUE(s.IsReplay()) << s.ToString();
    EXPECT_FALSE(oracle_->GetContribution(Key(2000)).has_value());
    EXPECT_EQ(oracle_->GetContributionCount(), 1u);
}

TEST_F(ContributionOracleTest, UnqualifiedCallerRejected) {
    Status s = AttestFresh(outsider_, 1000);
    EXPECT_TRUE(s.IsAuthorization());

    // Stake below the minimum is not enough either
    ASSERT_TRUE(stakes_->RequestWithdrawal(validators_[2], 1).ok());
    EXPECT_TRUE(AttestFresh(validators_[2], 1000).IsAuthorization());
    EXPECT_EQ(oracle_->GetContributionCount(), 0u);
}

TEST_F(ContributionOracleTest, AmountMustBePositive) {
    EXPECT_TRUE(AttestFresh(validators_[0], 0).IsValidation());
    EXPECT_TRUE(AttestFresh(validators_[0], -10).IsValidation());
    EXPECT_TRUE(AttestFresh(validators_[0], MAX_MONEY + 1).IsValidation());
}

TEST_F(ContributionOracleTest, UnknownBuildingIsNotFound) {
    BuildingId unknown = SHA256Hash(std::string("nowhere"));
    ContributionProof proof = MakeProof(1000, 1);
    proof.buildingId = unknown;
    Status s = oracle_->Attest(validators_[0], unknown, worker_, 1000, proof, Sign(proof));
    EXPECT_TRUE(s.IsNotFound());
}

TEST_F(ContributionOracleTest, InactiveWorkerRejected) {
    identity_.DeactivateWorker(worker_);
    EXPECT_TRUE(AttestFresh(validators_[0], 1000).IsValidation());
}

TEST_F(ContributionOracleTest, ProofMustMatchClaim) {
    ContributionProof proof = MakeProof(1000, 1);
    WorkerSignature sig = Sign(proof);
    Status s = oracle_->Attest(validators_[0], building_, worker_, 2000, proof, sig);
    EXPECT_TRUE(s.IsValidation());
    EXPECT_FALSE(oracle_->GetContribution(Key(2000)).has_value());
}

TEST_F(ContributionOracleTest, ForeignSignatureRejected) {
    ContributionProof proof = MakeProof(1000, 1);

    std::array<Byte, 32> raw{};
    raw[31] = 7;
    WorkerSignature forged = SignContributionProof(PrivateKey(raw),
                                                   oracle_->GetDomainSeparator(), proof);
    EXPECT_TRUE(oracle_->Attest(validators_[0], building_, worker_, 1000, proof, forged)
                    .IsValidation());

    // Signed by the worker, but for another deployment
    Hash256 otherDomain = ComputeDomainSeparator(params_.chainId + 1, params_.oracleId);
    WorkerSignature wrongDomain = SignContributionProof(workerKey_, otherDomain, proof);
    EXPECT_TRUE(oracle_->Attest(validators_[0], building_, worker_, 1000, proof, wrongDomain)
                    .IsValidation());

    EXPECT_EQ(oracle_->GetContributionCount(), 0u);
}

TEST_F(ContributionOracleTest, WalletIsSnapshotAtProposal) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    identity_.RegisterBuilding(building_, CreateTestAddress(78));

    clock_.Advance(ONE_DAY);
    ASSERT_TRUE(oracle_->Finalize(Key(1000)).status.ok());
    EXPECT_EQ(ledger_.GetBalance(wallet_), 100);
    EXPECT_EQ(ledger_.GetBalance(CreateTestAddress(78)), 0);
}

// ============================================================================
// Finalize Tests
// ============================================================================

TEST_F(ContributionOracleTest, FinalizePaysSplit) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    Amount mintedBefore = ledger_.GetTotalMinted();

    clock_.Advance(ONE_DAY);
    FinalizeResult result = oracle_->Finalize(Key(1000));
    ASSERT_TRUE(result.status.ok()) << result.status.ToString();
    EXPECT_EQ(result.payout.worker, 700);

    EXPECT_EQ(ledger_.GetBalance(worker_), 700);
    EXPECT_EQ(ledger_.GetBalance(wallet_), 100);
    EXPECT_EQ(ledger_.GetBalance(params_.maintainerPool), 100);
    EXPECT_EQ(ledger_.GetBalance(params_.treasury), 100);
    EXPECT_EQ(ledger_.GetTotalMinted() - mintedBefore, 1000);

    auto record = oracle_->GetContribution(Key(1000));
    EXPECT_TRUE(record->finalized);
    EXPECT_FALSE(record->cancelled);
    EXPECT_EQ(record->finalizedAt, START_TIME + ONE_DAY);
}

TEST_F(ContributionOracleTest, FinalizeWaitsForDelay) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());

    clock_.Advance(ONE_DAY - 1);
    FinalizeResult result = oracle_->Finalize(Key(1000));
    EXPECT_TRUE(result.status.IsTiming());
    EXPECT_EQ(result.status.message(), "finalizable in 1s");
    EXPECT_EQ(ledger_.GetBalance(worker_), 0);
}

TEST_F(ContributionOracleTest, FinalizeNeedsQuorum) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    clock_.Advance(2 * ONE_DAY);

    FinalizeResult result = oracle_->Finalize(Key(1000));
    EXPECT_TRUE(result.status.IsConsensus());

    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.ok());
}

TEST_F(ContributionOracleTest, FinalizeErrors) {
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.IsNotFound());

    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    clock_.Advance(ONE_DAY);
    ASSERT_TRUE(oracle_->Finalize(Key(1000)).status.ok());

    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.IsState());
    EXPECT_TRUE(AttestFresh(validators_[2], 1000).IsState());
    EXPECT_EQ(ledger_.GetBalance(worker_), 700);
}

// ============================================================================
// Flag and Dispute Tests
// ============================================================================

TEST_F(ContributionOracleTest, FlagBlocksFinalize) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());

    ASSERT_TRUE(oracle_->RaiseFlag(validators_[2], Key(1000), "duplicate capture").ok());
    auto record = oracle_->GetContribution(Key(1000));
    EXPECT_TRUE(record->disputed);
    EXPECT_EQ(record->flaggedBy, validators_[2]);
    EXPECT_EQ(record->flagReason, "duplicate capture");

    clock_.Advance(ONE_DAY);
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.IsDisputed());
}

TEST_F(ContributionOracleTest, RaiseFlagErrors) {
    EXPECT_TRUE(oracle_->RaiseFlag(validators_[0], Key(1000), "x").IsNotFound());

    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    EXPECT_TRUE(oracle_->RaiseFlag(outsider_, Key(1000), "x").IsAuthorization());
    ASSERT_TRUE(oracle_->RaiseFlag(validators_[1], Key(1000), "x").ok());
    EXPECT_TRUE(oracle_->RaiseFlag(validators_[2], Key(1000), "y").IsState());
}

TEST_F(ContributionOracleTest, RaiseFlagOnFinalizedRecord) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    clock_.Advance(ONE_DAY);
    ASSERT_TRUE(oracle_->Finalize(Key(1000)).status.ok());

    EXPECT_TRUE(oracle_->RaiseFlag(validators_[2], Key(1000), "late").IsState());
}

TEST_F(ContributionOracleTest, UnresolvedDisputeBlocksFinalize) {
    FakeDisputeView view;
    oracle_->SetDisputeView(&view);

    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    clock_.Advance(ONE_DAY);

    view.open.insert(Key(1000));
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.IsDisputed());

    view.open.clear();
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.ok());
}

// ============================================================================
// Settlement Tests
// ============================================================================

TEST_F(ContributionOracleTest, SettleUpheldFinalizesWhenReady) {
    FakeDisputeView view;
    oracle_->SetDisputeView(&view);
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    ASSERT_TRUE(oracle_->RaiseFlag(validators_[2], Key(1000), "suspicious").ok());
    view.open.insert(Key(1000));

    clock_.Advance(2 * ONE_DAY);
    ASSERT_TRUE(oracle_->SettleUpheld(Key(1000)).ok());

    auto record = oracle_->GetContribution(Key(1000));
    EXPECT_TRUE(record->finalized);
    EXPECT_FALSE(record->disputed);
    EXPECT_EQ(ledger_.GetBalance(worker_), 700);
}

TEST_F(ContributionOracleTest, SettleUpheldDefersWithoutQuorum) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(oracle_->RaiseFlag(validators_[1], Key(1000), "suspicious").ok());
    clock_.Advance(2 * ONE_DAY);

    Status s = oracle_->SettleUpheld(Key(1000));
    EXPECT_TRUE(s.IsConsensus());

    auto record = oracle_->GetContribution(Key(1000));
    EXPECT_FALSE(record->finalized);
    EXPECT_FALSE(record->disputed);

    // Once quorum arrives the record finalizes normally
    ASSERT_TRUE(AttestFresh(validators_[2], 1000).ok());
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.ok());
}

TEST_F(ContributionOracleTest, SettleOverturnedCancels) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    Amount mintedBefore = ledger_.GetTotalMinted();

    clock_.Advance(ONE_HOUR);
    ASSERT_TRUE(oracle_->SettleOverturned(Key(1000)).ok());

    auto record = oracle_->GetContribution(Key(1000));
    EXPECT_TRUE(record->finalized);
    EXPECT_TRUE(record->cancelled);
    EXPECT_EQ(record->finalizedAt, START_TIME + ONE_HOUR);
    EXPECT_EQ(ledger_.GetTotalMinted(), mintedBefore);

    clock_.Advance(ONE_DAY);
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.IsState());
    EXPECT_TRUE(oracle_->SettleOverturned(Key(1000)).IsState());
    EXPECT_TRUE(oracle_->SettleUpheld(Key(1000)).IsState());
}

TEST_F(ContributionOracleTest, SettleUnknownRecord) {
    EXPECT_TRUE(oracle_->SettleUpheld(Key(5)).IsNotFound());
    EXPECT_TRUE(oracle_->SettleOverturned(Key(5)).IsNotFound());
}

// ============================================================================
// Keys and Restore
// ============================================================================

TEST_F(ContributionOracleTest, ContributionKeyCoversClaim) {
    EXPECT_EQ(Key(1000), Key(1000));
    EXPECT_NE(Key(1000), Key(1001));
    EXPECT_NE(Key(1000),
              ContributionOracle::ComputeContributionKey(building_, outsider_, 1000));
}

TEST_F(ContributionOracleTest, RestoreRebuildsState) {
    ContributionRecord record;
    record.key = Key(1000);
    record.buildingId = building_;
    record.workerId = worker_;
    record.buildingWallet = wallet_;
    record.amount = 1000;
    record.confirmingValidators = {validators_[0], validators_[1]};
    record.proposedAt = START_TIME;

    Hash256 proofId = SHA256Hash(std::string("consumed"));
    oracle_->RestoreContribution(record);
    oracle_->RestoreConsumedProof(proofId);

    EXPECT_TRUE(oracle_->IsProofConsumed(proofId));
    clock_.Advance(ONE_DAY);
    EXPECT_TRUE(oracle_->Finalize(Key(1000)).status.ok());
}

TEST_F(ContributionOracleTest, RecordSerializationRoundTrip) {
    ASSERT_TRUE(AttestFresh(validators_[0], 1000).ok());
    ASSERT_TRUE(AttestFresh(validators_[1], 1000).ok());
    ASSERT_TRUE(oracle_->RaiseFlag(validators_[2], Key(1000), "why").ok());
    ContributionRecord in = *oracle_->GetContribution(Key(1000));

    DataStream ss;
    ss << in;
    ContributionRecord out;
    ss >> out;

    EXPECT_EQ(out.key, in.key);
    EXPECT_EQ(out.confirmingValidators, in.confirmingValidators);
    EXPECT_TRUE(out.disputed);
    EXPECT_EQ(out.flagReason, "why");
    EXPECT_TRUE(ss.empty());
}

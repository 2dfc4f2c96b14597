// ATTESTOR - Contribution Proof Tests
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include <gtest/gtest.h>
#include "attestor/crypto/sha256.h"
#include "attestor/oracle/proof.h"

#include <array>

using namespace attestor;
using namespace attestor::oracle;

class ProofTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::array<Byte, 32> raw{};
        for (size_t i = 0; i < raw.size(); ++i) {
            raw[i] = static_cast<Byte>(0x40 + i);
        }
        workerKey_ = PrivateKey(raw);
        raw[0] = 0x11;
        otherKey_ = PrivateKey(raw);

        domain_ = ComputeDomainSeparator(31337, SHA256Hash(std::string("oracle")));

        proof_.buildingId = SHA256Hash(std::string("building-7"));
        proof_.workerId = workerKey_.GetPublicKey().GetHash160();
        proof_.amount = 1000;
        proof_.evidenceRoot = SHA256Hash(std::string("evidence"));
        proof_.capturedAt = 1700000000;
        proof_.nonce = 1;
    }

    PrivateKey workerKey_;
    PrivateKey otherKey_;
    Hash256 domain_;
    ContributionProof proof_;
};

TEST_F(ProofTest, DomainSeparatorBindsChainAndOracle) {
    Hash256 oracle = SHA256Hash(std::string("oracle"));
    EXPECT_EQ(ComputeDomainSeparator(31337, oracle), domain_);
    EXPECT_NE(ComputeDomainSeparator(1, oracle), domain_);
    EXPECT_NE(ComputeDomainSeparator(31337, SHA256Hash(std::string("other"))), domain_);
}

TEST_F(ProofTest, HashCoversEveryField) {
    Hash256 base = proof_.GetHash();
    EXPECT_EQ(proof_.GetHash(), base);

    ContributionProof p = proof_;
    p.amount += 1;
    EXPECT_NE(p.GetHash(), base);

    p = proof_;
    p.evidenceRoot.SetNull();
    EXPECT_NE(p.GetHash(), base);

    p = proof_;
    p.capturedAt += 1;
    EXPECT_NE(p.GetHash(), base);

    p = proof_;
    p.nonce = 2;
    EXPECT_NE(p.GetHash(), base);
}

TEST_F(ProofTest, SigningDigestIsDomainBound) {
    Hash256 other = ComputeDomainSeparator(1, SHA256Hash(std::string("oracle")));
    EXPECT_NE(ComputeSigningDigest(domain_, proof_), ComputeSigningDigest(other, proof_));
}

TEST_F(ProofTest, SignAndVerify) {
    WorkerSignature sig = SignContributionProof(workerKey_, domain_, proof_);
    ASSERT_FALSE(sig.IsNull());
    EXPECT_EQ(sig.signer, workerKey_.GetPublicKey());
    EXPECT_TRUE(VerifyWorkerSignature(domain_, proof_, sig));
}

TEST_F(ProofTest, RejectsWrongDomain) {
    WorkerSignature sig = SignContributionProof(workerKey_, domain_, proof_);
    Hash256 other = ComputeDomainSeparator(1, SHA256Hash(std::string("oracle")));
    EXPECT_FALSE(VerifyWorkerSignature(other, proof_, sig));
}

TEST_F(ProofTest, RejectsTamperedProof) {
    WorkerSignature sig = SignContributionProof(workerKey_, domain_, proof_);
    ContributionProof tampered = proof_;
    tampered.amount = 5000;
    EXPECT_FALSE(VerifyWorkerSignature(domain_, tampered, sig));
}

TEST_F(ProofTest, RejectsSignerOtherThanWorker) {
    // Valid signature, but the key does not hash to workerId
    WorkerSignature sig = SignContributionProof(otherKey_, domain_, proof_);
    ASSERT_FALSE(sig.IsNull());
    EXPECT_FALSE(VerifyWorkerSignature(domain_, proof_, sig));

    // Worker's key presented with someone else's signature
    sig.signer = workerKey_.GetPublicKey();
    EXPECT_FALSE(VerifyWorkerSignature(domain_, proof_, sig));
}

TEST_F(ProofTest, RejectsEmptySignature) {
    WorkerSignature sig;
    sig.signer = workerKey_.GetPublicKey();
    EXPECT_TRUE(sig.IsNull());
    EXPECT_FALSE(VerifyWorkerSignature(domain_, proof_, sig));

    EXPECT_TRUE(SignContributionProof(PrivateKey(), domain_, proof_).IsNull());
}

TEST_F(ProofTest, ProofIdDependsOnSignature) {
    WorkerSignature a = SignContributionProof(workerKey_, domain_, proof_);
    WorkerSignature b = a;
    b.der.push_back(0x00);

    EXPECT_EQ(ComputeProofId(proof_, a), ComputeProofId(proof_, a));
    EXPECT_NE(ComputeProofId(proof_, a), ComputeProofId(proof_, b));

    ContributionProof next = proof_;
    next.nonce = 2;
    EXPECT_NE(ComputeProofId(proof_, a), ComputeProofId(next, a));
}

TEST_F(ProofTest, SerializationRoundTrip) {
    WorkerSignature sig = SignContributionProof(workerKey_, domain_, proof_);
    DataStream ss;
    ss << proof_ << sig;

    ContributionProof proofOut;
    WorkerSignature sigOut;
    ss >> proofOut >> sigOut;

    EXPECT_EQ(proofOut.GetHash(), proof_.GetHash());
    EXPECT_TRUE(VerifyWorkerSignature(domain_, proofOut, sigOut));
}

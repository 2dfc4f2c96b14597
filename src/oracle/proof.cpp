// ATTESTOR - Contribution Proofs Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/oracle/proof.h"
#include "attestor/crypto/sha256.h"

#include <cstring>
#include <sstream>

namespace attestor {
namespace oracle {

namespace {

void WriteString(SHA256& hasher, const char* str) {
    hasher.Write(reinterpret_cast<const Byte*>(str), std::strlen(str));
}

Hash256 HashString(const char* str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str), std::strlen(str));
}

} // namespace

Hash256 ContributionProof::GetHash() const {
    DataStream ss;
    ss << *this;

    SHA256 hasher;
    WriteString(hasher, PROOF_TYPE_TAG);
    hasher.Write(ss.Data());
    return hasher.Finalize();
}

std::string ContributionProof::ToString() const {
    std::ostringstream ss;
    ss << "ContributionProof(building=" << buildingId.ToHex().substr(0, 16) << "..."
       << ", worker=" << workerId.ToHex()
       << ", amount=" << amount
       << ", evidence=" << evidenceRoot.ToHex().substr(0, 16) << "..."
       << ", capturedAt=" << capturedAt
       << ", nonce=" << nonce << ")";
    return ss.str();
}

Hash256 ComputeDomainSeparator(uint64_t chainId, const Hash256& oracleId) {
    DataStream fields;
    ::attestor::Serialize(fields, chainId);
    ::attestor::Serialize(fields, oracleId);

    Hash256 nameHash = HashString(DOMAIN_NAME);
    Hash256 versionHash = HashString(DOMAIN_VERSION);

    SHA256 hasher;
    hasher.Write(HashString(DOMAIN_TYPE_TAG).data(), Hash256::SIZE);
    hasher.Write(nameHash.data(), Hash256::SIZE);
    hasher.Write(versionHash.data(), Hash256::SIZE);
    hasher.Write(fields.Data());
    return hasher.Finalize();
}

Hash256 ComputeSigningDigest(const Hash256& domainSeparator, const ContributionProof& proof) {
    static const Byte prefix[2] = {0x19, 0x01};
    Hash256 proofHash = proof.GetHash();

    SHA256 hasher;
    hasher.Write(prefix, sizeof(prefix));
    hasher.Write(domainSeparator.data(), Hash256::SIZE);
    hasher.Write(proofHash.data(), Hash256::SIZE);
    return hasher.Finalize();
}

bool VerifyWorkerSignature(const Hash256& domainSeparator,
                           const ContributionProof& proof,
                           const WorkerSignature& sig) {
    if (sig.IsNull() || !sig.signer.IsValid()) {
        return false;
    }
    if (sig.signer.GetHash160() != proof.workerId) {
        return false;
    }
    return sig.signer.Verify(ComputeSigningDigest(domainSeparator, proof), sig.der);
}

WorkerSignature SignContributionProof(const PrivateKey& key,
                                      const Hash256& domainSeparator,
                                      const ContributionProof& proof) {
    WorkerSignature sig;
    if (!key.IsValid()) {
        return sig;
    }
    sig.signer = key.GetPublicKey();
    sig.der = key.Sign(ComputeSigningDigest(domainSeparator, proof));
    return sig;
}

Hash256 ComputeProofId(const ContributionProof& proof, const WorkerSignature& sig) {
    DataStream ss;
    ss << proof;
    ss.Write(sig.der.data(), sig.der.size());
    return SHA256Hash(ss.Data());
}

} // namespace oracle
} // namespace attestor

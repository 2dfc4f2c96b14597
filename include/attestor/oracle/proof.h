// ATTESTOR - Contribution Proofs
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// A worker signs a ContributionProof describing one capture of field work.
// The signature is bound to a domain (protocol name, version, chain id and
// oracle id) so a proof signed for one deployment is useless on another.
//
//   digest = SHA256(0x19 || 0x01 || domainSeparator || proofHash)
//   domainSeparator = SHA256(DOMAIN_TYPE_TAG || name || version || chainId || oracleId)
//   proofHash = SHA256(PROOF_TYPE_TAG || fields)

#ifndef ATTESTOR_ORACLE_PROOF_H
#define ATTESTOR_ORACLE_PROOF_H

#include "attestor/core/serialize.h"
#include "attestor/core/types.h"
#include "attestor/crypto/keys.h"

#include <cstdint>
#include <string>
#include <vector>

namespace attestor {
namespace oracle {

/// Signing domain name
constexpr const char* DOMAIN_NAME = "ATTESTOR Contribution Oracle";

/// Signing domain version
constexpr const char* DOMAIN_VERSION = "1";

/// Type description hashed into the domain separator
constexpr const char* DOMAIN_TYPE_TAG =
    "Domain(string name,string version,uint64 chainId,bytes32 oracleId)";

/// Type description hashed into every proof hash
constexpr const char* PROOF_TYPE_TAG =
    "ContributionProof(bytes32 buildingId,bytes20 workerId,int64 amount,"
    "bytes32 evidenceRoot,int64 capturedAt,uint64 nonce)";

// ============================================================================
// Contribution Proof
// ============================================================================

struct ContributionProof {
    BuildingId buildingId;
    WorkerId workerId;
    Amount amount{0};

    /// Root of the off-chain evidence capture
    Hash256 evidenceRoot;

    /// When the evidence was captured (worker supplied, informational)
    Timestamp capturedAt{0};

    /// Distinguishes captures of the same claim
    uint64_t nonce{0};

    /// SHA256(PROOF_TYPE_TAG || fields)
    Hash256 GetHash() const;

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, buildingId);
        ::attestor::Serialize(s, workerId);
        ::attestor::Serialize(s, amount);
        ::attestor::Serialize(s, evidenceRoot);
        ::attestor::Serialize(s, capturedAt);
        ::attestor::Serialize(s, nonce);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::attestor::Unserialize(s, buildingId);
        ::attestor::Unserialize(s, workerId);
        ::attestor::Unserialize(s, amount);
        ::attestor::Unserialize(s, evidenceRoot);
        ::attestor::Unserialize(s, capturedAt);
        ::attestor::Unserialize(s, nonce);
    }
};

// ============================================================================
// Worker Signature
// ============================================================================

/// The signer's public key and a DER ECDSA signature over the signing digest
struct WorkerSignature {
    PublicKey signer;
    std::vector<uint8_t> der;

    bool IsNull() const { return der.empty(); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::attestor::Serialize(s, signer);
        ::attestor::Serialize(s, der);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::attestor::Unserialize(s, signer);
        ::attestor::Unserialize(s, der);
    }
};

// ============================================================================
// Digests
// ============================================================================

Hash256 ComputeDomainSeparator(uint64_t chainId, const Hash256& oracleId);

/// Digest the worker signs
Hash256 ComputeSigningDigest(const Hash256& domainSeparator, const ContributionProof& proof);

/**
 * Check that sig was produced by the key behind proof.workerId over the
 * signing digest. The key must hash to workerId and the DER must be
 * canonical and low-S.
 */
bool VerifyWorkerSignature(const Hash256& domainSeparator,
                           const ContributionProof& proof,
                           const WorkerSignature& sig);

/// Sign a proof with a worker key; der is empty if signing failed
WorkerSignature SignContributionProof(const PrivateKey& key,
                                      const Hash256& domainSeparator,
                                      const ContributionProof& proof);

/// Identifier under which a signed proof is consumed:
/// SHA256(serialized proof || signature bytes)
Hash256 ComputeProofId(const ContributionProof& proof, const WorkerSignature& sig);

} // namespace oracle
} // namespace attestor

#endif // ATTESTOR_ORACLE_PROOF_H

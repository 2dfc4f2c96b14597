// ATTESTOR - Protocol Parameters
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Every constant the three protocol components agree on. Main() and RegTest()
// give the built-in presets; LoadProtocolParams() overlays the [protocol]
// section of a configuration file.

#ifndef ATTESTOR_CONSENSUS_PARAMS_H
#define ATTESTOR_CONSENSUS_PARAMS_H

#include "attestor/core/types.h"
#include "attestor/util/config.h"

#include <cstdint>
#include <string>

namespace attestor {
namespace consensus {

/// Config section holding protocol overrides
constexpr const char* PROTOCOL_SECTION = "protocol";

struct ProtocolParams {
    // ========================================================================
    // Network Identification
    // ========================================================================

    /// Network name (main, regtest)
    std::string networkId;

    /// Chain id bound into every worker signature
    uint64_t chainId{0};

    /// Oracle instance id bound into every worker signature
    Hash256 oracleId;

    // ========================================================================
    // Stake Registry
    // ========================================================================

    /// Minimum active stake for a validator to be qualified
    Amount minStake{0};

    /// Delay between RequestWithdrawal and CompleteWithdrawal
    Seconds withdrawalDelay{0};

    /// Ledger account holding bonded stake
    Address stakeCustody;

    // ========================================================================
    // Contribution Oracle
    // ========================================================================

    /// Minimum age of a record before it can be finalized
    Seconds finalizationDelay{0};

    /// Distinct confirming validators required to finalize
    uint32_t minConfirmations{0};

    /// Recipient of the 10% maintainer share
    Address maintainerPool;

    /// Recipient of the treasury share, slashed stake and forfeited bonds
    Address treasury;

    // ========================================================================
    // Dispute Resolver
    // ========================================================================

    /// Bond a challenger escrows to open a dispute
    Amount disputeBond{0};

    /// Length of the commit phase
    Seconds commitPeriod{0};

    /// Length of the reveal phase (starts when the commit phase ends)
    Seconds revealPeriod{0};

    /// Ledger account holding dispute bonds
    Address disputeCustody;

    /// Stake slashed from each confirmer of an overturned record (0 = off)
    Amount overturnSlashAmount{0};

    /**
     * Check internal consistency.
     * @param error Receives a description of the first problem found
     */
    bool Validate(std::string* error = nullptr) const;

    /// Production preset
    static ProtocolParams Main();

    /// Local testing preset: small amounts, same delays as Main
    static ProtocolParams RegTest();
};

/// Deterministic system account for a name on a network
Address SystemAddress(const std::string& networkId, const std::string& name);

/**
 * Overlay [protocol] values from config onto params and validate the result.
 * On failure params is left unchanged.
 */
util::ConfigParseResult LoadProtocolParams(const util::ConfigManager& config,
                                           ProtocolParams& params);

} // namespace consensus
} // namespace attestor

#endif // ATTESTOR_CONSENSUS_PARAMS_H

// ATTESTOR - Protocol Parameters Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/consensus/params.h"
#include "attestor/crypto/keys.h"
#include "attestor/crypto/sha256.h"
#include "attestor/util/logging.h"

#include <stdexcept>

namespace attestor {
namespace consensus {

namespace {

ProtocolParams Base(const std::string& networkId, uint64_t chainId) {
    ProtocolParams p;
    p.networkId = networkId;
    p.chainId = chainId;
    p.oracleId = SHA256Hash("attestor/oracle/" + networkId);
    p.withdrawalDelay = 7 * ONE_DAY;
    p.stakeCustody = SystemAddress(networkId, "stake-custody");
    p.finalizationDelay = ONE_DAY;
    p.minConfirmations = 2;
    p.maintainerPool = SystemAddress(networkId, "maintainer-pool");
    p.treasury = SystemAddress(networkId, "treasury");
    p.commitPeriod = ONE_DAY;
    p.revealPeriod = ONE_DAY + ONE_HOUR;
    p.disputeCustody = SystemAddress(networkId, "dispute-custody");
    p.overturnSlashAmount = 0;
    return p;
}

bool Fail(std::string* error, const std::string& msg) {
    if (error) {
        *error = msg;
    }
    return false;
}

} // namespace

Address SystemAddress(const std::string& networkId, const std::string& name) {
    std::string tag = "attestor/" + networkId + "/" + name;
    return ComputeHash160(reinterpret_cast<const uint8_t*>(tag.data()), tag.size());
}

ProtocolParams ProtocolParams::Main() {
    ProtocolParams p = Base("main", 1);
    p.minStake = 1000 * COIN;
    p.disputeBond = 100 * COIN;
    return p;
}

ProtocolParams ProtocolParams::RegTest() {
    ProtocolParams p = Base("regtest", 31337);
    p.minStake = 1000;
    p.disputeBond = 100;
    return p;
}

bool ProtocolParams::Validate(std::string* error) const {
    if (networkId.empty()) {
        return Fail(error, "network id is empty");
    }
    if (minStake <= 0 || !MoneyRange(minStake)) {
        return Fail(error, "min_stake must be positive");
    }
    if (withdrawalDelay < 0) {
        return Fail(error, "withdrawal_delay must not be negative");
    }
    if (finalizationDelay < 0) {
        return Fail(error, "finalization_delay must not be negative");
    }
    if (minConfirmations < 1) {
        return Fail(error, "min_confirmations must be at least 1");
    }
    if (disputeBond <= 0 || !MoneyRange(disputeBond)) {
        return Fail(error, "dispute_bond must be positive");
    }
    if (commitPeriod <= 0 || revealPeriod <= 0) {
        return Fail(error, "commit_period and reveal_period must be positive");
    }
    if (overturnSlashAmount < 0 || !MoneyRange(overturnSlashAmount)) {
        return Fail(error, "overturn_slash_amount out of range");
    }
    if (treasury.IsNull() || maintainerPool.IsNull() ||
        stakeCustody.IsNull() || disputeCustody.IsNull()) {
        return Fail(error, "system accounts must be set");
    }
    if (treasury == stakeCustody || treasury == disputeCustody ||
        stakeCustody == disputeCustody) {
        return Fail(error, "custody accounts must be distinct from each other and the treasury");
    }
    return true;
}

util::ConfigParseResult LoadProtocolParams(const util::ConfigManager& config,
                                           ProtocolParams& params) {
    using util::ConfigParseResult;
    const std::string section = PROTOCOL_SECTION;
    ProtocolParams next = params;

    auto amount = [&](const char* key, Amount& out) -> bool {
        if (!config.HasKey(key, section)) return true;
        auto v = config.TryGetInt(key, section);
        if (!v) return false;
        out = *v;
        return true;
    };
    auto duration = [&](const char* key, Seconds& out) -> bool {
        if (!config.HasKey(key, section)) return true;
        auto v = config.TryGetDuration(key, section);
        if (!v) return false;
        out = *v;
        return true;
    };
    auto address = [&](const char* key, Address& out) -> bool {
        auto v = config.TryGetString(key, section);
        if (!v) return true;
        try {
            out = Address::FromHex(*v);
        } catch (const std::invalid_argument&) {
            return false;
        }
        return true;
    };

    if (!amount("min_stake", next.minStake)) {
        return ConfigParseResult::Error("invalid min_stake", section);
    }
    if (!duration("withdrawal_delay", next.withdrawalDelay)) {
        return ConfigParseResult::Error("invalid withdrawal_delay", section);
    }
    if (!duration("finalization_delay", next.finalizationDelay)) {
        return ConfigParseResult::Error("invalid finalization_delay", section);
    }
    if (config.HasKey("min_confirmations", section)) {
        auto v = config.TryGetInt("min_confirmations", section);
        if (!v || *v < 1 || *v > UINT32_MAX) {
            return ConfigParseResult::Error("invalid min_confirmations", section);
        }
        next.minConfirmations = static_cast<uint32_t>(*v);
    }
    if (!amount("dispute_bond", next.disputeBond)) {
        return ConfigParseResult::Error("invalid dispute_bond", section);
    }
    if (!duration("commit_period", next.commitPeriod)) {
        return ConfigParseResult::Error("invalid commit_period", section);
    }
    if (!duration("reveal_period", next.revealPeriod)) {
        return ConfigParseResult::Error("invalid reveal_period", section);
    }
    if (config.HasKey("chain_id", section)) {
        auto v = config.TryGetInt("chain_id", section);
        if (!v || *v < 0) {
            return ConfigParseResult::Error("invalid chain_id", section);
        }
        next.chainId = static_cast<uint64_t>(*v);
    }
    if (!address("maintainer_pool", next.maintainerPool)) {
        return ConfigParseResult::Error("invalid maintainer_pool address", section);
    }
    if (!address("treasury", next.treasury)) {
        return ConfigParseResult::Error("invalid treasury address", section);
    }
    if (!amount("overturn_slash_amount", next.overturnSlashAmount)) {
        return ConfigParseResult::Error("invalid overturn_slash_amount", section);
    }

    std::string error;
    if (!next.Validate(&error)) {
        return ConfigParseResult::Error(error, section);
    }

    params = next;
    LOG_INFO(util::LogCategory::CONFIG) << "protocol params loaded for " << params.networkId
        << " (min_stake=" << params.minStake
        << " min_confirmations=" << params.minConfirmations << ")";
    return ConfigParseResult::Success();
}

} // namespace consensus
} // namespace attestor

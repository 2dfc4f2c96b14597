// ATTESTOR - Identity Registry Interface
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Read-only view of workers and buildings. Worker and building lifecycle is
// managed outside the protocol; the oracle only asks these questions.

#ifndef ATTESTOR_IDENTITY_REGISTRY_H
#define ATTESTOR_IDENTITY_REGISTRY_H

#include "attestor/core/types.h"

#include <map>
#include <optional>
#include <set>

namespace attestor {
namespace identity {

class IdentityRegistry {
public:
    virtual ~IdentityRegistry() = default;

    virtual bool IsWorkerActive(const WorkerId& worker) const = 0;

    virtual bool IsBuildingRegistered(const BuildingId& building) const = 0;

    /// Payout wallet of a registered building
    virtual std::optional<Address> GetBuildingWallet(const BuildingId& building) const = 0;
};

/// In-process registry for embedding and tests
class MemoryIdentityRegistry : public IdentityRegistry {
public:
    /// Register a worker (active) or re-activate it
    void AddWorker(const WorkerId& worker);

    /// Mark a worker inactive; it can no longer be attested for
    void DeactivateWorker(const WorkerId& worker);

    /// Register a building or replace its wallet
    void RegisterBuilding(const BuildingId& building, const Address& wallet);

    bool IsWorkerActive(const WorkerId& worker) const override;
    bool IsBuildingRegistered(const BuildingId& building) const override;
    std::optional<Address> GetBuildingWallet(const BuildingId& building) const override;

private:
    std::set<WorkerId> activeWorkers_;
    std::map<BuildingId, Address> buildings_;
};

} // namespace identity
} // namespace attestor

#endif // ATTESTOR_IDENTITY_REGISTRY_H

// ATTESTOR - Identity Registry Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/identity/registry.h"

namespace attestor {
namespace identity {

void MemoryIdentityRegistry::AddWorker(const WorkerId& worker) {
    activeWorkers_.insert(worker);
}

void MemoryIdentityRegistry::DeactivateWorker(const WorkerId& worker) {
    activeWorkers_.erase(worker);
}

void MemoryIdentityRegistry::RegisterBuilding(const BuildingId& building, const Address& wallet) {
    buildings_[building] = wallet;
}

bool MemoryIdentityRegistry::IsWorkerActive(const WorkerId& worker) const {
    return activeWorkers_.count(worker) > 0;
}

bool MemoryIdentityRegistry::IsBuildingRegistered(const BuildingId& building) const {
    return buildings_.count(building) > 0;
}

std::optional<Address> MemoryIdentityRegistry::GetBuildingWallet(const BuildingId& building) const {
    auto it = buildings_.find(building);
    if (it == buildings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace identity
} // namespace attestor

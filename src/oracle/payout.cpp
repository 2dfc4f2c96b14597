// ATTESTOR - Payout Split Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/oracle/payout.h"

#include <sstream>

namespace attestor {
namespace oracle {

namespace {

// floor(amount * percent / 100) without overflowing near MAX_MONEY
Amount PercentOf(Amount amount, int percent) {
    return (amount / 100) * percent + ((amount % 100) * percent) / 100;
}

} // namespace

bool PayoutSplit::IsValid(Amount amount) const {
    return worker >= 0 && building >= 0 && maintainer >= 0 && treasury >= 0 &&
           Total() == amount;
}

std::string PayoutSplit::ToString() const {
    std::ostringstream ss;
    ss << "PayoutSplit(worker=" << worker
       << ", building=" << building
       << ", maintainer=" << maintainer
       << ", treasury=" << treasury << ")";
    return ss.str();
}

PayoutSplit ComputePayoutSplit(Amount amount) {
    PayoutSplit split;
    if (amount <= 0) {
        return split;
    }
    split.worker = PercentOf(amount, WORKER_SHARE_PERCENT);
    split.building = PercentOf(amount, BUILDING_SHARE_PERCENT);
    split.maintainer = PercentOf(amount, MAINTAINER_SHARE_PERCENT);
    split.treasury = amount - split.worker - split.building - split.maintainer;
    return split;
}

} // namespace oracle
} // namespace attestor

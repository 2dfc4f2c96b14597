// ATTESTOR - Payout Split
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#ifndef ATTESTOR_ORACLE_PAYOUT_H
#define ATTESTOR_ORACLE_PAYOUT_H

#include "attestor/core/types.h"

#include <string>

namespace attestor {
namespace oracle {

/// Percentage shares of a finalized contribution; treasury takes the rest
constexpr int WORKER_SHARE_PERCENT = 70;
constexpr int BUILDING_SHARE_PERCENT = 10;
constexpr int MAINTAINER_SHARE_PERCENT = 10;
constexpr int TREASURY_SHARE_PERCENT = 10;

static_assert(WORKER_SHARE_PERCENT + BUILDING_SHARE_PERCENT +
              MAINTAINER_SHARE_PERCENT + TREASURY_SHARE_PERCENT == 100,
              "payout shares must sum to 100%");

struct PayoutSplit {
    Amount worker{0};
    Amount building{0};
    Amount maintainer{0};
    Amount treasury{0};

    Amount Total() const { return worker + building + maintainer + treasury; }

    /// Every share non-negative and the total exactly amount
    bool IsValid(Amount amount) const;

    std::string ToString() const;
};

/**
 * Split amount into the four shares. The first three are rounded down;
 * the treasury absorbs the remainder so the shares always sum to amount.
 */
PayoutSplit ComputePayoutSplit(Amount amount);

} // namespace oracle
} // namespace attestor

#endif // ATTESTOR_ORACLE_PAYOUT_H

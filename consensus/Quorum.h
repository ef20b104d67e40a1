#pragma once

#include <cstdint>

namespace ql {
namespace consensus {

enum class ThresholdPolicy {
  MAJORITY_OVER_HALF, // approvals > total / 2, a tie fails
  TWO_THIRDS_OR_MORE  // approvals >= (2 * total) / 3
};

/**
 * Whether `approvals` affirmative responses out of `total` satisfy `policy`.
 * Integer division throughout; pure, no side effects.
 */
bool isQuorumReached(uint64_t approvals, uint64_t total, ThresholdPolicy policy);

/**
 * Smallest approval count that passes `policy` for `total` participants
 */
uint64_t getMinimumApprovals(uint64_t total, ThresholdPolicy policy);

const char *toString(ThresholdPolicy policy);

} // namespace consensus
} // namespace ql

#include "Quorum.h"

namespace ql {
namespace consensus {

bool isQuorumReached(uint64_t approvals, uint64_t total, ThresholdPolicy policy) {
  return approvals >= getMinimumApprovals(total, policy);
}

uint64_t getMinimumApprovals(uint64_t total, ThresholdPolicy policy) {
  switch (policy) {
  case ThresholdPolicy::MAJORITY_OVER_HALF:
    return total / 2 + 1;
  case ThresholdPolicy::TWO_THIRDS_OR_MORE:
    return (2 * total) / 3;
  }
  return total + 1;
}

const char *toString(ThresholdPolicy policy) {
  switch (policy) {
  case ThresholdPolicy::MAJORITY_OVER_HALF:
    return "majority";
  case ThresholdPolicy::TWO_THIRDS_OR_MORE:
    return "two-thirds";
  }
  return "unknown";
}

} // namespace consensus
} // namespace ql

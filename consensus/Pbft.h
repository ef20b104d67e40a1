#pragma once

#include "ConsensusStrategy.h"

namespace ql {
namespace consensus {

/**
 * Practical Byzantine Fault Tolerance, single view
 *
 * The first participant is the fixed primary, the rest are replicas. A round
 * runs PRE_PREPARE (primary builds the candidate), PREPARE (every participant
 * verifies it) and COMMIT (two-thirds quorum, then one append). There is no
 * view change.
 */
class Pbft : public ConsensusStrategy {
public:
  enum class Phase { IDLE, PRE_PREPARE, PREPARE, COMMIT };

  Pbft();
  ~Pbft() override = default;

  Protocol getProtocol() const override { return Protocol::PBFT; }
  Roe<void> attach(Context &ctx) override;
  Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) override;
  std::optional<ParticipantId> getLeader() const override;

  Phase getPhase() const { return phase_; }

private:
  void enterPhase(Phase phase);

  ParticipantId primary_;
  Phase phase_{ Phase::IDLE };
};

const char *toString(Pbft::Phase phase);

} // namespace consensus
} // namespace ql

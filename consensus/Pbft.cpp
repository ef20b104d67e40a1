#include "Pbft.h"

namespace ql {
namespace consensus {

Pbft::Pbft() : ConsensusStrategy("consensus.pbft") {}

Pbft::Roe<void> Pbft::attach(Context &ctx) {
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "PBFT needs at least one replica");
  }
  for (size_t i = 0; i < ctx.participants.size(); ++i) {
    ctx.participants[i]->setRole(i == 0 ? Participant::Role::PRIMARY
                                        : Participant::Role::REPLICA);
  }
  primary_ = ctx.participants.front()->getId();
  log().info << "Attached " << ctx.participants.size() << " replicas, primary "
             << primary_;
  return {};
}

std::optional<ParticipantId> Pbft::getLeader() const {
  if (primary_.empty()) {
    return std::nullopt;
  }
  return primary_;
}

void Pbft::enterPhase(Phase phase) {
  phase_ = phase;
  log().debug << "Phase " << toString(phase);
}

Pbft::Roe<Record> Pbft::proposeAndCommit(Context &ctx, const std::string &data,
                                         std::optional<uint64_t> proposalNumber) {
  if (proposalNumber) {
    log().debug << "Ignoring proposal number " << *proposalNumber;
  }
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "PBFT network has no participants");
  }

  enterPhase(Phase::PRE_PREPARE);
  auto candidate = buildCandidate(ctx, data);
  if (!candidate) {
    enterPhase(Phase::IDLE);
    return candidate;
  }
  log().debug << "Primary " << primary_ << " proposes record " << candidate->getIndex();

  enterPhase(Phase::PREPARE);
  uint64_t approvals = collectVerifications(ctx, *candidate);

  enterPhase(Phase::COMMIT);
  auto result = commitWithQuorum(ctx, *candidate, approvals,
                                 ThresholdPolicy::TWO_THIRDS_OR_MORE);
  enterPhase(Phase::IDLE);
  return result;
}

const char *toString(Pbft::Phase phase) {
  switch (phase) {
  case Pbft::Phase::IDLE:
    return "IDLE";
  case Pbft::Phase::PRE_PREPARE:
    return "PRE_PREPARE";
  case Pbft::Phase::PREPARE:
    return "PREPARE";
  case Pbft::Phase::COMMIT:
    return "COMMIT";
  }
  return "UNKNOWN";
}

} // namespace consensus
} // namespace ql

#include "Raft.h"

namespace ql {
namespace consensus {

Raft::Raft(ProtocolMode mode) : ConsensusStrategy("consensus.raft"), mode_(mode) {}

Raft::Roe<void> Raft::attach(Context &ctx) {
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "Raft needs at least one node");
  }
  for (auto &spParticipant : ctx.participants) {
    spParticipant->setRole(Participant::Role::FOLLOWER);
  }
  leader_.reset();
  log().info << "Attached " << ctx.participants.size() << " followers, mode "
             << toString(mode_);
  return {};
}

Raft::Roe<void> Raft::requestVote(Context &ctx, const ParticipantId &candidate) {
  Participant *candidateNode = findParticipant(ctx, candidate);
  if (!candidateNode) {
    return Error(E_UNKNOWN_PARTICIPANT, "Unknown candidate: " + candidate);
  }

  candidateNode->startElection();
  const uint64_t term = candidateNode->getTerm();
  const uint64_t lastIndex = candidateNode->getLastCommittedIndex();
  log().debug << candidate << " requests votes for term " << term;

  uint64_t votes = 0;
  for (auto &spParticipant : ctx.participants) {
    if (spParticipant->voteFor(candidate, term, lastIndex, mode_)) {
      ++votes;
    } else {
      log().debug << spParticipant->getId() << " denies vote to " << candidate;
    }
  }

  // A strict vote may have turned the previous leader into a follower
  if (leader_) {
    Participant *leaderNode = findParticipant(ctx, *leader_);
    if (!leaderNode || leaderNode->getRole() != Participant::Role::LEADER) {
      leader_.reset();
    }
  }

  const uint64_t total = ctx.participants.size();
  if (!isQuorumReached(votes, total, ThresholdPolicy::MAJORITY_OVER_HALF)) {
    candidateNode->stepDown();
    recordRound(votes, total, false);
    log().warning << candidate << " lost the election with " << votes << "/" << total
                  << " votes";
    return Error(E_QUORUM_NOT_REACHED, candidate + " received " +
                                           std::to_string(votes) + "/" +
                                           std::to_string(total) + " votes");
  }

  for (auto &spParticipant : ctx.participants) {
    if (spParticipant.get() != candidateNode) {
      spParticipant->stepDown();
    }
  }
  candidateNode->becomeLeader();
  recordRound(votes, total, true);
  if (leader_ && *leader_ != candidate) {
    log().info << "Leader " << *leader_ << " steps down";
  }
  leader_ = candidate;
  log().info << candidate << " elected leader for term " << term << " with " << votes
             << "/" << total << " votes";
  return {};
}

Raft::Roe<Record> Raft::lead(Context &ctx, const ParticipantId &caller,
                             const std::string &data) {
  Participant *callerNode = findParticipant(ctx, caller);
  if (!callerNode) {
    return Error(E_UNKNOWN_PARTICIPANT, "Unknown participant: " + caller);
  }
  if (!leader_ || *leader_ != caller ||
      callerNode->getRole() != Participant::Role::LEADER) {
    return Error(E_NOT_LEADER, caller + " is not the leader");
  }

  auto candidate = buildCandidate(ctx, data);
  if (!candidate) {
    return candidate;
  }

  uint64_t approvals = 0;
  for (auto &spParticipant : ctx.participants) {
    if (spParticipant->acceptEntries(*candidate, callerNode->getTerm(), ctx.ledger,
                                     mode_)) {
      ++approvals;
    } else {
      log().debug << spParticipant->getId() << " refuses record "
                  << candidate->getIndex();
    }
  }
  return commitWithQuorum(ctx, *candidate, approvals,
                          ThresholdPolicy::MAJORITY_OVER_HALF);
}

Raft::Roe<Record> Raft::proposeAndCommit(Context &ctx, const std::string &data,
                                         std::optional<uint64_t> proposalNumber) {
  if (proposalNumber) {
    log().debug << "Ignoring proposal number " << *proposalNumber;
  }
  if (!leader_) {
    return Error(E_NOT_LEADER, "No leader elected");
  }
  return lead(ctx, *leader_, data);
}

} // namespace consensus
} // namespace ql

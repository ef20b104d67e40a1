#include "Paxos.h"

namespace ql {
namespace consensus {

Paxos::Paxos(ProtocolMode mode) : ConsensusStrategy("consensus.paxos"), mode_(mode) {}

Paxos::Roe<void> Paxos::attach(Context &ctx) {
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "Paxos needs at least one acceptor");
  }
  for (size_t i = 0; i < ctx.participants.size(); ++i) {
    ctx.participants[i]->setRole(i == 0 ? Participant::Role::PROPOSER
                                        : Participant::Role::ACCEPTOR);
  }
  proposer_ = ctx.participants.front()->getId();
  log().info << "Attached " << ctx.participants.size() << " acceptors, proposer "
             << proposer_ << ", mode " << toString(mode_);
  return {};
}

std::optional<ParticipantId> Paxos::getLeader() const {
  if (proposer_.empty()) {
    return std::nullopt;
  }
  return proposer_;
}

Paxos::Roe<Proposal> Paxos::prepareSimplified(Context &ctx, const Proposal &proposal) {
  for (auto &spParticipant : ctx.participants) {
    spParticipant->recordProposal(proposal);
  }
  log().debug << "Prepare " << proposal.number << " delivered to "
              << ctx.participants.size() << " acceptors";
  return proposal;
}

Paxos::Roe<Proposal> Paxos::prepareStrict(Context &ctx, Proposal proposal) {
  uint64_t promises = 0;
  std::optional<Proposal> highestAccepted;
  for (auto &spParticipant : ctx.participants) {
    Participant::Promise promise = spParticipant->prepare(proposal.number);
    if (!promise.granted) {
      log().debug << spParticipant->getId() << " refuses to promise "
                  << proposal.number;
      continue;
    }
    ++promises;
    if (promise.accepted &&
        (!highestAccepted || promise.accepted->number > highestAccepted->number)) {
      highestAccepted = promise.accepted;
    }
  }

  const uint64_t total = ctx.participants.size();
  if (!isQuorumReached(promises, total, ThresholdPolicy::MAJORITY_OVER_HALF)) {
    recordRound(promises, total, false);
    log().warning << "Proposal " << proposal.number << " got " << promises << "/"
                  << total << " promises";
    return Error(E_QUORUM_NOT_REACHED, "Proposal " + std::to_string(proposal.number) +
                                           " got " + std::to_string(promises) + "/" +
                                           std::to_string(total) + " promises");
  }

  if (highestAccepted &&
      highestAccepted->record.getData() != proposal.record.getData()) {
    log().info << "Proposal " << proposal.number << " adopts the value of proposal "
               << highestAccepted->number;
    auto adopted = buildCandidate(ctx, highestAccepted->record.getData());
    if (!adopted) {
      return adopted.error();
    }
    proposal.record = *adopted;
  }
  return proposal;
}

uint64_t Paxos::broadcastAccept(Context &ctx, const Proposal &proposal) {
  uint64_t approvals = 0;
  for (auto &spParticipant : ctx.participants) {
    if (spParticipant->acceptProposal(proposal, mode_)) {
      ++approvals;
    } else {
      log().debug << spParticipant->getId() << " does not accept proposal "
                  << proposal.number;
    }
  }
  return approvals;
}

Paxos::Roe<Record> Paxos::proposeAndCommit(Context &ctx, const std::string &data,
                                           std::optional<uint64_t> proposalNumber) {
  if (!proposalNumber) {
    return Error(E_INVALID_ARGUMENT, "Paxos requires a proposal number");
  }
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "Paxos network has no participants");
  }

  auto candidate = buildCandidate(ctx, data);
  if (!candidate) {
    return candidate;
  }
  Proposal proposal{ *proposalNumber, *candidate, false };
  log().debug << proposer_ << " proposes " << proposal.number << " for record "
              << candidate->getIndex();

  auto prepared = mode_ == ProtocolMode::STRICT ? prepareStrict(ctx, proposal)
                                                : prepareSimplified(ctx, proposal);
  if (!prepared) {
    return prepared.error();
  }

  uint64_t approvals = broadcastAccept(ctx, *prepared);
  auto committed = commitWithQuorum(ctx, prepared->record, approvals,
                                    ThresholdPolicy::MAJORITY_OVER_HALF);
  if (!committed) {
    return committed;
  }

  for (auto &spParticipant : ctx.participants) {
    spParticipant->learn(*prepared);
  }
  if (prepared->number > highestCommitted_) {
    highestCommitted_ = prepared->number;
  }
  return committed;
}

} // namespace consensus
} // namespace ql

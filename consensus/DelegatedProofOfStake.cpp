#include "DelegatedProofOfStake.h"
#include "Utilities.h"

#include <algorithm>

namespace ql {
namespace consensus {

DelegatedProofOfStake::DelegatedProofOfStake(
    std::vector<ParticipantId> delegates,
    std::map<ParticipantId, ParticipantId> votes, DelegateOrdering ordering)
    : ConsensusStrategy("consensus.dpos"), delegates_(std::move(delegates)),
      votes_(std::move(votes)), ordering_(ordering) {}

Record DelegatedProofOfStake::makeGenesis(
    const std::vector<std::unique_ptr<Participant>> &participants) const {
  if (delegates_.empty()) {
    return Ledger::makeGenesis();
  }
  return Ledger::makeGenesis(delegates_.front());
}

DelegatedProofOfStake::Roe<void> DelegatedProofOfStake::attach(Context &ctx) {
  if (delegates_.empty()) {
    return Error(E_NO_DELEGATE, "Delegated proof of stake needs at least one delegate");
  }
  for (const auto &[voter, delegate] : votes_) {
    Participant *participant = findParticipant(ctx, voter);
    if (participant) {
      participant->setVoteTarget(delegate);
    }
  }
  updateRoles(ctx);
  log().info << "Attached delegates [" << utl::join(delegates_, ", ") << "], "
             << votes_.size() << " initial votes, ordering " << toString(ordering_);
  return {};
}

void DelegatedProofOfStake::updateRoles(Context &ctx) const {
  for (auto &spParticipant : ctx.participants) {
    bool isDelegate = std::find(delegates_.begin(), delegates_.end(),
                                spParticipant->getId()) != delegates_.end();
    spParticipant->setRole(isDelegate ? Participant::Role::DELEGATE
                                      : Participant::Role::NONE);
  }
}

DelegatedProofOfStake::Roe<void>
DelegatedProofOfStake::vote(Context &ctx, const ParticipantId &voter,
                            const ParticipantId &delegate) {
  if (voter.empty() || delegate.empty()) {
    return Error(E_INVALID_ARGUMENT, "Voter and delegate must be non-empty");
  }
  auto it = votes_.find(voter);
  if (it != votes_.end() && it->second != delegate) {
    log().debug << voter << " changes vote from " << it->second << " to " << delegate;
  }
  votes_[voter] = delegate;

  Participant *participant = findParticipant(ctx, voter);
  if (participant) {
    participant->setVoteTarget(delegate);
  }
  return {};
}

DelegatedProofOfStake::Roe<void> DelegatedProofOfStake::tally(Context &ctx) {
  voteCounts_.clear();
  for (const auto &[voter, delegate] : votes_) {
    ++voteCounts_[delegate];
  }

  if (voteCounts_.empty()) {
    log().warning << "Tally without votes, keeping delegates ["
                  << utl::join(delegates_, ", ") << "]";
    return {};
  }

  std::vector<ParticipantId> ordered;
  ordered.reserve(voteCounts_.size());
  for (const auto &[delegate, count] : voteCounts_) {
    ordered.push_back(delegate);
  }

  ctx.random.shuffle(ordered);
  if (ordering_ == DelegateOrdering::VOTE_WEIGHTED) {
    // Stable sort keeps the shuffled order within ties
    std::stable_sort(ordered.begin(), ordered.end(),
                     [this](const ParticipantId &a, const ParticipantId &b) {
                       return voteCounts_.at(a) > voteCounts_.at(b);
                     });
  }

  delegates_ = std::move(ordered);
  updateRoles(ctx);
  log().info << "Tallied " << votes_.size() << " votes, delegates now ["
             << utl::join(delegates_, ", ") << "]";
  return {};
}

DelegatedProofOfStake::Roe<ParticipantId>
DelegatedProofOfStake::selectDelegate(Context &ctx) const {
  if (delegates_.empty()) {
    return Error(E_NO_DELEGATE, "Delegate list is empty");
  }
  return delegates_[ctx.random.uniform(delegates_.size())];
}

DelegatedProofOfStake::Roe<Record>
DelegatedProofOfStake::proposeAndCommit(Context &ctx, const std::string &data,
                                        std::optional<uint64_t> proposalNumber) {
  if (proposalNumber) {
    log().debug << "Ignoring proposal number " << *proposalNumber;
  }
  auto delegate = selectDelegate(ctx);
  if (!delegate) {
    return delegate.error();
  }
  auto candidate = buildCandidate(ctx, data, *delegate);
  if (!candidate) {
    return candidate;
  }
  return commitUnconditionally(ctx, *candidate);
}

bool DelegatedProofOfStake::validateRecord(const Record &record) const {
  return !record.getProposer().empty() && !record.hasNonce();
}

} // namespace consensus
} // namespace ql

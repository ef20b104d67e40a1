#include "ConsensusStrategy.h"
#include "Utilities.h"

#include <algorithm>

namespace ql {
namespace consensus {

ConsensusStrategy::ConsensusStrategy(const std::string &loggerName)
    : Module(loggerName) {}

Record ConsensusStrategy::makeGenesis(
    const std::vector<std::unique_ptr<Participant>> &participants) const {
  return Ledger::makeGenesis();
}

ConsensusStrategy::Roe<void>
ConsensusStrategy::setStake(Context &ctx, const ParticipantId &id, uint64_t stake) {
  return Error(E_UNSUPPORTED,
               std::string("setStake is not supported by ") + toString(getProtocol()));
}

ConsensusStrategy::Roe<void> ConsensusStrategy::vote(Context &ctx,
                                                     const ParticipantId &voter,
                                                     const ParticipantId &delegate) {
  return Error(E_UNSUPPORTED,
               std::string("vote is not supported by ") + toString(getProtocol()));
}

ConsensusStrategy::Roe<void> ConsensusStrategy::tally(Context &ctx) {
  return Error(E_UNSUPPORTED,
               std::string("tally is not supported by ") + toString(getProtocol()));
}

ConsensusStrategy::Roe<void>
ConsensusStrategy::requestVote(Context &ctx, const ParticipantId &candidate) {
  return Error(E_UNSUPPORTED,
               std::string("requestVote is not supported by ") + toString(getProtocol()));
}

ConsensusStrategy::Roe<Record> ConsensusStrategy::lead(Context &ctx,
                                                       const ParticipantId &caller,
                                                       const std::string &data) {
  return unsupported("lead");
}

ConsensusStrategy::Roe<Record>
ConsensusStrategy::buildCandidate(const Context &ctx, const std::string &data,
                                  const std::string &proposer) const {
  auto tip = ctx.ledger.tip();
  if (!tip) {
    return Error(E_LEDGER, tip.error().message);
  }
  Record::Content content;
  content.index = tip->getIndex() + 1;
  content.timestamp = utl::getCurrentTimeNanos();
  content.data = data;
  content.previousHash = tip->getHash();
  content.proposer = proposer;
  return Record(std::move(content));
}

Participant *ConsensusStrategy::findParticipant(Context &ctx,
                                                const ParticipantId &id) const {
  auto it = std::find_if(ctx.participants.begin(), ctx.participants.end(),
                         [&](const auto &spParticipant) {
                           return spParticipant->getId() == id;
                         });
  return it == ctx.participants.end() ? nullptr : it->get();
}

uint64_t ConsensusStrategy::collectVerifications(Context &ctx,
                                                 const Record &candidate) const {
  uint64_t approvals = 0;
  for (const auto &spParticipant : ctx.participants) {
    if (spParticipant->verifyRecord(candidate, ctx.ledger)) {
      ++approvals;
    } else {
      log().debug << "Participant " << spParticipant->getId() << " rejected record "
                  << candidate.getIndex();
    }
  }
  return approvals;
}

ConsensusStrategy::Roe<Record>
ConsensusStrategy::commitWithQuorum(Context &ctx, const Record &candidate,
                                    uint64_t approvals, ThresholdPolicy policy) {
  const uint64_t total = ctx.participants.size();
  if (!isQuorumReached(approvals, total, policy)) {
    recordRound(approvals, total, false);
    log().warning << "Quorum not reached for record " << candidate.getIndex() << ": "
                  << approvals << "/" << total << " approvals, "
                  << getMinimumApprovals(total, policy) << " required ("
                  << toString(policy) << ")";
    return Error(E_QUORUM_NOT_REACHED,
                 "Quorum not reached: " + std::to_string(approvals) + "/" +
                     std::to_string(total) + " approvals");
  }

  auto check = ctx.ledger.checkAppend(candidate);
  if (!check) {
    recordRound(approvals, total, false);
    return Error(E_LEDGER, check.error().message);
  }

  for (auto &spParticipant : ctx.participants) {
    spParticipant->onCommit(candidate);
  }
  auto appended = ctx.ledger.append(candidate);
  if (!appended) {
    recordRound(approvals, total, false);
    return Error(E_LEDGER, appended.error().message);
  }

  recordRound(approvals, total, true);
  log().info << "Committed record " << candidate.getIndex() << " with " << approvals
             << "/" << total << " approvals";
  return candidate;
}

ConsensusStrategy::Roe<Record>
ConsensusStrategy::commitUnconditionally(Context &ctx, const Record &candidate) {
  auto appended = ctx.ledger.append(candidate);
  if (!appended) {
    recordRound(0, ctx.participants.size(), false);
    return Error(E_LEDGER, appended.error().message);
  }
  for (auto &spParticipant : ctx.participants) {
    spParticipant->onCommit(candidate);
  }
  recordRound(0, ctx.participants.size(), true);
  log().info << "Committed record " << candidate.getIndex()
             << (candidate.getProposer().empty() ? ""
                                                  : " proposed by " + candidate.getProposer());
  return candidate;
}

void ConsensusStrategy::recordRound(uint64_t approvals, uint64_t total,
                                    bool committed) {
  lastRound_.round += 1;
  lastRound_.approvals = approvals;
  lastRound_.total = total;
  lastRound_.committed = committed;
}

ConsensusStrategy::Roe<Record>
ConsensusStrategy::unsupported(const std::string &operation) const {
  return Error(E_UNSUPPORTED, operation + " is not supported by " +
                                  toString(getProtocol()));
}

} // namespace consensus
} // namespace ql

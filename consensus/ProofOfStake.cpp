#include "ProofOfStake.h"

#include <algorithm>
#include <limits>

namespace ql {
namespace consensus {

ProofOfStake::ProofOfStake() : ConsensusStrategy("consensus.pos") {}

Record ProofOfStake::makeGenesis(
    const std::vector<std::unique_ptr<Participant>> &participants) const {
  if (participants.empty()) {
    return Ledger::makeGenesis();
  }
  return Ledger::makeGenesis(participants.front()->getId());
}

ProofOfStake::Roe<void> ProofOfStake::attach(Context &ctx) {
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "Proof of stake needs at least one validator");
  }
  uint64_t total = 0;
  for (const auto &spParticipant : ctx.participants) {
    auto sum = addStake(total, spParticipant->getStake());
    if (!sum) {
      return sum.error();
    }
    total = *sum;
  }
  validators_.clear();
  for (auto &spParticipant : ctx.participants) {
    spParticipant->setRole(Participant::Role::VALIDATOR);
    validators_.push_back(spParticipant->getId());
  }
  log().info << "Attached " << validators_.size() << " validators, total stake "
             << total;
  return {};
}

ProofOfStake::Roe<uint64_t> ProofOfStake::addStake(uint64_t total, uint64_t stake) {
  if (stake > std::numeric_limits<uint64_t>::max() - total) {
    return Error(E_INVALID_CONFIG, "Total stake exceeds " +
                                       std::to_string(std::numeric_limits<uint64_t>::max()));
  }
  return total + stake;
}

uint64_t ProofOfStake::getTotalStake(const Context &ctx) const {
  uint64_t total = 0;
  for (const auto &spParticipant : ctx.participants) {
    total += spParticipant->getStake();
  }
  return total;
}

std::vector<Stakeholder> ProofOfStake::getStakeholders(const Context &ctx) const {
  std::vector<Stakeholder> stakeholders;
  stakeholders.reserve(ctx.participants.size());
  for (const auto &spParticipant : ctx.participants) {
    stakeholders.push_back({ spParticipant->getId(), spParticipant->getStake() });
  }
  return stakeholders;
}

ProofOfStake::Roe<ParticipantId> ProofOfStake::selectProposer(Context &ctx) const {
  uint64_t totalStake = getTotalStake(ctx);
  if (totalStake == 0) {
    return Error(E_NO_STAKE, "Total stake is zero");
  }

  uint64_t draw = ctx.random.uniform(totalStake);
  uint64_t cumulative = 0;
  for (const auto &spParticipant : ctx.participants) {
    cumulative += spParticipant->getStake();
    if (cumulative > draw) {
      log().debug << "Draw " << draw << "/" << totalStake << " selects "
                  << spParticipant->getId();
      return spParticipant->getId();
    }
  }

  // Unreachable while draw < totalStake
  return Error(E_NO_STAKE, "Stake walk ended without a proposer");
}

ProofOfStake::Roe<Record>
ProofOfStake::proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) {
  if (proposalNumber) {
    log().debug << "Ignoring proposal number " << *proposalNumber;
  }
  auto proposer = selectProposer(ctx);
  if (!proposer) {
    log().warning << "No proposer: " << proposer.error().message;
    return proposer.error();
  }
  auto candidate = buildCandidate(ctx, data, *proposer);
  if (!candidate) {
    return candidate;
  }
  return commitUnconditionally(ctx, *candidate);
}

ProofOfStake::Roe<void> ProofOfStake::setStake(Context &ctx, const ParticipantId &id,
                                               uint64_t stake) {
  Participant *participant = findParticipant(ctx, id);
  if (!participant) {
    return Error(E_UNKNOWN_PARTICIPANT, "Unknown participant: " + id);
  }
  uint64_t total = stake;
  for (const auto &spParticipant : ctx.participants) {
    if (spParticipant.get() == participant) {
      continue;
    }
    auto sum = addStake(total, spParticipant->getStake());
    if (!sum) {
      log().warning << "Stake of " << id << " rejected: " << sum.error().message;
      return sum.error();
    }
    total = *sum;
  }
  participant->setStake(stake);
  log().info << "Stake of " << id << " set to " << stake;
  return {};
}

bool ProofOfStake::validateRecord(const Record &record) const {
  if (record.getProposer().empty()) {
    return false;
  }
  return std::find(validators_.begin(), validators_.end(), record.getProposer()) !=
         validators_.end();
}

} // namespace consensus
} // namespace ql

#include "Network.h"
#include "DelegatedProofOfStake.h"
#include "Paxos.h"
#include "Pbft.h"
#include "ProofOfStake.h"
#include "ProofOfWork.h"
#include "Raft.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace ql {
namespace consensus {

namespace {

ConsensusStrategy &requireStrategy(const std::unique_ptr<ConsensusStrategy> &spStrategy) {
  if (!spStrategy) {
    throw std::invalid_argument("Network requires a consensus strategy");
  }
  return *spStrategy;
}

RandomSource makeRandom(std::optional<uint64_t> seed) {
  return seed ? RandomSource(*seed) : RandomSource();
}

} // namespace

Network::Network(std::vector<std::unique_ptr<Participant>> participants,
                 std::unique_ptr<ConsensusStrategy> spStrategy,
                 std::optional<uint64_t> seed)
    : Module("network"), participants_(std::move(participants)),
      spStrategy_(std::move(spStrategy)), random_(makeRandom(seed)),
      ledger_(requireStrategy(spStrategy_).makeGenesis(participants_)) {}

ConsensusStrategy::Context Network::makeContext() {
  return ConsensusStrategy::Context{ ledger_, participants_, random_ };
}

Network::Roe<void> Network::start() {
  if (started_) {
    return {};
  }
  std::set<ParticipantId> ids;
  for (const auto &spParticipant : participants_) {
    if (!ids.insert(spParticipant->getId()).second) {
      return Error(ConsensusStrategy::E_INVALID_CONFIG,
                   "Duplicate participant id: " + spParticipant->getId());
    }
  }

  auto ctx = makeContext();
  auto result = spStrategy_->attach(ctx);
  if (!result) {
    log().error << "Failed to start " << toString(getProtocol())
                << " network: " << result.error().message;
    return result;
  }
  started_ = true;
  log().info << "Started " << toString(getProtocol()) << " network with "
             << participants_.size() << " participants, seed " << random_.getSeed();
  return {};
}

Network::Roe<void> Network::ensureStarted() const {
  if (!started_) {
    return Error(ConsensusStrategy::E_INVALID_CONFIG, "Network has not been started");
  }
  return {};
}

const Participant *Network::getParticipant(const ParticipantId &id) const {
  auto it = std::find_if(participants_.begin(), participants_.end(),
                         [&](const auto &spParticipant) {
                           return spParticipant->getId() == id;
                         });
  return it == participants_.end() ? nullptr : it->get();
}

bool Network::verifyLedger() const {
  if (!ledger_.isValid()) {
    return false;
  }
  const auto &records = ledger_.getRecords();
  return std::all_of(records.begin(), records.end(), [this](const Record &record) {
    return spStrategy_->validateRecord(record);
  });
}

Network::Roe<Record> Network::addRecord(const std::string &data) {
  auto started = ensureStarted();
  if (!started) {
    return started.error();
  }
  auto ctx = makeContext();
  return spStrategy_->proposeAndCommit(ctx, data, std::nullopt);
}

Network::Roe<Record> Network::runConsensusRound(const std::string &data) {
  return addRecord(data);
}

Network::Roe<Record> Network::runConsensusRound(const std::string &data,
                                                uint64_t proposalNumber) {
  auto started = ensureStarted();
  if (!started) {
    return started.error();
  }
  auto ctx = makeContext();
  return spStrategy_->proposeAndCommit(ctx, data, proposalNumber);
}

Network::Roe<void> Network::setStake(const ParticipantId &id, uint64_t stake) {
  auto started = ensureStarted();
  if (!started) {
    return started;
  }
  auto ctx = makeContext();
  return spStrategy_->setStake(ctx, id, stake);
}

Network::Roe<void> Network::vote(const ParticipantId &voter,
                                 const ParticipantId &delegate) {
  auto started = ensureStarted();
  if (!started) {
    return started;
  }
  auto ctx = makeContext();
  return spStrategy_->vote(ctx, voter, delegate);
}

Network::Roe<void> Network::tallyVotes() {
  auto started = ensureStarted();
  if (!started) {
    return started;
  }
  auto ctx = makeContext();
  return spStrategy_->tally(ctx);
}

Network::Roe<void> Network::requestVote(const ParticipantId &candidate) {
  auto started = ensureStarted();
  if (!started) {
    return started;
  }
  auto ctx = makeContext();
  return spStrategy_->requestVote(ctx, candidate);
}

Network::Roe<Record> Network::lead(const std::string &data) {
  auto leader = getLeader();
  if (!leader) {
    return Error(ConsensusStrategy::E_NOT_LEADER, "No leader elected");
  }
  return lead(*leader, data);
}

Network::Roe<Record> Network::lead(const ParticipantId &caller,
                                   const std::string &data) {
  auto started = ensureStarted();
  if (!started) {
    return started.error();
  }
  auto ctx = makeContext();
  return spStrategy_->lead(ctx, caller, data);
}

// ----- factories -----

namespace {

Network::Roe<std::unique_ptr<Network>>
startNetwork(std::vector<std::unique_ptr<Participant>> participants,
             std::unique_ptr<ConsensusStrategy> spStrategy,
             std::optional<uint64_t> seed) {
  auto spNetwork = std::make_unique<Network>(std::move(participants),
                                             std::move(spStrategy), seed);
  auto started = spNetwork->start();
  if (!started) {
    return started.error();
  }
  return spNetwork;
}

Network::Roe<void> requirePositiveSize(uint64_t size) {
  if (size == 0) {
    return Network::Error(ConsensusStrategy::E_INVALID_CONFIG,
                          "Network size must be at least 1");
  }
  return {};
}

} // namespace

std::vector<std::unique_ptr<Participant>> makeParticipants(uint64_t size) {
  std::vector<std::unique_ptr<Participant>> participants;
  participants.reserve(size);
  for (uint64_t i = 0; i < size; ++i) {
    participants.push_back(std::make_unique<Participant>("node-" + std::to_string(i)));
  }
  return participants;
}

Network::Roe<std::unique_ptr<Network>> makePowNetwork(uint32_t difficulty,
                                                      std::optional<uint64_t> seed) {
  auto valid = ProofOfWork::validateDifficulty(difficulty);
  if (!valid) {
    return valid.error();
  }
  std::vector<std::unique_ptr<Participant>> participants;
  participants.push_back(std::make_unique<Participant>("miner-0"));
  return startNetwork(std::move(participants),
                      std::make_unique<ProofOfWork>(difficulty), seed);
}

Network::Roe<std::unique_ptr<Network>>
makePosNetwork(const std::vector<ParticipantId> &participantIds,
               const std::map<ParticipantId, uint64_t> &stakes,
               std::optional<uint64_t> seed) {
  if (participantIds.empty()) {
    return Network::Error(ConsensusStrategy::E_INVALID_CONFIG,
                          "Proof of stake needs at least one participant");
  }
  uint64_t total = 0;
  for (const auto &[id, stake] : stakes) {
    if (std::find(participantIds.begin(), participantIds.end(), id) ==
        participantIds.end()) {
      return Network::Error(ConsensusStrategy::E_UNKNOWN_PARTICIPANT,
                            "Stake given for unknown participant: " + id);
    }
    auto sum = ProofOfStake::addStake(total, stake);
    if (!sum) {
      return sum.error();
    }
    total = *sum;
  }

  std::vector<std::unique_ptr<Participant>> participants;
  for (const auto &id : participantIds) {
    auto spParticipant = std::make_unique<Participant>(id);
    auto it = stakes.find(id);
    if (it != stakes.end()) {
      spParticipant->setStake(it->second);
    }
    participants.push_back(std::move(spParticipant));
  }
  return startNetwork(std::move(participants), std::make_unique<ProofOfStake>(), seed);
}

Network::Roe<std::unique_ptr<Network>>
makeDposNetwork(const std::vector<ParticipantId> &delegates,
                const std::map<ParticipantId, ParticipantId> &votes,
                DelegateOrdering ordering, std::optional<uint64_t> seed) {
  if (delegates.empty()) {
    return Network::Error(ConsensusStrategy::E_INVALID_CONFIG,
                          "Delegated proof of stake needs at least one delegate");
  }
  std::vector<std::unique_ptr<Participant>> participants;
  for (const auto &id : delegates) {
    participants.push_back(std::make_unique<Participant>(id));
  }
  return startNetwork(std::move(participants),
                      std::make_unique<DelegatedProofOfStake>(delegates, votes, ordering),
                      seed);
}

Network::Roe<std::unique_ptr<Network>> makePbftNetwork(uint64_t size,
                                                       std::optional<uint64_t> seed) {
  auto valid = requirePositiveSize(size);
  if (!valid) {
    return valid.error();
  }
  return startNetwork(makeParticipants(size), std::make_unique<Pbft>(), seed);
}

Network::Roe<std::unique_ptr<Network>>
makeRaftNetwork(uint64_t size, ProtocolMode mode, std::optional<uint64_t> seed) {
  auto valid = requirePositiveSize(size);
  if (!valid) {
    return valid.error();
  }
  return startNetwork(makeParticipants(size), std::make_unique<Raft>(mode), seed);
}

Network::Roe<std::unique_ptr<Network>>
makePaxosNetwork(uint64_t size, ProtocolMode mode, std::optional<uint64_t> seed) {
  auto valid = requirePositiveSize(size);
  if (!valid) {
    return valid.error();
  }
  return startNetwork(makeParticipants(size), std::make_unique<Paxos>(mode), seed);
}

Network::Roe<std::unique_ptr<Network>> makeNetwork(const NetworkConfig &config) {
  auto valid = config.validate();
  if (!valid) {
    return Network::Error(ConsensusStrategy::E_INVALID_CONFIG, valid.error().message);
  }

  switch (config.protocol) {
  case Protocol::POW:
    return makePowNetwork(config.difficulty, config.seed);
  case Protocol::POS: {
    std::vector<ParticipantId> ids;
    std::map<ParticipantId, uint64_t> stakes;
    for (const auto &stakeholder : config.stakeholders) {
      ids.push_back(stakeholder.id);
      stakes[stakeholder.id] = stakeholder.stake;
    }
    return makePosNetwork(ids, stakes, config.seed);
  }
  case Protocol::DPOS:
    return makeDposNetwork(config.delegates, config.votes, config.ordering, config.seed);
  case Protocol::PBFT:
    return makePbftNetwork(config.size, config.seed);
  case Protocol::RAFT:
    return makeRaftNetwork(config.size, config.mode, config.seed);
  case Protocol::PAXOS:
    return makePaxosNetwork(config.size, config.mode, config.seed);
  }
  return Network::Error(ConsensusStrategy::E_UNSUPPORTED, "Unknown protocol");
}

} // namespace consensus
} // namespace ql

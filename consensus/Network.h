#pragma once

#include "ConsensusStrategy.h"
#include "Ledger.h"
#include "Module.h"
#include "NetworkConfig.h"
#include "Participant.h"
#include "RandomSource.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ql {
namespace consensus {

/**
 * A fixed set of participants plus the active consensus strategy.
 *
 * The Network owns the single Ledger, the participants, the strategy and
 * the random source for its whole life. Every entry point is synchronous:
 * when it returns, the ledger has either grown by exactly one record or is
 * unchanged and an error explains why.
 */
class Network : public Module {
public:
  using Error = ConsensusStrategy::Error;
  template <typename T> using Roe = ConsensusStrategy::Roe<T>;

  /**
   * @param participants Participants in enumeration order, ids unique
   * @param spStrategy Strategy to run; it also supplies the genesis record
   * @param seed Seed of the random source, random when unset
   */
  Network(std::vector<std::unique_ptr<Participant>> participants,
          std::unique_ptr<ConsensusStrategy> spStrategy,
          std::optional<uint64_t> seed = std::nullopt);
  ~Network() override = default;

  /**
   * Bind the strategy to the participants; must succeed before any round
   */
  Roe<void> start();

  // ----- accessors -----
  const Ledger &getLedger() const { return ledger_; }
  const std::vector<std::unique_ptr<Participant>> &getParticipants() const {
    return participants_;
  }
  const Participant *getParticipant(const ParticipantId &id) const;
  Protocol getProtocol() const { return spStrategy_->getProtocol(); }
  const ConsensusStrategy &getStrategy() const { return *spStrategy_; }
  std::optional<ParticipantId> getLeader() const { return spStrategy_->getLeader(); }
  const RoundStats &getLastRound() const { return spStrategy_->getLastRound(); }
  uint64_t getSeed() const { return random_.getSeed(); }

  /**
   * Chain integrity plus the protocol rule of every record
   */
  bool verifyLedger() const;

  // ----- methods -----
  Roe<Record> addRecord(const std::string &data);
  Roe<Record> runConsensusRound(const std::string &data);
  Roe<Record> runConsensusRound(const std::string &data, uint64_t proposalNumber);
  Roe<void> setStake(const ParticipantId &id, uint64_t stake);
  Roe<void> vote(const ParticipantId &voter, const ParticipantId &delegate);
  Roe<void> tallyVotes();
  Roe<void> requestVote(const ParticipantId &candidate);
  Roe<Record> lead(const std::string &data);
  Roe<Record> lead(const ParticipantId &caller, const std::string &data);

private:
  ConsensusStrategy::Context makeContext();
  Roe<void> ensureStarted() const;

  std::vector<std::unique_ptr<Participant>> participants_;
  std::unique_ptr<ConsensusStrategy> spStrategy_;
  RandomSource random_;
  Ledger ledger_;
  bool started_{ false };
};

// Sized networks name their participants node-0, node-1, ...
std::vector<std::unique_ptr<Participant>> makeParticipants(uint64_t size);

Network::Roe<std::unique_ptr<Network>>
makePowNetwork(uint32_t difficulty = 4, std::optional<uint64_t> seed = std::nullopt);

Network::Roe<std::unique_ptr<Network>>
makePosNetwork(const std::vector<ParticipantId> &participants,
               const std::map<ParticipantId, uint64_t> &stakes,
               std::optional<uint64_t> seed = std::nullopt);

Network::Roe<std::unique_ptr<Network>>
makeDposNetwork(const std::vector<ParticipantId> &delegates,
                const std::map<ParticipantId, ParticipantId> &votes,
                DelegateOrdering ordering = DelegateOrdering::SHUFFLE,
                std::optional<uint64_t> seed = std::nullopt);

Network::Roe<std::unique_ptr<Network>>
makePbftNetwork(uint64_t size, std::optional<uint64_t> seed = std::nullopt);

Network::Roe<std::unique_ptr<Network>>
makeRaftNetwork(uint64_t size, ProtocolMode mode = ProtocolMode::SIMPLIFIED,
                std::optional<uint64_t> seed = std::nullopt);

Network::Roe<std::unique_ptr<Network>>
makePaxosNetwork(uint64_t size, ProtocolMode mode = ProtocolMode::SIMPLIFIED,
                 std::optional<uint64_t> seed = std::nullopt);

Network::Roe<std::unique_ptr<Network>> makeNetwork(const NetworkConfig &config);

} // namespace consensus
} // namespace ql

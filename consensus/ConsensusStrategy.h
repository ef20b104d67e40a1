#pragma once

#include "Ledger.h"
#include "Module.h"
#include "Participant.h"
#include "Quorum.h"
#include "RandomSource.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ql {
namespace consensus {

/**
 * Common interface of the six consensus protocols.
 *
 * A strategy is stateless with respect to the ledger and participants: the
 * Network hands them in through a Context on every call. A strategy decides
 * the next Record, collects whatever proof or quorum its protocol needs and
 * then performs exactly one Ledger::append, or leaves the ledger untouched
 * and returns an error.
 */
class ConsensusStrategy : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Usage errors (1-9)
  constexpr static int32_t E_UNSUPPORTED = 1;         // Operation not offered by this protocol
  constexpr static int32_t E_INVALID_CONFIG = 2;      // Bad construction parameters
  constexpr static int32_t E_UNKNOWN_PARTICIPANT = 3; // Participant id not in network
  constexpr static int32_t E_NO_PARTICIPANTS = 4;     // Network has no participants
  constexpr static int32_t E_INVALID_ARGUMENT = 5;    // Bad call argument

  // Selection errors (10-19)
  constexpr static int32_t E_NO_STAKE = 10;    // PoS total stake is zero
  constexpr static int32_t E_NO_DELEGATE = 11; // DPoS delegate list is empty

  // Role errors (20-29)
  constexpr static int32_t E_NOT_LEADER = 20; // Caller is not the Raft leader

  // Agreement errors (30-39)
  constexpr static int32_t E_QUORUM_NOT_REACHED = 30; // Proposal dropped

  // Ledger errors (40-49)
  constexpr static int32_t E_LEDGER = 40; // Ledger rejected the append

  struct Context {
    Ledger &ledger;
    std::vector<std::unique_ptr<Participant>> &participants;
    RandomSource &random;
  };

  explicit ConsensusStrategy(const std::string &loggerName);
  ~ConsensusStrategy() override = default;

  virtual Protocol getProtocol() const = 0;

  /**
   * Genesis record for a ledger run by this strategy
   */
  virtual Record makeGenesis(
      const std::vector<std::unique_ptr<Participant>> &participants) const;

  /**
   * Called once when the strategy is bound to a network; assigns roles
   */
  virtual Roe<void> attach(Context &ctx) = 0;

  /**
   * Run one full round for `data`. `proposalNumber` is only meaningful to
   * Paxos; other protocols ignore it.
   */
  virtual Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                                       std::optional<uint64_t> proposalNumber) = 0;

  // Protocol-specific capabilities; unsupported by default
  virtual Roe<void> setStake(Context &ctx, const ParticipantId &id, uint64_t stake);
  virtual Roe<void> vote(Context &ctx, const ParticipantId &voter,
                         const ParticipantId &delegate);
  virtual Roe<void> tally(Context &ctx);
  virtual Roe<void> requestVote(Context &ctx, const ParticipantId &candidate);
  virtual Roe<Record> lead(Context &ctx, const ParticipantId &caller,
                           const std::string &data);

  /**
   * Participant currently in charge of proposing, if the protocol has one
   */
  virtual std::optional<ParticipantId> getLeader() const { return std::nullopt; }

  /**
   * Protocol rule a committed Record must satisfy beyond chain linkage
   */
  virtual bool validateRecord(const Record &record) const { return true; }

  const RoundStats &getLastRound() const { return lastRound_; }

protected:
  Roe<Record> buildCandidate(const Context &ctx, const std::string &data,
                             const std::string &proposer = "") const;

  Participant *findParticipant(Context &ctx, const ParticipantId &id) const;

  /**
   * Ask every participant to verify `candidate`; returns the approval count
   */
  uint64_t collectVerifications(Context &ctx, const Record &candidate) const;

  /**
   * Evaluate the quorum, then notify every participant and append once.
   * On a failed quorum the candidate is dropped and the ledger is unchanged.
   */
  Roe<Record> commitWithQuorum(Context &ctx, const Record &candidate,
                               uint64_t approvals, ThresholdPolicy policy);

  /**
   * Append without a vote (PoW, PoS, DPoS)
   */
  Roe<Record> commitUnconditionally(Context &ctx, const Record &candidate);

  void recordRound(uint64_t approvals, uint64_t total, bool committed);

  Roe<Record> unsupported(const std::string &operation) const;

private:
  RoundStats lastRound_;
};

} // namespace consensus
} // namespace ql

#pragma once

#include "Ledger.h"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ql {
namespace consensus {

/**
 * An actor of a consensus protocol.
 *
 * Holds the role-specific state every protocol needs (stake, vote target,
 * Raft term, Paxos promises) and answers the protocol callbacks. Callbacks
 * are virtual so that a participant with different behavior can be plugged
 * into a Network.
 */
class Participant {
public:
  enum class Role {
    NONE,
    MINER,
    VALIDATOR,
    DELEGATE,
    PRIMARY,
    REPLICA,
    FOLLOWER,
    CANDIDATE,
    LEADER,
    PROPOSER,
    ACCEPTOR
  };

  // Answer to a strict Paxos prepare request
  struct Promise {
    bool granted{ false };
    std::optional<Proposal> accepted; // highest proposal accepted so far
  };

  explicit Participant(ParticipantId id, Role role = Role::NONE);
  virtual ~Participant() = default;

  // ----- accessors -----
  const ParticipantId &getId() const { return id_; }
  Role getRole() const { return role_; }
  uint64_t getStake() const { return stake_; }
  const ParticipantId &getVoteTarget() const { return voteTarget_; }
  uint64_t getTerm() const { return term_; }
  const ParticipantId &getVotedFor() const { return votedFor_; }
  uint64_t getLastCommittedIndex() const { return lastCommittedIndex_; }
  const std::vector<Proposal> &getProposals() const { return proposals_; }
  uint64_t getPromisedNumber() const { return promisedNumber_; }
  const std::optional<Proposal> &getAcceptedProposal() const { return accepted_; }

  void setRole(Role role) { role_ = role; }
  void setStake(uint64_t stake) { stake_ = stake; }
  void setVoteTarget(const ParticipantId &target) { voteTarget_ = target; }

  // ----- PBFT / Raft -----
  /**
   * Prepare-phase check: the candidate extends the current tip and its self
   * hash recomputes. The answer doubles as this participant's vote.
   */
  virtual bool verifyRecord(const Record &candidate, const Ledger &ledger) const;

  /**
   * Raft append check. In STRICT mode entries from a leader whose term is
   * behind this participant's term are refused.
   */
  virtual bool acceptEntries(const Record &candidate, uint64_t leaderTerm,
                             const Ledger &ledger, ProtocolMode mode);

  // ----- Raft election -----
  void startElection();
  void becomeLeader();
  void stepDown();
  virtual bool voteFor(const ParticipantId &candidate, uint64_t candidateTerm,
                       uint64_t candidateLastIndex, ProtocolMode mode);

  // ----- Paxos -----
  // Remember a proposal delivered by the proposer (simplified prepare)
  virtual void recordProposal(const Proposal &proposal);
  virtual Promise prepare(uint64_t number);
  virtual bool acceptProposal(const Proposal &proposal, ProtocolMode mode);
  // Drop proposals settled by the commit of `proposal`
  void learn(const Proposal &proposal);

  // ----- all protocols -----
  virtual void onCommit(const Record &record);

private:
  ParticipantId id_;
  Role role_{ Role::NONE };
  uint64_t stake_{ 0 };
  ParticipantId voteTarget_;

  uint64_t term_{ 0 };
  ParticipantId votedFor_;

  std::vector<Proposal> proposals_;
  uint64_t promisedNumber_{ 0 };
  std::optional<Proposal> accepted_;

  uint64_t lastCommittedIndex_{ 0 };
};

const char *toString(Participant::Role role);

} // namespace consensus
} // namespace ql

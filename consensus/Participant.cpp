#include "Participant.h"

#include <algorithm>

namespace ql {
namespace consensus {

Participant::Participant(ParticipantId id, Role role)
    : id_(std::move(id)), role_(role) {}

bool Participant::verifyRecord(const Record &candidate, const Ledger &ledger) const {
  auto tip = ledger.tip();
  if (!tip) {
    return false;
  }
  if (candidate.getPreviousHash() != tip->getHash()) {
    return false;
  }
  return candidate.isHashValid();
}

bool Participant::acceptEntries(const Record &candidate, uint64_t leaderTerm,
                                const Ledger &ledger, ProtocolMode mode) {
  if (mode == ProtocolMode::STRICT) {
    if (leaderTerm < term_) {
      return false;
    }
    term_ = leaderTerm;
  }
  return verifyRecord(candidate, ledger);
}

void Participant::startElection() {
  role_ = Role::CANDIDATE;
  ++term_;
  votedFor_ = id_;
}

void Participant::becomeLeader() { role_ = Role::LEADER; }

void Participant::stepDown() { role_ = Role::FOLLOWER; }

bool Participant::voteFor(const ParticipantId &candidate, uint64_t candidateTerm,
                          uint64_t candidateLastIndex, ProtocolMode mode) {
  if (mode == ProtocolMode::SIMPLIFIED) {
    return true;
  }

  if (candidateTerm < term_) {
    return false;
  }
  if (candidateTerm > term_) {
    term_ = candidateTerm;
    votedFor_.clear();
    if (candidate != id_ && role_ != Role::FOLLOWER) {
      role_ = Role::FOLLOWER;
    }
  }
  if (!votedFor_.empty() && votedFor_ != candidate) {
    return false;
  }
  if (candidateLastIndex < lastCommittedIndex_) {
    return false;
  }
  votedFor_ = candidate;
  return true;
}

void Participant::recordProposal(const Proposal &proposal) {
  proposals_.push_back(proposal);
}

Participant::Promise Participant::prepare(uint64_t number) {
  Promise promise;
  if (number <= promisedNumber_) {
    return promise;
  }
  promisedNumber_ = number;
  promise.granted = true;
  promise.accepted = accepted_;
  return promise;
}

bool Participant::acceptProposal(const Proposal &proposal, ProtocolMode mode) {
  if (mode == ProtocolMode::SIMPLIFIED) {
    auto it = std::find_if(proposals_.begin(), proposals_.end(),
                           [&](const Proposal &p) { return p.number == proposal.number; });
    if (it == proposals_.end()) {
      return false;
    }
    it->accepted = true;
    return true;
  }

  if (proposal.number < promisedNumber_) {
    return false;
  }
  promisedNumber_ = proposal.number;
  accepted_ = proposal;
  accepted_->accepted = true;
  return true;
}

void Participant::learn(const Proposal &proposal) {
  proposals_.erase(std::remove_if(proposals_.begin(), proposals_.end(),
                                  [&](const Proposal &p) { return p.number <= proposal.number; }),
                   proposals_.end());
  accepted_.reset();
}

void Participant::onCommit(const Record &record) {
  lastCommittedIndex_ = record.getIndex();
}

const char *toString(Participant::Role role) {
  switch (role) {
  case Participant::Role::NONE:
    return "none";
  case Participant::Role::MINER:
    return "miner";
  case Participant::Role::VALIDATOR:
    return "validator";
  case Participant::Role::DELEGATE:
    return "delegate";
  case Participant::Role::PRIMARY:
    return "primary";
  case Participant::Role::REPLICA:
    return "replica";
  case Participant::Role::FOLLOWER:
    return "follower";
  case Participant::Role::CANDIDATE:
    return "candidate";
  case Participant::Role::LEADER:
    return "leader";
  case Participant::Role::PROPOSER:
    return "proposer";
  case Participant::Role::ACCEPTOR:
    return "acceptor";
  }
  return "unknown";
}

} // namespace consensus
} // namespace ql

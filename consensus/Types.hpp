#pragma once

#include "Record.h"

#include <cstdint>
#include <string>

namespace ql {
namespace consensus {

using ParticipantId = std::string;

enum class Protocol { POW, POS, DPOS, PBFT, RAFT, PAXOS };

/**
 * SIMPLIFIED keeps the classroom behavior (unconditional Raft votes, Paxos
 * acceptance by number match). STRICT adds term/ballot tracking.
 */
enum class ProtocolMode { SIMPLIFIED, STRICT };

/**
 * How DPoS orders delegates after a tally.
 * SHUFFLE: random order of every voted-for delegate, counts ignored.
 * VOTE_WEIGHTED: most votes first, random order within ties.
 */
enum class DelegateOrdering { SHUFFLE, VOTE_WEIGHTED };

struct Stakeholder {
  ParticipantId id;
  uint64_t stake{ 0 };
};

/**
 * Candidate Record plus protocol bookkeeping (Paxos, PBFT, Raft)
 */
struct Proposal {
  uint64_t number{ 0 };
  Record record;
  bool accepted{ false };
};

/**
 * Outcome of the most recent consensus round of a strategy
 */
struct RoundStats {
  uint64_t round{ 0 };
  uint64_t approvals{ 0 };
  uint64_t total{ 0 };
  bool committed{ false };
};

const char *toString(Protocol protocol);
const char *toString(ProtocolMode mode);
const char *toString(DelegateOrdering ordering);

bool parseProtocol(const std::string &name, Protocol &protocol);
bool parseProtocolMode(const std::string &name, ProtocolMode &mode);
bool parseDelegateOrdering(const std::string &name, DelegateOrdering &ordering);

} // namespace consensus
} // namespace ql

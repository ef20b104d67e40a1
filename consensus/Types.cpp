#include "Types.hpp"

#include <algorithm>
#include <cctype>

namespace ql {
namespace consensus {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

const char *toString(Protocol protocol) {
  switch (protocol) {
  case Protocol::POW:
    return "pow";
  case Protocol::POS:
    return "pos";
  case Protocol::DPOS:
    return "dpos";
  case Protocol::PBFT:
    return "pbft";
  case Protocol::RAFT:
    return "raft";
  case Protocol::PAXOS:
    return "paxos";
  }
  return "unknown";
}

const char *toString(ProtocolMode mode) {
  return mode == ProtocolMode::STRICT ? "strict" : "simplified";
}

const char *toString(DelegateOrdering ordering) {
  return ordering == DelegateOrdering::VOTE_WEIGHTED ? "vote-weighted" : "shuffle";
}

bool parseProtocol(const std::string &name, Protocol &protocol) {
  const std::string lower = toLower(name);
  for (auto candidate : {Protocol::POW, Protocol::POS, Protocol::DPOS,
                         Protocol::PBFT, Protocol::RAFT, Protocol::PAXOS}) {
    if (lower == toString(candidate)) {
      protocol = candidate;
      return true;
    }
  }
  return false;
}

bool parseProtocolMode(const std::string &name, ProtocolMode &mode) {
  const std::string lower = toLower(name);
  if (lower == "simplified") {
    mode = ProtocolMode::SIMPLIFIED;
    return true;
  }
  if (lower == "strict") {
    mode = ProtocolMode::STRICT;
    return true;
  }
  return false;
}

bool parseDelegateOrdering(const std::string &name, DelegateOrdering &ordering) {
  const std::string lower = toLower(name);
  if (lower == "shuffle") {
    ordering = DelegateOrdering::SHUFFLE;
    return true;
  }
  if (lower == "vote-weighted" || lower == "weighted") {
    ordering = DelegateOrdering::VOTE_WEIGHTED;
    return true;
  }
  return false;
}

} // namespace consensus
} // namespace ql

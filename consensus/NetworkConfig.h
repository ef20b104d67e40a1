#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ql {
namespace consensus {

/**
 * Everything needed to build a Network, loadable from JSON:
 *
 *   {
 *     "protocol": "pos",
 *     "seed": 42,
 *     "stakeholders": [ { "id": "A", "stake": 60 }, { "id": "B", "stake": 40 } ]
 *   }
 */
struct NetworkConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;

  constexpr static uint64_t DEFAULT_SIZE = 4;

  Protocol protocol{ Protocol::PBFT };
  uint64_t size{ DEFAULT_SIZE };           // PBFT, Raft, Paxos
  uint32_t difficulty{ 4 };                // PoW
  std::optional<uint64_t> seed;            // random when unset
  ProtocolMode mode{ ProtocolMode::SIMPLIFIED };
  DelegateOrdering ordering{ DelegateOrdering::SHUFFLE };
  std::vector<Stakeholder> stakeholders;   // PoS, in enumeration order
  std::vector<ParticipantId> delegates;    // DPoS
  std::map<ParticipantId, ParticipantId> votes; // DPoS, voter -> delegate
  std::string logLevel{ "info" };

  static Roe<NetworkConfig> fromJson(const nlohmann::json &config);
  static Roe<NetworkConfig> loadFile(const std::string &path);

  /**
   * Check the fields the selected protocol relies on
   */
  Roe<void> validate() const;

  // Replace the stake of an existing stakeholder or append a new one
  void setStakeholder(const ParticipantId &id, uint64_t stake);
  // Append a delegate unless already listed
  void addDelegate(const ParticipantId &id);

  nlohmann::json toJson() const;
};

} // namespace consensus
} // namespace ql

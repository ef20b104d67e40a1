#include "NetworkConfig.h"
#include "Logger.h"
#include "ProofOfStake.h"
#include "ProofOfWork.h"
#include "Utilities.h"

#include <algorithm>
#include <set>

namespace ql {
namespace consensus {

namespace {

bool isNonNegativeInteger(const nlohmann::json &value) {
  return value.is_number_unsigned() ||
         (value.is_number_integer() && value.get<int64_t>() >= 0);
}

} // namespace

NetworkConfig::Roe<NetworkConfig>
NetworkConfig::fromJson(const nlohmann::json &config) {
  if (!config.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  NetworkConfig result;

  // Protocol (required)
  if (!config.contains("protocol") || !config["protocol"].is_string()) {
    return Error(E_CONFIG, "Configuration missing 'protocol' field");
  }
  std::string protocolName = config["protocol"].get<std::string>();
  if (!parseProtocol(protocolName, result.protocol)) {
    return Error(E_CONFIG, "Unknown protocol: " + protocolName);
  }

  if (config.contains("size")) {
    if (!isNonNegativeInteger(config["size"])) {
      return Error(E_CONFIG, "'size' must be a non-negative integer");
    }
    result.size = config["size"].get<uint64_t>();
  }

  if (config.contains("difficulty")) {
    if (!isNonNegativeInteger(config["difficulty"])) {
      return Error(E_CONFIG, "'difficulty' must be a non-negative integer");
    }
    uint64_t difficulty = config["difficulty"].get<uint64_t>();
    if (difficulty > ProofOfWork::MAX_DIFFICULTY) {
      return Error(E_CONFIG, "'difficulty' must be between 0 and " +
                                 std::to_string(ProofOfWork::MAX_DIFFICULTY));
    }
    result.difficulty = static_cast<uint32_t>(difficulty);
  }

  if (config.contains("seed")) {
    if (!isNonNegativeInteger(config["seed"])) {
      return Error(E_CONFIG, "'seed' must be a non-negative integer");
    }
    result.seed = config["seed"].get<uint64_t>();
  }

  if (config.contains("mode")) {
    if (!config["mode"].is_string() ||
        !parseProtocolMode(config["mode"].get<std::string>(), result.mode)) {
      return Error(E_CONFIG, "'mode' must be \"simplified\" or \"strict\"");
    }
  }

  if (config.contains("ordering")) {
    if (!config["ordering"].is_string() ||
        !parseDelegateOrdering(config["ordering"].get<std::string>(), result.ordering)) {
      return Error(E_CONFIG, "'ordering' must be \"shuffle\" or \"vote-weighted\"");
    }
  }

  if (config.contains("stakeholders")) {
    if (!config["stakeholders"].is_array()) {
      return Error(E_CONFIG, "'stakeholders' must be an array");
    }
    for (const auto &entry : config["stakeholders"]) {
      if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
        return Error(E_CONFIG, "Each stakeholder needs a string 'id'");
      }
      Stakeholder stakeholder;
      stakeholder.id = entry["id"].get<std::string>();
      if (entry.contains("stake")) {
        if (!isNonNegativeInteger(entry["stake"])) {
          return Error(E_CONFIG, "Stake of " + stakeholder.id +
                                     " must be a non-negative integer");
        }
        stakeholder.stake = entry["stake"].get<uint64_t>();
      }
      result.stakeholders.push_back(stakeholder);
    }
  }

  if (config.contains("delegates")) {
    if (!config["delegates"].is_array()) {
      return Error(E_CONFIG, "'delegates' must be an array");
    }
    for (const auto &delegate : config["delegates"]) {
      if (!delegate.is_string()) {
        return Error(E_CONFIG, "Delegates must be strings");
      }
      result.delegates.push_back(delegate.get<std::string>());
    }
  }

  if (config.contains("votes")) {
    if (!config["votes"].is_object()) {
      return Error(E_CONFIG, "'votes' must be an object of voter: delegate");
    }
    for (const auto &item : config["votes"].items()) {
      if (!item.value().is_string()) {
        return Error(E_CONFIG, "Vote of " + item.key() + " must be a delegate id");
      }
      result.votes[item.key()] = item.value().get<std::string>();
    }
  }

  if (config.contains("logLevel")) {
    if (!config["logLevel"].is_string()) {
      return Error(E_CONFIG, "'logLevel' must be a string");
    }
    result.logLevel = config["logLevel"].get<std::string>();
  }

  auto valid = result.validate();
  if (!valid) {
    return valid.error();
  }
  return result;
}

NetworkConfig::Roe<NetworkConfig> NetworkConfig::loadFile(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CONFIG, jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

NetworkConfig::Roe<void> NetworkConfig::validate() const {
  if (!logging::levelFromString(logLevel)) {
    return Error(E_CONFIG, "Unknown log level: " + logLevel);
  }

  switch (protocol) {
  case Protocol::POW:
    if (difficulty > ProofOfWork::MAX_DIFFICULTY) {
      return Error(E_CONFIG, "'difficulty' must be between 0 and " +
                                 std::to_string(ProofOfWork::MAX_DIFFICULTY));
    }
    break;
  case Protocol::POS: {
    if (stakeholders.empty()) {
      return Error(E_CONFIG, "Proof of stake needs at least one stakeholder");
    }
    std::set<ParticipantId> seen;
    uint64_t total = 0;
    for (const auto &stakeholder : stakeholders) {
      if (!seen.insert(stakeholder.id).second) {
        return Error(E_CONFIG, "Duplicate stakeholder: " + stakeholder.id);
      }
      auto sum = ProofOfStake::addStake(total, stakeholder.stake);
      if (!sum) {
        return Error(E_CONFIG, sum.error().message);
      }
      total = *sum;
    }
    break;
  }
  case Protocol::DPOS: {
    if (delegates.empty()) {
      return Error(E_CONFIG, "Delegated proof of stake needs at least one delegate");
    }
    std::set<ParticipantId> seen;
    for (const auto &delegate : delegates) {
      if (!seen.insert(delegate).second) {
        return Error(E_CONFIG, "Duplicate delegate: " + delegate);
      }
    }
    break;
  }
  case Protocol::PBFT:
  case Protocol::RAFT:
  case Protocol::PAXOS:
    if (size == 0) {
      return Error(E_CONFIG, "'size' must be at least 1");
    }
    break;
  }
  return {};
}

void NetworkConfig::setStakeholder(const ParticipantId &id, uint64_t stake) {
  for (auto &stakeholder : stakeholders) {
    if (stakeholder.id == id) {
      stakeholder.stake = stake;
      return;
    }
  }
  stakeholders.push_back({ id, stake });
}

void NetworkConfig::addDelegate(const ParticipantId &id) {
  if (std::find(delegates.begin(), delegates.end(), id) == delegates.end()) {
    delegates.push_back(id);
  }
}

nlohmann::json NetworkConfig::toJson() const {
  nlohmann::json j;
  j["protocol"] = toString(protocol);
  j["size"] = size;
  j["difficulty"] = difficulty;
  if (seed) {
    j["seed"] = *seed;
  }
  j["mode"] = toString(mode);
  j["ordering"] = toString(ordering);
  j["stakeholders"] = nlohmann::json::array();
  for (const auto &stakeholder : stakeholders) {
    j["stakeholders"].push_back({ { "id", stakeholder.id }, { "stake", stakeholder.stake } });
  }
  j["delegates"] = delegates;
  j["votes"] = nlohmann::json::object();
  for (const auto &[voter, delegate] : votes) {
    j["votes"][voter] = delegate;
  }
  j["logLevel"] = logLevel;
  return j;
}

} // namespace consensus
} // namespace ql

#include "Logger.h"
#include "Network.h"
#include "NetworkConfig.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>
#include <vector>

using ql::consensus::Network;
using ql::consensus::NetworkConfig;
using ql::consensus::Protocol;

namespace {

// Split repeated "key=value" options into pairs
bool parsePairs(const std::vector<std::string> &options,
                std::vector<std::pair<std::string, std::string>> &pairs) {
  for (const auto &option : options) {
    auto pair = ql::utl::parseKeyValue(option);
    if (!pair) {
      std::cerr << "Error: " << pair.error().message << "\n";
      return false;
    }
    pairs.push_back(*pair);
  }
  return true;
}

int runRounds(Network &network, const std::vector<std::string> &data,
              bool tally, const std::string &candidate) {
  auto logger = ql::logging::getLogger("ql-sim");

  if (tally && network.getProtocol() == Protocol::DPOS) {
    auto tallied = network.tallyVotes();
    if (!tallied) {
      std::cerr << "Error: " << tallied.error().message << "\n";
      return 1;
    }
  }

  if (network.getProtocol() == Protocol::RAFT) {
    std::string id = candidate.empty() ? network.getParticipants().front()->getId()
                                       : candidate;
    auto elected = network.requestVote(id);
    if (!elected) {
      std::cerr << "Error: " << elected.error().message << "\n";
      return 1;
    }
  }

  uint64_t proposalNumber = 0;
  for (const auto &payload : data) {
    auto result = network.getProtocol() == Protocol::PAXOS
                      ? network.runConsensusRound(payload, ++proposalNumber)
                      : network.addRecord(payload);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    logger.info << "Round " << network.getLastRound().round << " committed record "
                << result->getIndex();
  }

  if (!network.verifyLedger()) {
    std::cerr << "Error: ledger failed verification\n";
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"ql-sim - Run consensus rounds over a shared hash-chained ledger"};

  std::string protocolName;
  app.add_option("-p,--protocol", protocolName,
                 "Protocol: pow, pos, dpos, pbft, raft, paxos");

  uint64_t size = NetworkConfig::DEFAULT_SIZE;
  app.add_option("-n,--size", size, "Number of participants (pbft, raft, paxos)")
      ->check(CLI::Range(uint64_t(1), uint64_t(1000)));

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON network configuration file")
      ->check(CLI::ExistingFile);

  uint32_t difficulty = 4;
  app.add_option("--difficulty", difficulty, "Leading zero hex digits (pow)")
      ->check(CLI::Range(0, 64));

  uint64_t seed = 0;
  app.add_option("--seed", seed, "Seed of the random source");

  bool strict = false;
  app.add_flag("--strict", strict, "Track terms and ballots (raft, paxos)");

  bool weighted = false;
  app.add_flag("--weighted", weighted, "Order delegates by vote count (dpos)");

  std::vector<std::string> data;
  app.add_option("-d,--data", data, "Record payload, one round each (repeatable)");

  std::vector<std::string> stakeOptions;
  app.add_option("--stake", stakeOptions, "Stake as id=amount (pos, repeatable)");

  std::vector<std::string> delegates;
  app.add_option("--delegate", delegates, "Delegate id (dpos, repeatable)");

  std::vector<std::string> voteOptions;
  app.add_option("--vote", voteOptions, "Vote as voter=delegate (dpos, repeatable)");

  std::string candidate;
  app.add_option("--candidate", candidate, "Participant that stands for election (raft)");

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  CLI11_PARSE(app, argc, argv);

  NetworkConfig config;
  if (!configPath.empty()) {
    auto loaded = NetworkConfig::loadFile(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = *loaded;
  } else if (protocolName.empty()) {
    std::cerr << "Error: either --protocol or --config is required\n";
    return 1;
  }

  if (!protocolName.empty() && !ql::consensus::parseProtocol(protocolName, config.protocol)) {
    std::cerr << "Error: unknown protocol: " << protocolName << "\n";
    return 1;
  }
  if (app.count("--size") > 0) {
    config.size = size;
  }
  if (app.count("--difficulty") > 0) {
    config.difficulty = difficulty;
  }
  if (app.count("--seed") > 0) {
    config.seed = seed;
  }
  if (strict) {
    config.mode = ql::consensus::ProtocolMode::STRICT;
  }
  if (weighted) {
    config.ordering = ql::consensus::DelegateOrdering::VOTE_WEIGHTED;
  }
  if (debug) {
    config.logLevel = "debug";
  }

  std::vector<std::pair<std::string, std::string>> stakes;
  std::vector<std::pair<std::string, std::string>> votes;
  if (!parsePairs(stakeOptions, stakes) || !parsePairs(voteOptions, votes)) {
    return 1;
  }
  for (const auto &[id, amount] : stakes) {
    auto stake = ql::utl::parseUint64(amount);
    if (!stake) {
      std::cerr << "Error: invalid stake for " << id << ": " << stake.error().message
                << "\n";
      return 1;
    }
    config.setStakeholder(id, *stake);
  }
  for (const auto &delegate : delegates) {
    config.addDelegate(delegate);
  }
  for (const auto &[voter, delegate] : votes) {
    config.votes[voter] = delegate;
  }

  auto level = ql::logging::levelFromString(config.logLevel);
  if (!level) {
    std::cerr << "Error: " << level.error().message << "\n";
    return 1;
  }
  auto rootLogger = ql::logging::getRootLogger();
  rootLogger.setLevel(*level);
  rootLogger.debug << "Configuration: " << config.toJson().dump();

  auto networkResult = ql::consensus::makeNetwork(config);
  if (!networkResult) {
    std::cerr << "Error: " << networkResult.error().message << "\n";
    return 1;
  }
  auto &network = *networkResult.value();

  if (data.empty()) {
    data = { "block1", "block2" };
  }
  int status = runRounds(network, data, !config.votes.empty(), candidate);
  std::cout << network.getLedger().toJson().dump(2) << std::endl;
  return status;
}

#pragma once

#include "ConsensusStrategy.h"

namespace ql {
namespace consensus {

/**
 * Single-decree Paxos per record
 *
 * The first participant is the fixed proposer; every participant is an
 * acceptor and a learner. The caller supplies the proposal number of each
 * round.
 *
 * SIMPLIFIED: the prepare message records the proposal at every acceptor,
 * which then accepts any number it knows.
 * STRICT: acceptors promise only numbers above their previous promise and
 * report their highest accepted proposal, whose value the proposer adopts.
 */
class Paxos : public ConsensusStrategy {
public:
  explicit Paxos(ProtocolMode mode = ProtocolMode::SIMPLIFIED);
  ~Paxos() override = default;

  Protocol getProtocol() const override { return Protocol::PAXOS; }
  ProtocolMode getMode() const { return mode_; }

  Roe<void> attach(Context &ctx) override;
  Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) override;
  std::optional<ParticipantId> getLeader() const override;

  uint64_t getHighestCommittedNumber() const { return highestCommitted_; }

private:
  Roe<Proposal> prepareSimplified(Context &ctx, const Proposal &proposal);
  Roe<Proposal> prepareStrict(Context &ctx, Proposal proposal);
  uint64_t broadcastAccept(Context &ctx, const Proposal &proposal);

  ProtocolMode mode_{ ProtocolMode::SIMPLIFIED };
  ParticipantId proposer_;
  uint64_t highestCommitted_{ 0 };
};

} // namespace consensus
} // namespace ql

#pragma once

#include "ConsensusStrategy.h"

namespace ql {
namespace consensus {

/**
 * Proof of Stake
 *
 * Each round one validator is drawn with probability proportional to its
 * stake and appends a record tagged with its id. There is no vote.
 */
class ProofOfStake : public ConsensusStrategy {
public:
  ProofOfStake();
  ~ProofOfStake() override = default;

  Protocol getProtocol() const override { return Protocol::POS; }
  Record makeGenesis(
      const std::vector<std::unique_ptr<Participant>> &participants) const override;

  Roe<void> attach(Context &ctx) override;
  Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) override;
  Roe<void> setStake(Context &ctx, const ParticipantId &id, uint64_t stake) override;
  bool validateRecord(const Record &record) const override;

  /**
   * Draw r in [0, total) and walk participants in order, accumulating stake
   * until the running sum exceeds r
   */
  Roe<ParticipantId> selectProposer(Context &ctx) const;

  /**
   * total + stake, or E_INVALID_CONFIG when the sum does not fit in 64 bits
   */
  static Roe<uint64_t> addStake(uint64_t total, uint64_t stake);

  uint64_t getTotalStake(const Context &ctx) const;
  std::vector<Stakeholder> getStakeholders(const Context &ctx) const;

private:
  std::vector<ParticipantId> validators_;
};

} // namespace consensus
} // namespace ql

#pragma once

#include "ConsensusStrategy.h"

namespace ql {
namespace consensus {

/**
 * Proof of Work
 *
 * A single miner searches for a nonce that makes the record hash start with
 * `difficulty` zero hex digits, then appends without a vote. The search has
 * no iteration bound.
 */
class ProofOfWork : public ConsensusStrategy {
public:
  static constexpr uint32_t DEFAULT_DIFFICULTY = 4;
  static constexpr uint32_t MAX_DIFFICULTY = 64;

  explicit ProofOfWork(uint32_t difficulty = DEFAULT_DIFFICULTY);
  ~ProofOfWork() override = default;

  static Roe<void> validateDifficulty(uint32_t difficulty);

  uint32_t getDifficulty() const { return difficulty_; }
  bool meetsDifficulty(const Record &record) const;

  /**
   * Search nonces from 0 upwards until the hash meets the difficulty
   */
  Record mine(Record::Content content) const;

  Protocol getProtocol() const override { return Protocol::POW; }
  // Genesis is mined like every other record
  Record makeGenesis(
      const std::vector<std::unique_ptr<Participant>> &participants) const override;
  Roe<void> attach(Context &ctx) override;
  Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) override;
  bool validateRecord(const Record &record) const override;

private:
  uint32_t difficulty_{ DEFAULT_DIFFICULTY };
};

} // namespace consensus
} // namespace ql

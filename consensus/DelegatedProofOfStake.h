#pragma once

#include "ConsensusStrategy.h"

#include <map>

namespace ql {
namespace consensus {

/**
 * Delegated Proof of Stake
 *
 * Voters pick delegates (last vote wins, the delegate is not validated). A
 * tally rebuilds the delegate list from the distinct voted-for delegates.
 * Each round a delegate is picked uniformly at random and appends a record
 * tagged with its id, without a vote.
 */
class DelegatedProofOfStake : public ConsensusStrategy {
public:
  explicit DelegatedProofOfStake(
      std::vector<ParticipantId> delegates,
      std::map<ParticipantId, ParticipantId> votes = {},
      DelegateOrdering ordering = DelegateOrdering::SHUFFLE);
  ~DelegatedProofOfStake() override = default;

  Protocol getProtocol() const override { return Protocol::DPOS; }
  Record makeGenesis(
      const std::vector<std::unique_ptr<Participant>> &participants) const override;

  Roe<void> attach(Context &ctx) override;
  Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) override;
  Roe<void> vote(Context &ctx, const ParticipantId &voter,
                 const ParticipantId &delegate) override;

  /**
   * Count votes per delegate and reorder the delegate list. A tally with no
   * votes keeps the current list.
   */
  Roe<void> tally(Context &ctx) override;

  bool validateRecord(const Record &record) const override;

  Roe<ParticipantId> selectDelegate(Context &ctx) const;

  const std::vector<ParticipantId> &getDelegates() const { return delegates_; }
  const std::map<ParticipantId, ParticipantId> &getVotes() const { return votes_; }
  // Counts of the last tally
  const std::map<ParticipantId, uint64_t> &getVoteCounts() const { return voteCounts_; }
  DelegateOrdering getOrdering() const { return ordering_; }

private:
  void updateRoles(Context &ctx) const;

  std::vector<ParticipantId> delegates_;
  std::map<ParticipantId, ParticipantId> votes_;
  std::map<ParticipantId, uint64_t> voteCounts_;
  DelegateOrdering ordering_{ DelegateOrdering::SHUFFLE };
};

} // namespace consensus
} // namespace ql

#pragma once

#include "ConsensusStrategy.h"

namespace ql {
namespace consensus {

/**
 * Raft without heartbeats or timeouts
 *
 * Elections are started explicitly with requestVote(); a candidate with votes
 * from more than half of all participants becomes the single leader and the
 * previous leader steps down. Only the leader may lead(): its record is
 * checked by every participant and committed on a majority.
 *
 * In SIMPLIFIED mode every vote is granted. In STRICT mode terms are tracked,
 * each participant votes once per term, and stale leaders are refused.
 */
class Raft : public ConsensusStrategy {
public:
  explicit Raft(ProtocolMode mode = ProtocolMode::SIMPLIFIED);
  ~Raft() override = default;

  Protocol getProtocol() const override { return Protocol::RAFT; }
  ProtocolMode getMode() const { return mode_; }

  Roe<void> attach(Context &ctx) override;

  /**
   * Lead on behalf of the current leader
   */
  Roe<Record> proposeAndCommit(Context &ctx, const std::string &data,
                               std::optional<uint64_t> proposalNumber) override;

  Roe<void> requestVote(Context &ctx, const ParticipantId &candidate) override;
  Roe<Record> lead(Context &ctx, const ParticipantId &caller,
                   const std::string &data) override;
  std::optional<ParticipantId> getLeader() const override { return leader_; }

private:
  ProtocolMode mode_{ ProtocolMode::SIMPLIFIED };
  std::optional<ParticipantId> leader_;
};

} // namespace consensus
} // namespace ql

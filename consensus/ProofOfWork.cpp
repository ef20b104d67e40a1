#include "ProofOfWork.h"
#include "Utilities.h"

namespace ql {
namespace consensus {

ProofOfWork::ProofOfWork(uint32_t difficulty)
    : ConsensusStrategy("consensus.pow"), difficulty_(difficulty) {}

ProofOfWork::Roe<void> ProofOfWork::validateDifficulty(uint32_t difficulty) {
  if (difficulty > MAX_DIFFICULTY) {
    return Error(E_INVALID_CONFIG, "Difficulty must be between 0 and " +
                                       std::to_string(MAX_DIFFICULTY) + ", got " +
                                       std::to_string(difficulty));
  }
  return {};
}

bool ProofOfWork::meetsDifficulty(const Record &record) const {
  return record.hasNonce() && utl::hasLeadingZeros(record.getHash(), difficulty_);
}

Record ProofOfWork::mine(Record::Content content) const {
  content.proposer.clear();
  uint64_t nonce = 0;
  while (true) {
    content.nonce = nonce;
    std::string hash = Record::calculateHash(content);
    if (utl::hasLeadingZeros(hash, difficulty_)) {
      log().debug << "Found nonce " << nonce << " for record " << content.index;
      return Record(std::move(content), std::move(hash));
    }
    ++nonce;
  }
}

Record ProofOfWork::makeGenesis(
    const std::vector<std::unique_ptr<Participant>> &participants) const {
  Record::Content content;
  content.index = 0;
  content.timestamp = utl::getCurrentTimeNanos();
  content.data = Ledger::GENESIS_DATA;
  if (difficulty_ > MAX_DIFFICULTY) {
    // No hash can qualify; attach() rejects this difficulty
    return Record(std::move(content));
  }
  return mine(std::move(content));
}

ProofOfWork::Roe<void> ProofOfWork::attach(Context &ctx) {
  auto valid = validateDifficulty(difficulty_);
  if (!valid) {
    return valid;
  }
  if (ctx.participants.empty()) {
    return Error(E_NO_PARTICIPANTS, "Proof of work needs a miner");
  }
  for (auto &spParticipant : ctx.participants) {
    spParticipant->setRole(Participant::Role::MINER);
  }
  log().info << "Attached with difficulty " << difficulty_;
  return {};
}

ProofOfWork::Roe<Record>
ProofOfWork::proposeAndCommit(Context &ctx, const std::string &data,
                              std::optional<uint64_t> proposalNumber) {
  if (proposalNumber) {
    log().debug << "Ignoring proposal number " << *proposalNumber;
  }
  auto candidate = buildCandidate(ctx, data);
  if (!candidate) {
    return candidate;
  }
  Record mined = mine(candidate->getContent());
  return commitUnconditionally(ctx, mined);
}

bool ProofOfWork::validateRecord(const Record &record) const {
  return meetsDifficulty(record);
}

} // namespace consensus
} // namespace ql

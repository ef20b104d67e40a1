#pragma once

#include "Participant.h"
#include <gmock/gmock.h>

namespace ql {
namespace consensus {

/**
 * Participant whose protocol callbacks can be scripted per test.
 * Unscripted callbacks fall through to the real Participant behavior.
 */
class MockParticipant : public Participant {
public:
    explicit MockParticipant(ParticipantId id) : Participant(std::move(id)) {
        ON_CALL(*this, verifyRecord)
            .WillByDefault([this](const Record& candidate, const Ledger& ledger) {
                return Participant::verifyRecord(candidate, ledger);
            });
        ON_CALL(*this, acceptEntries)
            .WillByDefault([this](const Record& candidate, uint64_t leaderTerm,
                                  const Ledger& ledger, ProtocolMode mode) {
                return Participant::acceptEntries(candidate, leaderTerm, ledger, mode);
            });
        ON_CALL(*this, voteFor)
            .WillByDefault([this](const ParticipantId& candidate, uint64_t term,
                                  uint64_t lastIndex, ProtocolMode mode) {
                return Participant::voteFor(candidate, term, lastIndex, mode);
            });
        ON_CALL(*this, acceptProposal)
            .WillByDefault([this](const Proposal& proposal, ProtocolMode mode) {
                return Participant::acceptProposal(proposal, mode);
            });
    }

    MOCK_METHOD(bool, verifyRecord, (const Record& candidate, const Ledger& ledger),
                (const, override));
    MOCK_METHOD(bool, acceptEntries,
                (const Record& candidate, uint64_t leaderTerm, const Ledger& ledger,
                 ProtocolMode mode),
                (override));
    MOCK_METHOD(bool, voteFor,
                (const ParticipantId& candidate, uint64_t candidateTerm,
                 uint64_t candidateLastIndex, ProtocolMode mode),
                (override));
    MOCK_METHOD(bool, acceptProposal, (const Proposal& proposal, ProtocolMode mode),
                (override));
};

} // namespace consensus
} // namespace ql

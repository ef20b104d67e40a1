#include "MockParticipant.h"
#include "Network.h"
#include "Paxos.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace ql;
using namespace ql::consensus;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

TEST(PaxosTest, NumberedRoundsCommitInOrder) {
    auto result = makePaxosNetwork(5);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    auto& network = *result.value();

    ASSERT_TRUE(network.runConsensusRound("d1", 1).isOk());
    ASSERT_TRUE(network.runConsensusRound("d2", 2).isOk());

    const auto& ledger = network.getLedger();
    ASSERT_EQ(ledger.getSize(), 3u);
    EXPECT_EQ(ledger.getRecord(1)->getData(), "d1");
    EXPECT_EQ(ledger.getRecord(2)->getData(), "d2");
    EXPECT_TRUE(network.verifyLedger());

    const auto& paxos = static_cast<const Paxos&>(network.getStrategy());
    EXPECT_EQ(paxos.getHighestCommittedNumber(), 2u);
}

TEST(PaxosTest, ProposerAndAcceptorRoles) {
    auto result = makePaxosNetwork(3);
    ASSERT_TRUE(result.isOk());
    auto& network = *result.value();

    EXPECT_EQ(network.getParticipant("node-0")->getRole(), Participant::Role::PROPOSER);
    EXPECT_EQ(network.getParticipant("node-1")->getRole(), Participant::Role::ACCEPTOR);
    EXPECT_EQ(network.getParticipant("node-2")->getRole(), Participant::Role::ACCEPTOR);
    EXPECT_EQ(network.getLeader(), std::optional<ParticipantId>("node-0"));
}

TEST(PaxosTest, MissingNumberRejected) {
    auto result = makePaxosNetwork(3);
    ASSERT_TRUE(result.isOk());
    auto& network = *result.value();

    auto round = network.runConsensusRound("no number");
    ASSERT_TRUE(round.isError());
    EXPECT_EQ(round.error().code, ConsensusStrategy::E_INVALID_ARGUMENT);

    auto added = network.addRecord("no number");
    ASSERT_TRUE(added.isError());
    EXPECT_EQ(added.error().code, ConsensusStrategy::E_INVALID_ARGUMENT);
    EXPECT_EQ(network.getLedger().getSize(), 1u);
}

TEST(PaxosTest, CommittedProposalsArePruned) {
    auto result = makePaxosNetwork(3);
    ASSERT_TRUE(result.isOk());
    auto& network = *result.value();

    ASSERT_TRUE(network.runConsensusRound("d1", 7).isOk());
    for (const auto& spParticipant : network.getParticipants()) {
        EXPECT_TRUE(spParticipant->getProposals().empty());
        EXPECT_FALSE(spParticipant->getAcceptedProposal().has_value());
        EXPECT_EQ(spParticipant->getLastCommittedIndex(), 1u);
    }
}

TEST(PaxosTest, StrictRejectsStaleNumbers) {
    auto result = makePaxosNetwork(3, ProtocolMode::STRICT);
    ASSERT_TRUE(result.isOk());
    auto& network = *result.value();

    ASSERT_TRUE(network.runConsensusRound("first", 2).isOk());

    auto duplicate = network.runConsensusRound("again", 2);
    ASSERT_TRUE(duplicate.isError());
    EXPECT_EQ(duplicate.error().code, ConsensusStrategy::E_QUORUM_NOT_REACHED);

    auto lower = network.runConsensusRound("older", 1);
    ASSERT_TRUE(lower.isError());
    EXPECT_EQ(lower.error().code, ConsensusStrategy::E_QUORUM_NOT_REACHED);
    EXPECT_EQ(network.getLedger().getSize(), 2u);
    EXPECT_FALSE(network.getLastRound().committed);

    ASSERT_TRUE(network.runConsensusRound("newer", 3).isOk());
    EXPECT_EQ(network.getLedger().getSize(), 3u);
    EXPECT_EQ(network.getLedger().tip()->getData(), "newer");
}

TEST(PaxosTest, SimplifiedAcceptsAnyNumber) {
    auto result = makePaxosNetwork(3);
    ASSERT_TRUE(result.isOk());
    auto& network = *result.value();

    ASSERT_TRUE(network.runConsensusRound("high", 5).isOk());
    ASSERT_TRUE(network.runConsensusRound("low", 1).isOk());
    EXPECT_EQ(network.getLedger().getSize(), 3u);
}

class PaxosAdoptionTest : public ::testing::Test {
protected:
    // node-0 and node-1 are real acceptors, node-2..node-4 scripted
    void SetUp() override {
        std::vector<std::unique_ptr<Participant>> participants;
        participants.push_back(std::make_unique<Participant>("node-0"));
        participants.push_back(std::make_unique<Participant>("node-1"));
        for (int i = 2; i < 5; ++i) {
            auto spMock = std::make_unique<NiceMock<MockParticipant>>("node-" + std::to_string(i));
            mocks.push_back(spMock.get());
            participants.push_back(std::move(spMock));
        }
        network = std::make_unique<Network>(std::move(participants),
                                            std::make_unique<Paxos>(ProtocolMode::STRICT), 5);
        ASSERT_TRUE(network->start().isOk());
    }

    std::vector<NiceMock<MockParticipant>*> mocks;
    std::unique_ptr<Network> network;
};

TEST_F(PaxosAdoptionTest, HigherNumberAdoptsAcceptedValue) {
    for (auto* mock : mocks) {
        EXPECT_CALL(*mock, acceptProposal(_, _))
            .WillOnce(Return(false))
            .WillRepeatedly(Return(true));
    }

    auto first = network->runConsensusRound("v1", 1);
    ASSERT_TRUE(first.isError());
    EXPECT_EQ(first.error().code, ConsensusStrategy::E_QUORUM_NOT_REACHED);
    EXPECT_EQ(network->getLedger().getSize(), 1u);
    ASSERT_TRUE(network->getParticipant("node-1")->getAcceptedProposal().has_value());

    auto second = network->runConsensusRound("v2", 2);
    ASSERT_TRUE(second.isOk()) << second.error().message;
    EXPECT_EQ(second->getData(), "v1");
    EXPECT_EQ(network->getLedger().tip()->getData(), "v1");
    EXPECT_TRUE(network->verifyLedger());
}

TEST_F(PaxosAdoptionTest, MinorityRefusalStillCommits) {
    EXPECT_CALL(*mocks[0], acceptProposal(_, _)).WillRepeatedly(Return(false));
    EXPECT_CALL(*mocks[1], acceptProposal(_, _)).WillRepeatedly(Return(false));

    auto result = network->runConsensusRound("kept", 1);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_EQ(network->getLastRound().approvals, 3u);
}

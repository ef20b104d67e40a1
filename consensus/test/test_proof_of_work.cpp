#include "Network.h"
#include "ProofOfWork.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace ql;
using namespace ql::consensus;
using ::testing::StartsWith;

class ProofOfWorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = makePowNetwork(2, 7);
        ASSERT_TRUE(result.isOk()) << result.error().message;
        network = std::move(result.value());
    }

    std::unique_ptr<Network> network;
};

TEST_F(ProofOfWorkTest, SingleMinerNetwork) {
    ASSERT_EQ(network->getParticipants().size(), 1u);
    EXPECT_EQ(network->getParticipants()[0]->getId(), "miner-0");
    EXPECT_EQ(network->getParticipants()[0]->getRole(), Participant::Role::MINER);
    EXPECT_EQ(network->getProtocol(), Protocol::POW);
}

TEST_F(ProofOfWorkTest, GenesisIsMined) {
    auto genesis = network->getLedger().getRecord(0);
    ASSERT_TRUE(genesis.isOk());
    EXPECT_EQ(genesis->getData(), Ledger::GENESIS_DATA);
    EXPECT_TRUE(genesis->hasNonce());
    EXPECT_THAT(genesis->getHash(), StartsWith("00"));
}

TEST_F(ProofOfWorkTest, MinedRecordMeetsDifficulty) {
    auto record = network->addRecord("block1");
    ASSERT_TRUE(record.isOk()) << record.error().message;

    EXPECT_THAT(record->getHash(), StartsWith("00"));
    EXPECT_TRUE(record->hasNonce());
    EXPECT_TRUE(record->getProposer().empty());
    EXPECT_TRUE(record->isHashValid());
    EXPECT_EQ(network->getLedger().getSize(), 2u);
    EXPECT_TRUE(network->verifyLedger());
}

TEST_F(ProofOfWorkTest, RecordsChainTogether) {
    ASSERT_TRUE(network->addRecord("block1").isOk());
    ASSERT_TRUE(network->runConsensusRound("block2").isOk());

    const auto& records = network->getLedger().getRecords();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].getData(), "block2");
    EXPECT_EQ(records[2].getPreviousHash(), records[1].getHash());
    EXPECT_TRUE(network->getLedger().isValid());
}

TEST_F(ProofOfWorkTest, VotingIsUnsupported) {
    auto result = network->vote("a", "b");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConsensusStrategy::E_UNSUPPORTED);

    auto lead = network->lead("miner-0", "data");
    ASSERT_TRUE(lead.isError());
    EXPECT_EQ(lead.error().code, ConsensusStrategy::E_UNSUPPORTED);
    EXPECT_EQ(network->getLedger().getSize(), 1u);
}

TEST(ProofOfWorkStrategyTest, DefaultDifficultyIsFour) {
    ProofOfWork pow;
    EXPECT_EQ(pow.getDifficulty(), 4u);

    auto result = makePowNetwork();
    ASSERT_TRUE(result.isOk());
    auto record = result.value()->addRecord("four zeros");
    ASSERT_TRUE(record.isOk());
    EXPECT_THAT(record->getHash(), StartsWith("0000"));
}

TEST(ProofOfWorkStrategyTest, ZeroDifficultyAcceptsFirstNonce) {
    ProofOfWork pow(0);
    Record::Content content;
    content.index = 1;
    content.data = "easy";
    content.previousHash = "abc";
    Record mined = pow.mine(content);
    EXPECT_EQ(mined.getNonce(), 0u);
    EXPECT_TRUE(pow.meetsDifficulty(mined));
}

TEST(ProofOfWorkStrategyTest, UnminedRecordFailsValidation) {
    ProofOfWork pow(1);
    Record::Content content;
    content.index = 1;
    content.data = "plain";
    Record plain(content);
    EXPECT_FALSE(pow.validateRecord(plain));
}

TEST(ProofOfWorkStrategyTest, DifficultyOutOfRange) {
    EXPECT_TRUE(ProofOfWork::validateDifficulty(64).isOk());
    auto invalid = ProofOfWork::validateDifficulty(65);
    ASSERT_TRUE(invalid.isError());
    EXPECT_EQ(invalid.error().code, ConsensusStrategy::E_INVALID_CONFIG);

    auto network = makePowNetwork(65);
    ASSERT_TRUE(network.isError());
    EXPECT_EQ(network.error().code, ConsensusStrategy::E_INVALID_CONFIG);
}

TEST(ProofOfWorkStrategyTest, UnreachableDifficultyFailsAtStart) {
    std::vector<std::unique_ptr<Participant>> participants;
    participants.push_back(std::make_unique<Participant>("miner-0"));
    Network network(std::move(participants), std::make_unique<ProofOfWork>(65), 1);

    EXPECT_FALSE(network.getLedger().getRecords().front().hasNonce());
    auto started = network.start();
    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, ConsensusStrategy::E_INVALID_CONFIG);
}

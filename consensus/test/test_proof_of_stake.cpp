#include "Network.h"
#include "ProofOfStake.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <map>

using namespace ql;
using namespace ql::consensus;
using ::testing::AllOf;
using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::Ge;
using ::testing::Le;

class ProofOfStakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        participants.push_back(std::make_unique<Participant>("A"));
        participants.push_back(std::make_unique<Participant>("B"));
        participants[0]->setStake(60);
        participants[1]->setStake(40);
        auto attached = pos.attach(ctx);
        ASSERT_TRUE(attached.isOk()) << attached.error().message;
    }

    Ledger ledger;
    std::vector<std::unique_ptr<Participant>> participants;
    RandomSource random{ 42 };
    ConsensusStrategy::Context ctx{ ledger, participants, random };
    ProofOfStake pos;
};

TEST_F(ProofOfStakeTest, AssignsValidatorRole) {
    for (const auto& spParticipant : participants) {
        EXPECT_EQ(spParticipant->getRole(), Participant::Role::VALIDATOR);
    }
    EXPECT_EQ(pos.getTotalStake(ctx), 100u);
    auto stakeholders = pos.getStakeholders(ctx);
    ASSERT_EQ(stakeholders.size(), 2u);
    EXPECT_EQ(stakeholders[0].id, "A");
    EXPECT_EQ(stakeholders[0].stake, 60u);
}

TEST_F(ProofOfStakeTest, SelectionFrequencyFollowsStake) {
    const int rounds = 10000;
    int selectedA = 0;
    for (int i = 0; i < rounds; ++i) {
        auto proposer = pos.selectProposer(ctx);
        ASSERT_TRUE(proposer.isOk());
        ASSERT_THAT(*proposer, AnyOf(Eq("A"), Eq("B")));
        if (*proposer == "A") {
            ++selectedA;
        }
    }
    double share = static_cast<double>(selectedA) / rounds;
    EXPECT_THAT(share, AllOf(Ge(0.57), Le(0.63)));
}

TEST_F(ProofOfStakeTest, ZeroStakeNeverSelected) {
    participants[1]->setStake(0);
    for (int i = 0; i < 200; ++i) {
        auto proposer = pos.selectProposer(ctx);
        ASSERT_TRUE(proposer.isOk());
        EXPECT_EQ(*proposer, "A");
    }
}

TEST_F(ProofOfStakeTest, NoStakeIsError) {
    participants[0]->setStake(0);
    participants[1]->setStake(0);

    auto proposer = pos.selectProposer(ctx);
    ASSERT_TRUE(proposer.isError());
    EXPECT_EQ(proposer.error().code, ConsensusStrategy::E_NO_STAKE);

    auto record = pos.proposeAndCommit(ctx, "data", std::nullopt);
    ASSERT_TRUE(record.isError());
    EXPECT_EQ(record.error().code, ConsensusStrategy::E_NO_STAKE);
    EXPECT_EQ(ledger.getSize(), 1u);
}

TEST_F(ProofOfStakeTest, CommittedRecordCarriesProposer) {
    auto record = pos.proposeAndCommit(ctx, "block1", std::nullopt);
    ASSERT_TRUE(record.isOk()) << record.error().message;
    EXPECT_THAT(record->getProposer(), AnyOf(Eq("A"), Eq("B")));
    EXPECT_FALSE(record->hasNonce());
    EXPECT_TRUE(pos.validateRecord(*record));
    EXPECT_EQ(ledger.getSize(), 2u);
    EXPECT_EQ(participants[0]->getLastCommittedIndex(), 1u);
    EXPECT_TRUE(pos.getLastRound().committed);
}

TEST_F(ProofOfStakeTest, SetStake) {
    ASSERT_TRUE(pos.setStake(ctx, "B", 5).isOk());
    EXPECT_EQ(participants[1]->getStake(), 5u);

    auto unknown = pos.setStake(ctx, "Z", 5);
    ASSERT_TRUE(unknown.isError());
    EXPECT_EQ(unknown.error().code, ConsensusStrategy::E_UNKNOWN_PARTICIPANT);
}

TEST_F(ProofOfStakeTest, ForeignProposerFailsValidation) {
    Record::Content content;
    content.index = 1;
    content.proposer = "mallory";
    EXPECT_FALSE(pos.validateRecord(Record(content)));
}

TEST(ProofOfStakeNetworkTest, GenesisTaggedWithFirstParticipant) {
    auto result = makePosNetwork({ "A", "B" }, { { "A", 60 }, { "B", 40 } }, 1);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    auto& network = *result.value();

    auto genesis = network.getLedger().getRecord(0);
    ASSERT_TRUE(genesis.isOk());
    EXPECT_EQ(genesis->getProposer(), "A");

    ASSERT_TRUE(network.addRecord("block1").isOk());
    ASSERT_TRUE(network.addRecord("block2").isOk());
    EXPECT_EQ(network.getLedger().getSize(), 3u);
    EXPECT_TRUE(network.verifyLedger());
}

TEST(ProofOfStakeNetworkTest, SameSeedSameProposers) {
    auto first = makePosNetwork({ "A", "B", "C" }, { { "A", 1 }, { "B", 1 }, { "C", 1 } }, 99);
    auto second = makePosNetwork({ "A", "B", "C" }, { { "A", 1 }, { "B", 1 }, { "C", 1 } }, 99);
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(second.isOk());

    for (int i = 0; i < 20; ++i) {
        auto a = first.value()->addRecord("r" + std::to_string(i));
        auto b = second.value()->addRecord("r" + std::to_string(i));
        ASSERT_TRUE(a.isOk());
        ASSERT_TRUE(b.isOk());
        EXPECT_EQ(a->getProposer(), b->getProposer());
    }
}

TEST(ProofOfStakeNetworkTest, NetworkSetStake) {
    auto result = makePosNetwork({ "A", "B" }, {}, 3);
    ASSERT_TRUE(result.isOk());
    auto& network = *result.value();

    auto record = network.addRecord("nothing staked");
    ASSERT_TRUE(record.isError());
    EXPECT_EQ(record.error().code, ConsensusStrategy::E_NO_STAKE);

    ASSERT_TRUE(network.setStake("B", 10).isOk());
    auto staked = network.addRecord("staked");
    ASSERT_TRUE(staked.isOk());
    EXPECT_EQ(staked->getProposer(), "B");
}

TEST(ProofOfStakeNetworkTest, StakeForUnknownParticipantRejected) {
    auto result = makePosNetwork({ "A" }, { { "B", 10 } });
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConsensusStrategy::E_UNKNOWN_PARTICIPANT);
}

TEST(ProofOfStakeNetworkTest, StakeTotalMustFitSixtyFourBits) {
    const uint64_t half = uint64_t(1) << 63;
    auto overflow = makePosNetwork({ "A", "B" }, { { "A", half }, { "B", half } }, 1);
    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.error().code, ConsensusStrategy::E_INVALID_CONFIG);

    auto result = makePosNetwork({ "A", "B" }, { { "A", half } }, 1);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    auto& network = *result.value();

    auto rejected = network.setStake("B", half);
    ASSERT_TRUE(rejected.isError());
    EXPECT_EQ(rejected.error().code, ConsensusStrategy::E_INVALID_CONFIG);
    EXPECT_EQ(network.getParticipant("B")->getStake(), 0u);

    ASSERT_TRUE(network.setStake("A", half - 1).isOk());
    ASSERT_TRUE(network.setStake("B", half).isOk());
    auto record = network.addRecord("full range");
    ASSERT_TRUE(record.isOk()) << record.error().message;
}

TEST(ProofOfStakeNetworkTest, OverflowingParticipantsFailAtStart) {
    std::vector<std::unique_ptr<Participant>> participants;
    for (const char* id : { "A", "B" }) {
        auto spParticipant = std::make_unique<Participant>(id);
        spParticipant->setStake(uint64_t(1) << 63);
        participants.push_back(std::move(spParticipant));
    }
    Network network(std::move(participants), std::make_unique<ProofOfStake>(), 1);
    auto started = network.start();
    ASSERT_TRUE(started.isError());
    EXPECT_EQ(started.error().code, ConsensusStrategy::E_INVALID_CONFIG);
}

TEST(ProofOfStakeStrategyTest, AddStakeDetectsOverflow) {
    EXPECT_EQ(*ProofOfStake::addStake(40, 60), 100u);
    EXPECT_TRUE(ProofOfStake::addStake(std::numeric_limits<uint64_t>::max(), 0).isOk());
    auto overflow = ProofOfStake::addStake(std::numeric_limits<uint64_t>::max(), 1);
    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.error().code, ConsensusStrategy::E_INVALID_CONFIG);
}

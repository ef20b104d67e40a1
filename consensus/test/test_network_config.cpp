#include "NetworkConfig.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace ql::consensus;

TEST(NetworkConfigTest, DefaultsForSizedProtocols) {
    auto result = NetworkConfig::fromJson({ { "protocol", "raft" } });
    ASSERT_TRUE(result.isOk()) << result.error().message;
    const auto& config = result.value();
    EXPECT_EQ(config.protocol, Protocol::RAFT);
    EXPECT_EQ(config.size, NetworkConfig::DEFAULT_SIZE);
    EXPECT_EQ(config.mode, ProtocolMode::SIMPLIFIED);
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_EQ(config.logLevel, "info");
}

TEST(NetworkConfigTest, ParsesAllFields) {
    nlohmann::json j = {
        { "protocol", "DPoS" },
        { "seed", 42 },
        { "mode", "strict" },
        { "ordering", "vote-weighted" },
        { "delegates", { "Alice", "Bob" } },
        { "votes", { { "Carol", "Bob" }, { "Dave", "Alice" } } },
        { "logLevel", "debug" },
    };
    auto result = NetworkConfig::fromJson(j);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    const auto& config = result.value();
    EXPECT_EQ(config.protocol, Protocol::DPOS);
    EXPECT_EQ(config.seed, std::optional<uint64_t>(42));
    EXPECT_EQ(config.mode, ProtocolMode::STRICT);
    EXPECT_EQ(config.ordering, DelegateOrdering::VOTE_WEIGHTED);
    ASSERT_EQ(config.delegates.size(), 2u);
    EXPECT_EQ(config.delegates[1], "Bob");
    EXPECT_EQ(config.votes.at("Carol"), "Bob");
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(NetworkConfigTest, ParsesStakeholdersInOrder) {
    nlohmann::json j = {
        { "protocol", "pos" },
        { "stakeholders", { { { "id", "B" }, { "stake", 40 } }, { { "id", "A" }, { "stake", 60 } } } },
    };
    auto result = NetworkConfig::fromJson(j);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    const auto& stakeholders = result.value().stakeholders;
    ASSERT_EQ(stakeholders.size(), 2u);
    EXPECT_EQ(stakeholders[0].id, "B");
    EXPECT_EQ(stakeholders[0].stake, 40u);
    EXPECT_EQ(stakeholders[1].id, "A");
}

TEST(NetworkConfigTest, RejectsInvalidDocuments) {
    std::vector<nlohmann::json> invalid = {
        nlohmann::json::array(),
        { { "size", 3 } },
        { { "protocol", "hashgraph" } },
        { { "protocol", "pbft" }, { "size", -1 } },
        { { "protocol", "pbft" }, { "size", 0 } },
        { { "protocol", "pow" }, { "difficulty", 65 } },
        { { "protocol", "pow" }, { "difficulty", 4294967300ULL } },
        { { "protocol", "pos" } },
        { { "protocol", "pos" }, { "stakeholders", { { { "id", "A" } }, { { "id", "A" } } } } },
        { { "protocol", "dpos" }, { "delegates", nlohmann::json::array() } },
        { { "protocol", "dpos" }, { "delegates", { "A", "B", "A" } } },
        { { "protocol", "pos" },
          { "stakeholders",
            { { { "id", "A" }, { "stake", 9223372036854775808ULL } },
              { { "id", "B" }, { "stake", 9223372036854775808ULL } } } } },
        { { "protocol", "dpos" }, { "delegates", { "A" } }, { "votes", { { "B", 1 } } } },
        { { "protocol", "raft" }, { "mode", "eventual" } },
        { { "protocol", "raft" }, { "logLevel", "loud" } },
    };
    for (const auto& j : invalid) {
        auto result = NetworkConfig::fromJson(j);
        ASSERT_TRUE(result.isError()) << j.dump();
        EXPECT_EQ(result.error().code, NetworkConfig::E_CONFIG);
    }
}

TEST(NetworkConfigTest, ToJsonReloads) {
    NetworkConfig config;
    config.protocol = Protocol::PAXOS;
    config.size = 7;
    config.seed = 5;
    config.mode = ProtocolMode::STRICT;

    auto j = config.toJson();
    EXPECT_EQ(j["protocol"], "paxos");
    EXPECT_EQ(j["mode"], "strict");

    auto reloaded = NetworkConfig::fromJson(j);
    ASSERT_TRUE(reloaded.isOk()) << reloaded.error().message;
    EXPECT_EQ(reloaded.value().size, 7u);
    EXPECT_EQ(reloaded.value().seed, std::optional<uint64_t>(5));
    EXPECT_EQ(reloaded.value().mode, ProtocolMode::STRICT);
}

TEST(NetworkConfigTest, SetStakeholderReplacesExistingEntry) {
    auto result = NetworkConfig::fromJson(
        { { "protocol", "pos" },
          { "stakeholders", { { { "id", "A" }, { "stake", 60 } }, { { "id", "B" }, { "stake", 40 } } } } });
    ASSERT_TRUE(result.isOk()) << result.error().message;
    NetworkConfig config = result.value();

    config.setStakeholder("A", 10);
    config.setStakeholder("C", 5);
    ASSERT_EQ(config.stakeholders.size(), 3u);
    EXPECT_EQ(config.stakeholders[0].id, "A");
    EXPECT_EQ(config.stakeholders[0].stake, 10u);
    EXPECT_EQ(config.stakeholders[2].id, "C");
    EXPECT_TRUE(config.validate().isOk());
}

TEST(NetworkConfigTest, AddDelegateSkipsListedIds) {
    NetworkConfig config;
    config.protocol = Protocol::DPOS;
    config.addDelegate("Alice");
    config.addDelegate("Bob");
    config.addDelegate("Alice");
    ASSERT_EQ(config.delegates.size(), 2u);
    EXPECT_EQ(config.delegates[0], "Alice");
    EXPECT_EQ(config.delegates[1], "Bob");
    EXPECT_TRUE(config.validate().isOk());
}

class NetworkConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = (std::filesystem::temp_directory_path() / "ql_network_config_test.json").string();
    }

    void TearDown() override { std::remove(path.c_str()); }

    std::string path;
};

TEST_F(NetworkConfigFileTest, LoadsFromFile) {
    {
        std::ofstream out(path);
        out << R"({ "protocol": "pow", "difficulty": 2, "seed": 9 })";
    }
    auto result = NetworkConfig::loadFile(path);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_EQ(result.value().protocol, Protocol::POW);
    EXPECT_EQ(result.value().difficulty, 2u);
}

TEST_F(NetworkConfigFileTest, MissingOrMalformedFile) {
    auto missing = NetworkConfig::loadFile(path);
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, NetworkConfig::E_CONFIG);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto malformed = NetworkConfig::loadFile(path);
    ASSERT_TRUE(malformed.isError());
    EXPECT_EQ(malformed.error().code, NetworkConfig::E_CONFIG);
}

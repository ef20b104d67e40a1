#include "Record.h"
#include <gtest/gtest.h>

using namespace ql;

namespace {

Record::Content makeContent(uint64_t index, const std::string &data,
                            const std::string &previousHash) {
  Record::Content content;
  content.index = index;
  content.timestamp = 1700000000000000000LL;
  content.data = data;
  content.previousHash = previousHash;
  return content;
}

} // namespace

TEST(RecordTest, HashIsDeterministic) {
  Record first(makeContent(1, "payload", "abc"));
  Record second(makeContent(1, "payload", "abc"));
  EXPECT_EQ(first.getHash(), second.getHash());
  EXPECT_EQ(first.getHash().size(), 64u);
  EXPECT_TRUE(first.isHashValid());
}

TEST(RecordTest, EveryFieldAffectsHash) {
  Record base(makeContent(1, "payload", "abc"));

  auto content = makeContent(2, "payload", "abc");
  EXPECT_NE(Record(content).getHash(), base.getHash());

  content = makeContent(1, "payload2", "abc");
  EXPECT_NE(Record(content).getHash(), base.getHash());

  content = makeContent(1, "payload", "abd");
  EXPECT_NE(Record(content).getHash(), base.getHash());

  content = makeContent(1, "payload", "abc");
  content.timestamp += 1;
  EXPECT_NE(Record(content).getHash(), base.getHash());
}

TEST(RecordTest, AnnotationsAffectHash) {
  auto content = makeContent(1, "payload", "abc");
  Record plain(content);

  content.proposer = "alice";
  Record tagged(content);
  EXPECT_NE(tagged.getHash(), plain.getHash());
  EXPECT_EQ(tagged.getProposer(), "alice");

  content.proposer.clear();
  content.nonce = 0;
  Record mined(content);
  EXPECT_NE(mined.getHash(), plain.getHash());
  EXPECT_TRUE(mined.hasNonce());
  EXPECT_EQ(mined.getNonce(), 0u);
  EXPECT_FALSE(plain.hasNonce());
}

TEST(RecordTest, FieldBoundariesAreUnambiguous) {
  // Moving a character between payload and previous hash changes the hash
  Record first(makeContent(1, "ab", "c"));
  Record second(makeContent(1, "a", "bc"));
  EXPECT_NE(first.getHash(), second.getHash());
}

TEST(RecordTest, StoredHashIsKeptAsGiven) {
  auto content = makeContent(3, "data", "prev");
  Record tampered(content, "not-a-real-hash");
  EXPECT_EQ(tampered.getHash(), "not-a-real-hash");
  EXPECT_FALSE(tampered.isHashValid());

  Record copied(content, Record::calculateHash(content));
  EXPECT_TRUE(copied.isHashValid());
}

TEST(RecordTest, AnnotationConflictDetected) {
  auto content = makeContent(1, "data", "prev");
  EXPECT_FALSE(content.hasAnnotationConflict());
  content.proposer = "bob";
  content.nonce = 7;
  EXPECT_TRUE(content.hasAnnotationConflict());
}

TEST(RecordTest, ToJsonContainsFields) {
  auto content = makeContent(4, "hello", "prev");
  content.proposer = "carol";
  Record record(content);

  nlohmann::json j = record.toJson();
  EXPECT_EQ(j["index"].get<uint64_t>(), 4u);
  EXPECT_EQ(j["data"].get<std::string>(), "hello");
  EXPECT_EQ(j["previousHash"].get<std::string>(), "prev");
  EXPECT_EQ(j["hash"].get<std::string>(), record.getHash());
  EXPECT_EQ(j["proposer"].get<std::string>(), "carol");
  EXPECT_FALSE(j.contains("nonce"));
}

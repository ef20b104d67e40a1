#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ql {

/**
 * One hash-linked entry of the Ledger.
 *
 * A Record is immutable: its fields are fixed at construction and the self
 * hash is a pure function of them. At most one protocol annotation is set,
 * either the proposer identity (PoS/DPoS) or the work-proof nonce (PoW).
 */
class Record {
public:
  static constexpr uint16_t CURRENT_VERSION = 1;

  struct Content {
    uint64_t index{ 0 };
    int64_t timestamp{ 0 };          // nanoseconds since epoch, ordering only
    std::string data;
    std::string previousHash;        // empty for genesis
    std::string proposer;            // empty unless PoS/DPoS
    std::optional<uint64_t> nonce;   // set only for PoW

    bool hasAnnotationConflict() const { return !proposer.empty() && nonce.has_value(); }
  };

  /**
   * Build a Record and compute its hash from the content
   */
  explicit Record(Content content);

  /**
   * Build a Record with a stored hash taken as-is (e.g. a copy received from
   * elsewhere). The hash is not checked here; see isHashValid().
   */
  Record(Content content, std::string hash);

  static std::string calculateHash(const Content &content);

  uint64_t getIndex() const { return content_.index; }
  int64_t getTimestamp() const { return content_.timestamp; }
  const std::string &getData() const { return content_.data; }
  const std::string &getPreviousHash() const { return content_.previousHash; }
  const std::string &getHash() const { return hash_; }
  const std::string &getProposer() const { return content_.proposer; }
  bool hasNonce() const { return content_.nonce.has_value(); }
  uint64_t getNonce() const { return content_.nonce.value_or(0); }
  const Content &getContent() const { return content_; }

  std::string calculateHash() const { return calculateHash(content_); }
  bool isHashValid() const { return hash_ == calculateHash(); }

  nlohmann::json toJson() const;

private:
  Content content_;
  std::string hash_;
};

} // namespace ql

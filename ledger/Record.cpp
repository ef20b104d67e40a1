#include "Record.h"
#include "Utilities.h"

#include <sstream>

namespace ql {

Record::Record(Content content)
    : content_(std::move(content)), hash_(calculateHash(content_)) {}

Record::Record(Content content, std::string hash)
    : content_(std::move(content)), hash_(std::move(hash)) {}

std::string Record::calculateHash(const Content &content) {
  // Payload is length-prefixed so that field boundaries are unambiguous
  std::stringstream ss;
  ss << CURRENT_VERSION << ':' << content.index << ':' << content.timestamp
     << ':' << content.data.size() << ':' << content.data << ':'
     << content.previousHash;
  if (!content.proposer.empty()) {
    ss << ":p:" << content.proposer;
  }
  if (content.nonce) {
    ss << ":n:" << *content.nonce;
  }
  return utl::sha256(ss.str());
}

nlohmann::json Record::toJson() const {
  nlohmann::json j;
  j["index"] = content_.index;
  j["timestamp"] = content_.timestamp;
  j["data"] = content_.data;
  j["previousHash"] = content_.previousHash;
  j["hash"] = hash_;
  if (!content_.proposer.empty()) {
    j["proposer"] = content_.proposer;
  }
  if (content_.nonce) {
    j["nonce"] = *content_.nonce;
  }
  return j;
}

} // namespace ql

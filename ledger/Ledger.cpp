#include "Ledger.h"
#include "Utilities.h"

#include <algorithm>

namespace ql {

bool Ledger::IntegrityChecks::Iterator::operator*() const {
  const Record &current = (*records_)[index_];
  const Record &previous = (*records_)[index_ - 1];
  return current.getIndex() == previous.getIndex() + 1 &&
         current.getPreviousHash() == previous.getHash() &&
         current.isHashValid();
}

Ledger::Ledger() : Module("ledger") { records_.push_back(makeGenesis()); }

Ledger::Ledger(Record genesis) : Module("ledger") {
  auto result = validateGenesis(genesis);
  if (!result) {
    log().error << "Rejected genesis record: " << result.error().message
                << "; using default genesis";
    records_.push_back(makeGenesis());
    return;
  }
  records_.push_back(std::move(genesis));
}

Record Ledger::makeGenesis(const std::string &proposer) {
  Record::Content content;
  content.index = 0;
  content.timestamp = utl::getCurrentTimeNanos();
  content.data = GENESIS_DATA;
  content.previousHash = "";
  content.proposer = proposer;
  return Record(std::move(content));
}

Ledger::Roe<void> Ledger::validateGenesis(const Record &genesis) {
  if (genesis.getIndex() != 0) {
    return Error(E_GENESIS, "Genesis index must be 0, got " +
                                std::to_string(genesis.getIndex()));
  }
  if (!genesis.getPreviousHash().empty()) {
    return Error(E_GENESIS, "Genesis previous hash must be empty");
  }
  if (!genesis.isHashValid()) {
    return Error(E_GENESIS, "Genesis hash does not match its content");
  }
  if (genesis.getContent().hasAnnotationConflict()) {
    return Error(E_GENESIS, "Genesis carries both proposer and nonce");
  }
  return {};
}

Ledger::Roe<Record> Ledger::tip() const {
  if (records_.empty()) {
    return Error(E_EMPTY_LEDGER, "Ledger has no genesis record");
  }
  return records_.back();
}

Ledger::Roe<Record> Ledger::getRecord(uint64_t index) const {
  if (index >= records_.size()) {
    return Error(E_RECORD_NOT_FOUND,
                 "Record " + std::to_string(index) + " not found (size " +
                     std::to_string(records_.size()) + ")");
  }
  return records_[index];
}

std::string Ledger::getLastHash() const {
  if (records_.empty()) {
    return "";
  }
  return records_.back().getHash();
}

Ledger::Roe<void> Ledger::checkAppend(const Record &record) const {
  if (records_.empty()) {
    return Error(E_EMPTY_LEDGER, "Ledger has no genesis record");
  }
  const Record &last = records_.back();

  if (record.getIndex() != last.getIndex() + 1) {
    return Error(E_CHAIN_INDEX, "Expected index " +
                                    std::to_string(last.getIndex() + 1) +
                                    ", got " + std::to_string(record.getIndex()));
  }
  if (record.getPreviousHash() != last.getHash()) {
    return Error(E_CHAIN_LINK, "Previous hash " + record.getPreviousHash() +
                                   " does not match tip " + last.getHash());
  }
  if (record.getContent().hasAnnotationConflict()) {
    return Error(E_CHAIN_ANNOTATION,
                 "Record carries both a proposer and a nonce");
  }
  if (!record.isHashValid()) {
    return Error(E_CHAIN_HASH, "Record hash " + record.getHash() +
                                   " does not match its content");
  }
  return {};
}

bool Ledger::isValid() const {
  if (records_.empty() || !validateGenesis(records_.front())) {
    return false;
  }
  auto checks = verify();
  return std::all_of(checks.begin(), checks.end(), [](bool ok) { return ok; });
}

nlohmann::json Ledger::toJson() const {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &record : records_) {
    j.push_back(record.toJson());
  }
  return j;
}

Ledger::Roe<void> Ledger::append(const Record &record) {
  auto result = checkAppend(record);
  if (!result) {
    log().warning << "Append rejected: " << result.error().message;
    return result;
  }
  records_.push_back(record);
  log().debug << "Appended record " << record.getIndex() << " hash "
              << record.getHash();
  return {};
}

} // namespace ql

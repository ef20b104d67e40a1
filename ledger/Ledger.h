#pragma once

#include "Module.h"
#include "Record.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ql {

/**
 * Append-only hash-chained sequence of Records.
 *
 * Index 0 is always the genesis Record with an empty previous hash. The only
 * mutation is append(), which either extends the chain by one linked Record
 * or leaves it untouched.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Structural errors (1-9)
  constexpr static int32_t E_EMPTY_LEDGER = 1;     // No genesis record
  constexpr static int32_t E_RECORD_NOT_FOUND = 2; // Index out of range
  constexpr static int32_t E_GENESIS = 3;          // Malformed genesis record

  // Chain integrity errors (10-19)
  constexpr static int32_t E_CHAIN_INDEX = 10;      // Index not tip + 1
  constexpr static int32_t E_CHAIN_LINK = 11;       // Previous hash mismatch
  constexpr static int32_t E_CHAIN_HASH = 12;       // Self hash does not recompute
  constexpr static int32_t E_CHAIN_ANNOTATION = 13; // Both proposer and nonce set

  static bool isChainIntegrityError(int32_t code) {
    return code >= E_CHAIN_INDEX && code <= E_CHAIN_ANNOTATION;
  }

  static constexpr const char *GENESIS_DATA = "Genesis Block";

  /**
   * Lazy range over the integrity of every adjacent pair (i - 1, i).
   * Dereferencing the iterator evaluates one pair: true when record i links
   * to record i - 1 and record i's hash recomputes.
   */
  class IntegrityChecks {
  public:
    class Iterator {
    public:
      using iterator_category = std::input_iterator_tag;
      using value_type = bool;
      using difference_type = std::ptrdiff_t;
      using pointer = void;
      using reference = bool;

      Iterator() = default;
      Iterator(const std::vector<Record> *records, size_t index)
          : records_(records), index_(index) {}

      bool operator*() const;
      Iterator &operator++() {
        ++index_;
        return *this;
      }
      Iterator operator++(int) {
        Iterator tmp = *this;
        ++index_;
        return tmp;
      }
      bool operator==(const Iterator &other) const { return index_ == other.index_; }
      bool operator!=(const Iterator &other) const { return index_ != other.index_; }

      // Index of the later record of the pair being checked
      size_t getIndex() const { return index_; }

    private:
      const std::vector<Record> *records_{ nullptr };
      size_t index_{ 0 };
    };

    explicit IntegrityChecks(const std::vector<Record> &records) : records_(records) {}

    Iterator begin() const { return Iterator(&records_, 1); }
    Iterator end() const {
      return Iterator(&records_, records_.size() < 1 ? 1 : records_.size());
    }
    size_t size() const { return records_.empty() ? 0 : records_.size() - 1; }

  private:
    const std::vector<Record> &records_;
  };

  /**
   * Ledger with the default genesis Record
   */
  Ledger();

  /**
   * Ledger rooted at a caller-built genesis Record (index 0, empty previous
   * hash, valid self hash). An invalid genesis is replaced by the default one
   * and the problem is logged; use validateGenesis() first to reject it.
   */
  explicit Ledger(Record genesis);

  ~Ledger() override = default;

  static Record makeGenesis(const std::string &proposer = "");
  static Roe<void> validateGenesis(const Record &genesis);

  // ----- accessors -----
  Roe<Record> tip() const;
  Roe<Record> getRecord(uint64_t index) const;
  size_t getSize() const { return records_.size(); }
  const std::vector<Record> &getRecords() const { return records_; }
  std::string getLastHash() const;

  /**
   * Check that `record` could be appended right now, without appending it
   */
  Roe<void> checkAppend(const Record &record) const;

  IntegrityChecks verify() const { return IntegrityChecks(records_); }
  bool isValid() const;

  nlohmann::json toJson() const;

  // ----- methods -----
  Roe<void> append(const Record &record);

private:
  std::vector<Record> records_;
};

} // namespace ql

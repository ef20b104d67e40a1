#ifndef QL_UTILITIES_H
#define QL_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace ql {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Current wall-clock time in nanoseconds since the epoch
 */
int64_t getCurrentTimeNanos();

/**
 * Compute SHA-256 hash of input string
 * @param input Input string to hash
 * @return Lowercase hex string (64 characters)
 * @throws std::runtime_error if the OpenSSL digest fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as lowercase hex
 */
std::string hexEncode(const std::string &data);

/**
 * True if the first `count` characters of `hex` are all '0'.
 * A string shorter than `count` never qualifies.
 */
bool hasLeadingZeros(const std::string &hex, size_t count);

/**
 * Join strings with a delimiter
 */
std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter);

/**
 * Split "key=value" at the first '='
 * @return Error if there is no '=' or either side is empty
 */
Roe<std::pair<std::string, std::string>> parseKeyValue(const std::string &str);

/**
 * Parse a decimal unsigned 64-bit integer; digits only, no sign or spaces
 * @return Error 1 on a malformed number, 2 when it does not fit
 */
Roe<uint64_t> parseUint64(const std::string &str);

/**
 * Load and parse a JSON file
 * @param path Path to the file
 * @return Parsed JSON or error (1: not found, 2: unreadable, 3: parse error)
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

} // namespace utl
} // namespace ql

#endif // QL_UTILITIES_H

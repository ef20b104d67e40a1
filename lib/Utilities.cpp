#include "Utilities.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace ql {
namespace utl {

int64_t getCurrentTimeNanos() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// OpenSSL 3.0 EVP API
std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  EVP_MD_CTX_free(mdctx);

  return hexEncode(std::string(reinterpret_cast<const char *>(hash), hashLen));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

bool hasLeadingZeros(const std::string &hex, size_t count) {
  if (hex.size() < count) {
    return false;
  }
  for (size_t i = 0; i < count; ++i) {
    if (hex[i] != '0') {
      return false;
    }
  }
  return true;
}

std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < strings.size(); ++i) {
    if (i > 0) {
      result += delimiter;
    }
    result += strings[i];
  }
  return result;
}

Roe<std::pair<std::string, std::string>> parseKeyValue(const std::string &str) {
  size_t pos = str.find('=');
  if (pos == std::string::npos) {
    return Error(1, "Expected key=value, got: " + str);
  }
  std::string key = str.substr(0, pos);
  std::string value = str.substr(pos + 1);
  if (key.empty() || value.empty()) {
    return Error(2, "Empty key or value in: " + str);
  }
  return std::make_pair(key, value);
}

Roe<uint64_t> parseUint64(const std::string &str) {
  if (str.empty() ||
      !std::all_of(str.begin(), str.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return Error(1, "Expected an unsigned integer, got: " + str);
  }
  try {
    return static_cast<uint64_t>(std::stoull(str));
  } catch (const std::out_of_range &) {
    return Error(2, "Integer out of range: " + str);
  }
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "Configuration file not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open configuration file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }
}

} // namespace utl
} // namespace ql

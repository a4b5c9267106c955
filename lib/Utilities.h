#ifndef WS_SYNC_UTILITIES_H
#define WS_SYNC_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ws {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

/**
 * Parse a 64-bit unsigned integer from a string
 * @return true if parsing succeeded, false otherwise
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Join a vector of strings with a delimiter
 */
std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON object or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

/**
 * Write a string to a file, replacing any previous content.
 * Creates parent directories if needed.
 */
Roe<void> writeToFile(const std::string &filePath, const std::string &content);

/**
 * Compute SHA-256 hash using Libsodium
 * @return Lowercase hexadecimal representation of the hash
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as lowercase hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);

} // namespace utl
} // namespace ws

#endif // WS_SYNC_UTILITIES_H

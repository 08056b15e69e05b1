#ifndef TALLY_UTILITIES_H
#define TALLY_UTILITIES_H

#include "ResultOrError.hpp"
#include "Serialize.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace tally {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Parse a 128-bit unsigned decimal integer.
 * Rejects empty input, signs, non-digits and values above 2^128 - 1.
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if parsing succeeded, false otherwise
 */
bool parseUInt128(const std::string &str, uint128 &value);

/** Decimal representation of a 128-bit unsigned integer */
std::string toString(uint128 value);

/**
 * Encode binary data as lowercase hex string
 * @param data Raw bytes
 * @return Hex string (two chars per byte)
 */
std::string hexEncode(const std::string &data);
std::string hexEncode(const uint8_t *data, size_t size);

/**
 * Decode hex string back to binary
 * @param hex Hex string (even length, 0-9a-fA-F)
 * @return Decoded bytes, or error if input is not valid hex
 */
Roe<std::string> hexDecode(const std::string &hex);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Parsed JSON object or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

} // namespace utl
} // namespace tally

#endif // TALLY_UTILITIES_H

#ifndef MINICHAIN_UTILITIES_H
#define MINICHAIN_UTILITIES_H

#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace mc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

// Hex decoding error codes
constexpr int32_t E_HEX_LENGTH = 1;
constexpr int32_t E_HEX_CHAR = 2;

/**
 * Get the current time in seconds since the epoch
 */
int64_t getCurrentTime();

/**
 * Parse an integer from a string
 * @return true if the whole string parsed
 */
bool parseInt(const std::string &str, int &value);

/**
 * Parse a port number from a string (validates range 0-65535)
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components
 * @return false when either part is missing or the port is out of range
 */
bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port);

/**
 * Load and parse a JSON file
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

// Integral and >= 0, whether the parser stored it signed or unsigned
bool isNonNegativeInteger(const nlohmann::json &value);

/**
 * Encode binary data as lowercase hex, two characters per byte
 */
std::string hexEncode(const std::string &data);
std::string hexEncode(const uint8_t *data, size_t size);

/**
 * Decode a hex string back to binary. Digits are case-insensitive.
 * Fails with E_HEX_LENGTH for odd-length input and E_HEX_CHAR for a
 * character outside 0-9a-fA-F.
 */
Roe<std::string> hexDecode(const std::string &hex);

} // namespace utl
} // namespace mc

#endif // MINICHAIN_UTILITIES_H

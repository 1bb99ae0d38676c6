#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace mc {
namespace utl {

namespace {

const char HEX_DIGITS[] = "0123456789abcdef";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

bool parseInt(const std::string &str, int &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parsePort(const std::string &str, uint16_t &port) {
  int portInt = 0;
  if (!parseInt(str, portInt)) {
    return false;
  }
  if (portInt < 0 || portInt > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(portInt);
  return true;
}

bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port) {
  size_t colonPos = hostPort.find_last_of(':');
  if (colonPos == std::string::npos || colonPos == 0 ||
      colonPos == hostPort.length() - 1) {
    return false;
  }

  host = hostPort.substr(0, colonPos);
  return parsePort(hostPort.substr(colonPos + 1), port);
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }
}

bool isNonNegativeInteger(const nlohmann::json &value) {
  return value.is_number_unsigned() ||
         (value.is_number_integer() && value.get<int64_t>() >= 0);
}

std::string hexEncode(const uint8_t *data, size_t size) {
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(HEX_DIGITS[data[i] >> 4]);
    out.push_back(HEX_DIGITS[data[i] & 0x0f]);
  }
  return out;
}

std::string hexEncode(const std::string &data) {
  return hexEncode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

Roe<std::string> hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return Error(E_HEX_LENGTH,
                 "Odd hex string length: " + std::to_string(hex.size()));
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return Error(E_HEX_CHAR,
                   "Invalid hex character at offset " +
                       std::to_string(hi < 0 ? i : i + 1));
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

} // namespace utl
} // namespace mc

#include "Utilities.h"

#include <filesystem>
#include <fstream>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace tally {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
  struct SodiumInitializer {
    SodiumInitializer() {
      if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
      }
    }
  };
  static SodiumInitializer sodium_initializer;
}

bool parseUInt128(const std::string &str, uint128 &value) {
  if (str.empty()) {
    return false;
  }
  const uint128 max = ~static_cast<uint128>(0);
  uint128 result = 0;
  for (char c : str) {
    if (c < '0' || c > '9') {
      return false;
    }
    uint128 digit = static_cast<uint128>(c - '0');
    if (result > (max - digit) / 10) {
      return false;
    }
    result = result * 10 + digit;
  }
  value = result;
  return true;
}

std::string toString(uint128 value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value > 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  return std::string(digits.rbegin(), digits.rend());
}

std::string hexEncode(const uint8_t *data, size_t size) {
  std::vector<char> hex(size * 2 + 1);
  sodium_bin2hex(hex.data(), hex.size(), data, size);
  return std::string(hex.data(), size * 2);
}

std::string hexEncode(const std::string &data) {
  return hexEncode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

Roe<std::string> hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return Error(1, "Hex string has odd length");
  }
  std::string bin(hex.size() / 2, '\0');
  size_t binLen = 0;
  const char *end = nullptr;
  if (sodium_hex2bin(reinterpret_cast<unsigned char *>(&bin[0]), bin.size(),
                     hex.c_str(), hex.size(), nullptr, &binLen, &end) != 0 ||
      end != hex.c_str() + hex.size()) {
    return Error(2, "Invalid hex string");
  }
  bin.resize(binLen);
  return bin;
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

} // namespace utl
} // namespace tally

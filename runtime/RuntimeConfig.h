#pragma once

#include "../lib/Utilities.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace tally {

/**
 * Consensus parameters injected into Sealer and Executor.
 * Producer and verifier must run with the same values.
 */
struct RuntimeConfig {
  constexpr static int32_t E_DIFFICULTY_RANGE = 1;
  constexpr static int32_t E_NOT_OBJECT = 2;
  constexpr static int32_t E_TYPE = 3;
  constexpr static int32_t E_FILE = 4; // missing, unreadable or not JSON

  constexpr static uint32_t DEFAULT_DIFFICULTY = 2;
  constexpr static uint32_t MAX_DIFFICULTY = 32; // whole digest

  uint32_t difficulty{ DEFAULT_DIFFICULTY }; // required leading zero bytes
  uint64_t maxSealAttempts{ 0 };             // 0 = unbounded

  Roe<void> validate() const;

  nlohmann::json toJson() const;

  /**
   * Build a config from JSON. Missing keys keep their defaults.
   * Example: {"difficulty": 2, "maxSealAttempts": 0}
   */
  static Roe<RuntimeConfig> fromJson(const nlohmann::json &j);
  static Roe<RuntimeConfig> loadFile(const std::string &path);
};

std::ostream &operator<<(std::ostream &os, const RuntimeConfig &config);

} // namespace tally

#include "RuntimeConfig.h"

namespace tally {

Roe<void> RuntimeConfig::validate() const {
  if (difficulty > MAX_DIFFICULTY) {
    return Error(E_DIFFICULTY_RANGE, "difficulty must be at most " +
                                         std::to_string(MAX_DIFFICULTY) +
                                         ", got " + std::to_string(difficulty));
  }
  return {};
}

nlohmann::json RuntimeConfig::toJson() const {
  nlohmann::json j;
  j["difficulty"] = difficulty;
  j["maxSealAttempts"] = maxSealAttempts;
  return j;
}

Roe<RuntimeConfig> RuntimeConfig::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_NOT_OBJECT, "runtime config must be a JSON object");
  }

  RuntimeConfig config;
  if (j.contains("difficulty")) {
    if (!j["difficulty"].is_number_unsigned()) {
      return Error(E_TYPE, "difficulty must be a non-negative integer");
    }
    auto value = j["difficulty"].get<uint64_t>();
    if (value > MAX_DIFFICULTY) {
      return Error(E_DIFFICULTY_RANGE, "difficulty must be at most " +
                                           std::to_string(MAX_DIFFICULTY) +
                                           ", got " + std::to_string(value));
    }
    config.difficulty = static_cast<uint32_t>(value);
  }
  if (j.contains("maxSealAttempts")) {
    if (!j["maxSealAttempts"].is_number_unsigned()) {
      return Error(E_TYPE, "maxSealAttempts must be a non-negative integer");
    }
    config.maxSealAttempts = j["maxSealAttempts"].get<uint64_t>();
  }
  return config;
}

Roe<RuntimeConfig> RuntimeConfig::loadFile(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_FILE, "Failed to load runtime config: " +
                             jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

std::ostream &operator<<(std::ostream &os, const RuntimeConfig &config) {
  os << "RuntimeConfig{difficulty=" << config.difficulty
     << ", maxSealAttempts=" << config.maxSealAttempts << "}";
  return os;
}

} // namespace tally

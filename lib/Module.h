#pragma once

#include "Logger.h"
#include <string>

namespace tally {

/**
 * Base class for runtime components that log.
 *
 * Each component owns one node of the logger tree, named after it
 * ("tally.Sealer", "tally.MemoryStore", ...). A host can tune verbosity per
 * component with setLogLevel() or move the whole subtree under its own
 * logger with redirectLogger().
 */
class Module {
public:
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /** Name the module was registered under; stable across redirects */
  const std::string &getModuleName() const { return name_; }

  void setLogLevel(logging::Level level);

  /**
   * Move this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const;

private:
  std::string name_;
  mutable logging::Logger logger_;
};

} // namespace tally

#include "Module.h"

namespace tally {

Module::Module(const std::string &name)
    : name_(name), logger_(logging::getLogger(name)) {}

void Module::setLogLevel(logging::Level level) { logger_.setLevel(level); }

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_.redirectTo(targetLoggerName);
}

logging::Logger &Module::log() const { return logger_; }

} // namespace tally

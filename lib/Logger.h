#ifndef TALLY_LOGGER_H
#define TALLY_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace tally {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

// Upper-case name as it appears in formatted records
const char *levelName(Level level);

// Accepts "debug", "info", "warning", "error", "critical" in any case
bool parseLevel(const std::string &name, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
};

class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  // Stream operator that creates LogStream
  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

/**
 * Collects one message and hands it to the logger when destroyed,
 * so a whole `log().info << a << b` chain becomes a single record.
 */
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// LoggerNode - Internal tree node structure
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);
  ~LoggerNode() = default;

  void setLevel(Level level);
  // Own level if set, otherwise the nearest ancestor's
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);
  void clearHandlers();

  // Control log propagation to parent
  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void setParent(std::weak_ptr<LoggerNode> parent) { parent_ = parent; }
  std::shared_ptr<LoggerNode> getParent() const { return parent_.lock(); }
  void addChild(std::shared_ptr<LoggerNode> child);
  void removeChild(LoggerNode *child);

  void log(Level level, const std::string &message);

  // Name access - only stores node name, not full path
  const std::string &getName() const { return name_; }
  std::string getFullName() const;

private:
  void logToHandlers(Level level, const std::string &message,
                     const std::string &originName);
  std::string formatMessage(Level level, const std::string &message,
                            const std::string &originName) const;
  void logFrom(Level level, const std::string &message,
               const std::string &originName);

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{ Level::DEBUG };
  bool hasLevel_{ false };
  bool propagate_{ true };
  std::vector<std::weak_ptr<LoggerNode>> children_;
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Logger - Lightweight wrapper providing access to LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);
  ~Logger() = default;

  // Stream-style logging
  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { node_->setLevel(level); }
  Level getLevel() const { return node_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) { node_->addHandler(spHandler); }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG) {
    node_->addFileHandler(filename, level);
  }
  void clearHandlers() { node_->clearHandlers(); }

  void setPropagate(bool propagate) { node_->setPropagate(propagate); }
  bool getPropagate() const { return node_->getPropagate(); }

  // Tree structure: move this logger (and all its children) under another logger
  void redirectTo(const std::string &targetLoggerName);

  Logger getParent() const;

  const std::string &getName() const { return node_->getName(); }
  std::string getFullName() const { return node_->getFullName(); }

  bool operator==(const Logger &other) const { return node_ == other.node_; }
  bool operator!=(const Logger &other) const { return node_ != other.node_; }

private:
  friend class LogStream;

  void log(Level level, const std::string &message) {
    if (node_) {
      node_->log(level, message);
    }
  }

  std::shared_ptr<LoggerNode> node_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Global logger management
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace tally

#endif // TALLY_LOGGER_H

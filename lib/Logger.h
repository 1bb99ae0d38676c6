#ifndef MINICHAIN_LOGGER_H
#define MINICHAIN_LOGGER_H

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace mc {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

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
  std::mutex mutex_;
  std::ofstream file_;
  std::string filename_;
};

class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

  // Values sent to a disabled level are not formatted at all
  template <typename T> LogStream &operator<<(const T &value) {
    if (enabled_) {
      stream_ << value;
    }
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool enabled_;
  bool moved_;
};

// Tree node shared by every Logger wrapper with the same full name
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);
  ~LoggerNode() = default;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void setParent(std::weak_ptr<LoggerNode> parent);
  std::shared_ptr<LoggerNode> getParent() const;
  void addChild(const std::shared_ptr<LoggerNode> &child);
  void removeChild(const LoggerNode *child);
  std::vector<std::shared_ptr<LoggerNode>> getChildren() const;

  void log(Level level, const std::string &message);

  // Node name only, e.g. "node" for "mc.node"
  const std::string &getName() const { return name_; }
  std::string getFullName() const;

private:
  void log(Level level, const std::string &message,
           const std::string &originName);
  std::string formatMessage(Level level, const std::string &message,
                            const std::string &originName) const;

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  std::atomic<Level> level_{ Level::DEBUG };
  std::atomic<bool> propagate_{ true };
  std::vector<std::weak_ptr<LoggerNode>> children_;
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight wrapper around a LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);
  ~Logger() = default;

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }
  bool isEnabledFor(Level level) const {
    return spNode_ && level >= spNode_->getLevel();
  }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(spHandler);
  }
  void addFileHandler(const std::string &filename,
                      Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  // Move this logger (and its children) under another logger in the tree
  void redirectTo(const std::string &targetLoggerName);

  Logger getParent() const;
  std::vector<Logger> getChildren() const;

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;
  friend Logger getLogger(const std::string &name);

  void log(Level level, const std::string &message) {
    if (spNode_) {
      spNode_->log(level, message);
    }
  }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

Logger getLogger(const std::string &name);
Logger getRootLogger();

const char *levelToString(Level level);

} // namespace logging
} // namespace mc

#endif // MINICHAIN_LOGGER_H

#include "Logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace mc {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

// Every logger ever requested, by full name. Nodes live as long as the process.
struct Registry {
  std::recursive_mutex mutex;
  std::unordered_map<std::string, std::shared_ptr<LoggerNode>> nodes;
};

static Registry &registry() {
  static Registry instance;
  return instance;
}

static std::mutex &getConsoleMutex() {
  static std::mutex mutex;
  return mutex;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tmBuf{};
  localtime_r(&time, &tmBuf);
  std::stringstream ss;
  ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

const char *levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

// ConsoleHandler

void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(getConsoleMutex());
  if (level >= Level::WARNING) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

// FileHandler

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

// LogProxy / LogStream

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level),
      enabled_(logger && logger->isEnabledFor(level)), moved_(false) {}

LogStream::~LogStream() {
  if (enabled_ && !moved_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), enabled_(other.enabled_),
      moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    enabled_ = other.enabled_;
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

void LoggerNode::setParent(std::weak_ptr<LoggerNode> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto current = std::const_pointer_cast<LoggerNode>(shared_from_this());
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::addChild(const std::shared_ptr<LoggerNode> &child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(child);
}

void LoggerNode::removeChild(const LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [child](const std::weak_ptr<LoggerNode> &weak) {
                                   auto ptr = weak.lock();
                                   return !ptr || ptr.get() == child;
                                 }),
                  children_.end());
}

std::vector<std::shared_ptr<LoggerNode>> LoggerNode::getChildren() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<LoggerNode>> result;
  for (const auto &weak : children_) {
    if (auto child = weak.lock()) {
      result.push_back(child);
    }
  }
  return result;
}

void LoggerNode::log(Level level, const std::string &message) {
  log(level, message, getFullName());
}

// Handlers format with the name of the logger the message originated from,
// so a redirected or propagated record still names its source.
void LoggerNode::log(Level level, const std::string &message,
                     const std::string &originName) {
  if (level < level_) {
    return;
  }

  std::vector<std::shared_ptr<Handler>> handlers;
  std::shared_ptr<LoggerNode> parent;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
    parent = propagate_ ? parent_.lock() : nullptr;
  }

  if (!handlers.empty()) {
    std::string formatted = formatMessage(level, message, originName);
    for (auto &spHandler : handlers) {
      spHandler->emit(level, originName, formatted);
    }
  }

  if (parent) {
    parent->log(level, message, originName);
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &originName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(std::move(node)) {}

// Proxies hold a pointer to their owning Logger and must not be copied
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

std::vector<Logger> Logger::getChildren() const {
  std::vector<Logger> result;
  if (!spNode_) {
    return result;
  }
  for (const auto &child : spNode_->getChildren()) {
    result.emplace_back(child);
  }
  return result;
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto target = getLogger(targetLoggerName);
  auto targetNode = target.spNode_;
  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  for (auto ancestor = targetNode; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }

  if (auto oldParent = spNode_->getParent()) {
    oldParent->removeChild(spNode_.get());
  }
  spNode_->setParent(targetNode);
  targetNode->addChild(spNode_);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::string fullName = trimLeadingDot(name);
  auto &reg = registry();
  std::lock_guard<std::recursive_mutex> lock(reg.mutex);

  auto it = reg.nodes.find(fullName);
  if (it != reg.nodes.end()) {
    return Logger(it->second);
  }

  // "mc.node.miner" is node "miner" under "mc.node"
  auto lastDot = fullName.rfind('.');
  std::string nodeName =
      lastDot == std::string::npos ? fullName : fullName.substr(lastDot + 1);
  auto node = std::make_shared<LoggerNode>(nodeName);
  reg.nodes[fullName] = node;

  if (fullName.empty()) {
    // Only the root logger writes to the console by default
    node->addHandler(std::make_shared<ConsoleHandler>());
  } else {
    std::string parentName =
        lastDot == std::string::npos ? "" : fullName.substr(0, lastDot);
    auto parent = getLogger(parentName);
    node->setParent(parent.spNode_);
    parent.spNode_->addChild(node);
  }
  return Logger(node);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace mc

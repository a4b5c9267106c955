#include "Logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace ws {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

// Keyed by full dotted name, root is ""
static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tmLocal{};
  localtime_r(&time, &tmLocal);

  std::stringstream ss;
  ss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
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

bool parseLevel(const std::string &str, Level &level) {
  static const Level levels[] = { Level::DEBUG, Level::INFO, Level::WARNING,
                                  Level::ERROR, Level::CRITICAL };
  for (Level candidate : levels) {
    if (levelToString(candidate) == str) {
      level = candidate;
      return true;
    }
  }
  return false;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::clog << message << std::endl;
}

// FileHandler implementation
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
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

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

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::setParent(std::weak_ptr<LoggerNode> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(child);
}

void LoggerNode::removeChild(LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [child](const std::weak_ptr<LoggerNode> &weak) {
                                   auto ptr = weak.lock();
                                   return !ptr || ptr.get() == child;
                                 }),
                  children_.end());
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  logFrom(level, message, getFullName());
}

void LoggerNode::logFrom(Level level, const std::string &message,
                         const std::string &originName) {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
  }
  if (!handlers.empty()) {
    std::string formatted = formatMessage(level, message, originName);
    for (auto &spHandler : handlers) {
      spHandler->emit(level, originName, formatted);
    }
  }

  if (propagate_) {
    auto parentNode = getParent();
    if (parentNode) {
      parentNode->logFrom(level, message, originName);
    }
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
      critical(this, Level::CRITICAL), spNode_(node) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

// Proxies hold a pointer to their owning Logger, so copies rebind them
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  auto parentNode = spNode_->getParent();
  if (parentNode) {
    return Logger(parentNode);
  }
  return getRootLogger();
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto targetNode = logging::getLogger(targetLoggerName).spNode_;

  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  auto ancestor = targetNode;
  while (ancestor) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
    ancestor = ancestor->getParent();
  }

  auto oldParent = spNode_->getParent();
  if (oldParent) {
    oldParent->removeChild(spNode_.get());
  }

  spNode_->setParent(targetNode);
  targetNode->addChild(spNode_);
}

// ========== Global logger management ==========

static std::shared_ptr<LoggerNode> getOrCreateRootLocked() {
  auto &registry = getLoggerRegistry();
  auto it = registry.find("");
  if (it != registry.end()) {
    return it->second;
  }
  auto root = std::make_shared<LoggerNode>("");
  root->addHandler(std::make_shared<ConsoleHandler>());
  registry[""] = root;
  return root;
}

Logger getLogger(const std::string &name) {
  std::string trimmedName = trimLeadingDot(name);
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  auto &registry = getLoggerRegistry();

  auto parent = getOrCreateRootLocked();
  if (trimmedName.empty()) {
    return Logger(parent);
  }

  // Create every missing ancestor along the dotted path
  size_t start = 0;
  while (true) {
    size_t dot = trimmedName.find('.', start);
    std::string path =
        dot == std::string::npos ? trimmedName : trimmedName.substr(0, dot);
    std::string nodeName = dot == std::string::npos
                               ? trimmedName.substr(start)
                               : trimmedName.substr(start, dot - start);

    auto it = registry.find(path);
    if (it == registry.end()) {
      auto node = std::make_shared<LoggerNode>(nodeName);
      node->setParent(parent);
      parent->addChild(node);
      registry[path] = node;
      parent = node;
    } else {
      parent = it->second;
    }

    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }

  return Logger(parent);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace ws

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace ql {
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

  std::tm local{};
  localtime_r(&time, &local);

  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
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

ResultOrError<Level, RoeErrorBase> levelFromString(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") {
    return Level::DEBUG;
  }
  if (upper == "INFO") {
    return Level::INFO;
  }
  if (upper == "WARNING" || upper == "WARN") {
    return Level::WARNING;
  }
  if (upper == "ERROR") {
    return Level::ERROR;
  }
  if (upper == "CRITICAL") {
    return Level::CRITICAL;
  }
  return RoeErrorBase(1, "Unknown log level: " + name);
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cerr << message << std::endl;
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

// MemoryHandler implementation
MemoryHandler::MemoryHandler(size_t capacity) : capacity_(capacity) {}

void MemoryHandler::emit(Level level, const std::string &loggerName,
                         const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back({level, loggerName, message});
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

std::vector<MemoryHandler::Entry> MemoryHandler::getEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<Entry>(entries_.begin(), entries_.end());
}

size_t MemoryHandler::countContaining(const std::string &needle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(entries_.begin(), entries_.end(), [&](const Entry &e) {
        return e.message.find(needle) != std::string::npos;
      }));
}

void MemoryHandler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
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

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  spChildren_.push_back(child);
}

void LoggerNode::removeChild(LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  spChildren_.erase(std::remove_if(spChildren_.begin(), spChildren_.end(),
                                   [child](const auto &spNode) {
                                     return spNode.get() == child;
                                   }),
                    spChildren_.end());
}

void LoggerNode::log(Level level, const std::string &message,
                     const std::string &origin) {
  if (level < level_) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!spHandlers_.empty()) {
      std::string formatted = formatMessage(level, message, origin);
      for (auto &spHandler : spHandlers_) {
        spHandler->emit(level, origin, formatted);
      }
    }
  }

  if (propagate_) {
    auto spParent = getParent();
    if (spParent) {
      spParent->log(level, message, origin);
    }
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &origin) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!origin.empty()) {
    ss << "[" << origin << "] ";
  }
  ss << message;
  return ss.str();
}

std::shared_ptr<LoggerNode> LoggerNode::getOrInitDirectChild(const std::string &name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &spChild : spChildren_) {
      if (spChild->getName() == name) {
        return spChild;
      }
    }
  }
  auto spChild = std::make_shared<LoggerNode>(name);
  spChild->setParent(weak_from_this());
  addChild(spChild);
  return spChild;
}

std::shared_ptr<LoggerNode> LoggerNode::getOrInitChild(const std::string &fullName) {
  auto spCurrent = shared_from_this();
  size_t start = 0;
  while (start <= fullName.size()) {
    size_t dot = fullName.find('.', start);
    std::string part = fullName.substr(
        start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!part.empty()) {
      spCurrent = spCurrent->getOrInitDirectChild(part);
    }
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return spCurrent;
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

// Proxies point at their owning Logger, so copies must rebind them
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

Logger Logger::getParent() const {
  auto spParent = spNode_->getParent();
  if (!spParent) {
    return getRootLogger();
  }
  return Logger(spParent);
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto target = getLogger(targetLoggerName);
  auto spTarget = target.spNode_;

  if (spTarget == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  for (auto ancestor = spTarget; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }

  std::lock_guard<std::mutex> lock(getRegistryMutex());
  auto spOldParent = spNode_->getParent();
  if (spOldParent) {
    spOldParent->removeChild(spNode_.get());
  }
  spNode_->setParent(spTarget);
  spTarget->addChild(spNode_);
}

// ========== Global logger management ==========

static std::shared_ptr<LoggerNode> getRootNode() {
  auto &registry = getLoggerRegistry();
  auto it = registry.find("");
  if (it != registry.end()) {
    return it->second;
  }
  auto spRoot = std::make_shared<LoggerNode>("");
  spRoot->setLevel(Level::INFO);
  spRoot->addHandler(std::make_shared<ConsoleHandler>());
  registry[""] = spRoot;
  return spRoot;
}

Logger getLogger(const std::string &name) {
  std::string trimmedName = trimLeadingDot(name);
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  auto &registry = getLoggerRegistry();

  auto it = registry.find(trimmedName);
  if (it != registry.end()) {
    return Logger(it->second);
  }

  auto spNode = getRootNode()->getOrInitChild(trimmedName);
  registry[trimmedName] = spNode;
  return Logger(spNode);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace ql

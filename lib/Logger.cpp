#include "Logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace pos {
namespace logging {

namespace {

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

// Keyed by full dotted name, root is ""
std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

std::string getCurrentTimestamp() {
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

std::string formatRecord(Level level, const std::string &originName,
                         const std::string &message) {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// Caller holds the registry mutex
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &fullName) {
  auto &registry = getRegistry();
  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return it->second;
  }

  std::string nodeName = fullName;
  std::shared_ptr<LoggerNode> spParent;
  if (!fullName.empty()) {
    auto lastDot = fullName.rfind('.');
    if (lastDot != std::string::npos) {
      nodeName = fullName.substr(lastDot + 1);
      spParent = getOrCreateNode(fullName.substr(0, lastDot));
    } else {
      spParent = getOrCreateNode("");
    }
  }

  auto spNode = std::make_shared<LoggerNode>(nodeName);
  if (spParent) {
    spNode->setParent(spParent);
  } else {
    // Root is the only node that writes to the console by default
    spNode->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[fullName] = spNode;
  return spNode;
}

} // namespace

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

// ========== Handlers ==========

void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::WARNING) {
    std::cerr << message << std::endl;
  } else {
    std::clog << message << std::endl;
  }
}

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
  }
}

// ========== LogProxy / LogStream ==========

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

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

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto spCurrent = shared_from_this();
  while (spCurrent && !spCurrent->getName().empty()) {
    parts.push_back(spCurrent->getName());
    spCurrent = spCurrent->getParent();
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
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::removeHandler(const std::shared_ptr<Handler> &spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.erase(
      std::remove(spHandlers_.begin(), spHandlers_.end(), spHandler),
      spHandlers_.end());
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::log(Level level, const std::string &message) {
  logFrom(level, message, getFullName());
}

void LoggerNode::logFrom(Level level, const std::string &message,
                         const std::string &originName) {
  if (level < level_) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!spHandlers_.empty()) {
      std::string formatted = formatRecord(level, originName, message);
      for (auto &spHandler : spHandlers_) {
        spHandler->emit(level, originName, formatted);
      }
    }
  }

  if (propagate_) {
    auto spParent = getParent();
    if (spParent) {
      spParent->logFrom(level, message, originName);
    }
  }
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(std::move(spNode)) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

// Proxies always point at their own handle, never at the source
Logger::Logger(const Logger &other)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace pos

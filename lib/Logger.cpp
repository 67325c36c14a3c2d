#include "Logger.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace hx {
namespace logging {

namespace {

struct Registry {
  std::mutex mutex;
  std::map<std::string, std::shared_ptr<LoggerNode>> nodes;
};

Registry &registry() {
  static Registry instance;
  return instance;
}

// Registry mutex must be held
std::shared_ptr<LoggerNode> findOrCreate(Registry &reg, const std::string &name) {
  auto it = reg.nodes.find(name);
  if (it != reg.nodes.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> node;
  if (name.empty()) {
    node = std::make_shared<LoggerNode>("");
    node->addHandler(std::make_shared<ConsoleHandler>());
  } else {
    auto dot = name.rfind('.');
    std::string parentName = dot == std::string::npos ? "" : name.substr(0, dot);
    node = std::make_shared<LoggerNode>(
        dot == std::string::npos ? name : name.substr(dot + 1));
    node->setParent(findOrCreate(reg, parentName));
  }
  reg.nodes.emplace(name, node);
  return node;
}

} // namespace

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
  }
  return "UNKNOWN";
}

std::string formatRecord(const Record &record) {
  auto seconds = std::chrono::system_clock::to_time_t(record.time);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    record.time.time_since_epoch())
                    .count() %
                1000;
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream out;
  out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << millis << "] ["
      << levelToString(record.level) << "] ";
  if (!record.loggerName.empty()) {
    out << '[' << record.loggerName << "] ";
  }
  out << record.message;
  return out.str();
}

// ----- handlers -----

void ConsoleHandler::emit(const Record &record) {
  auto &out = record.level >= Level::ERROR ? std::cerr : std::cout;
  out << formatRecord(record) << std::endl;
}

FileHandler::FileHandler(const std::string &path)
    : out_(path, std::ios::out | std::ios::app) {
  if (!out_) {
    throw std::runtime_error("Cannot open log file " + path);
  }
}

void FileHandler::emit(const Record &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << formatRecord(record) << '\n';
  out_.flush();
}

void MemoryHandler::emit(const Record &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
}

std::vector<Record> MemoryHandler::getRecords() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

size_t MemoryHandler::count(Level minLevel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t matching = 0;
  for (const auto &record : records_) {
    matching += record.level >= minLevel ? 1 : 0;
  }
  return matching;
}

void MemoryHandler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
}

// ----- LogStream -----

LogStream::LogStream(const Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      buffer_(std::move(other.buffer_)) {
  other.logger_ = nullptr;
}

LogStream::~LogStream() {
  if (logger_) {
    logger_->node_->publish(level_, buffer_.str());
  }
}

// ----- LoggerNode -----

std::string LoggerNode::getFullName() const {
  std::string fullName;
  for (auto node = shared_from_this(); node && !node->segment_.empty();
       node = node->getParent()) {
    fullName = fullName.empty() ? node->segment_ : node->segment_ + "." + fullName;
  }
  return fullName;
}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::setParent(const std::shared_ptr<LoggerNode> &parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

void LoggerNode::addHandler(std::shared_ptr<Handler> handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.push_back(std::move(handler));
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.clear();
}

std::vector<std::shared_ptr<Handler>> LoggerNode::handlers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_;
}

void LoggerNode::publish(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }
  Record record;
  record.level = level;
  record.loggerName = getFullName();
  record.message = message;
  record.time = std::chrono::system_clock::now();

  for (auto node = shared_from_this(); node; node = node->getParent()) {
    for (const auto &handler : node->handlers()) {
      handler->handle(record);
    }
    if (!node->getPropagate()) {
      break;
    }
  }
}

// ----- Logger -----

Logger::Logger(std::shared_ptr<LoggerNode> node) : node_(std::move(node)) {
  if (!node_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

void Logger::addFileHandler(const std::string &path, Level level) {
  auto handler = std::make_shared<FileHandler>(path);
  handler->setLevel(level);
  node_->addHandler(handler);
}

Logger Logger::getParent() const {
  auto parent = node_->getParent();
  return parent ? Logger(parent) : getRootLogger();
}

void Logger::redirectTo(const std::string &targetName) {
  auto target = getLogger(targetName).node_;
  for (auto node = target; node; node = node->getParent()) {
    if (node == node_) {
      throw std::invalid_argument("Redirecting " + getFullName() + " to " +
                                  targetName + " would form a cycle");
    }
  }
  node_->setParent(target);
}

Logger getLogger(const std::string &name) {
  std::string key = !name.empty() && name[0] == '.' ? name.substr(1) : name;
  auto &reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return Logger(findOrCreate(reg, key));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace hx

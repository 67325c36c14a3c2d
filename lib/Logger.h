#ifndef HX_LEDGER_LOGGER_H
#define HX_LEDGER_LOGGER_H

#include <chrono>
#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace hx {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

const char *levelToString(Level level);

/**
 * One log event as handed to handlers.
 * loggerName is the full dotted name of the logger that produced it, also
 * when the record reaches a handler on an ancestor.
 */
struct Record {
  Level level{ Level::DEBUG };
  std::string loggerName;
  std::string message;
  std::chrono::system_clock::time_point time;
};

// [YYYY-mm-dd HH:MM:SS.mmm] [LEVEL] [logger.name] message
std::string formatRecord(const Record &record);

class Handler {
public:
  virtual ~Handler() = default;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

  void handle(const Record &record) {
    if (record.level >= level_) {
      emit(record);
    }
  }

protected:
  virtual void emit(const Record &record) = 0;

private:
  Level level_{ Level::DEBUG };
};

// Errors and above go to stderr
class ConsoleHandler : public Handler {
protected:
  void emit(const Record &record) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &path);

protected:
  void emit(const Record &record) override;

private:
  std::mutex mutex_;
  std::ofstream out_;
};

/**
 * Keeps records in memory, unformatted.
 * The report surface counts critical events (data loss, integrity
 * violations) through it; tests assert on log output with it.
 */
class MemoryHandler : public Handler {
public:
  std::vector<Record> getRecords() const;
  size_t count(Level minLevel) const;
  void clear();

protected:
  void emit(const Record &record) override;

private:
  mutable std::mutex mutex_;
  std::vector<Record> records_;
};

class Logger;
class LoggerNode;

/**
 * Collects one message; the record is sent when the stream dies
 */
class LogStream {
public:
  LogStream(const Logger *logger, Level level);
  LogStream(LogStream &&other) noexcept;
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream &operator=(LogStream &&) = delete;

  template <typename T> LogStream &operator<<(const T &value) {
    buffer_ << value;
    return *this;
  }

private:
  const Logger *logger_;
  Level level_;
  std::ostringstream buffer_;
};

// logger.info << "a" << 1;
class LogProxy {
public:
  LogProxy(const Logger *logger, Level level) : logger_(logger), level_(level) {}

  template <typename T> LogStream operator<<(const T &value) const {
    LogStream stream(logger_, level_);
    stream << value;
    return stream;
  }

private:
  const Logger *logger_;
  Level level_;
};

// Named position in the logger tree. Holds its own name segment only.
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(std::string segment) : segment_(std::move(segment)) {}

  const std::string &getName() const { return segment_; }
  std::string getFullName() const;

  void setLevel(Level level);
  Level getLevel() const;
  void setPropagate(bool propagate);
  bool getPropagate() const;

  void setParent(const std::shared_ptr<LoggerNode> &parent);
  std::shared_ptr<LoggerNode> getParent() const;

  void addHandler(std::shared_ptr<Handler> handler);
  void clearHandlers();

  /**
   * Stamp and deliver a message to this node's handlers and, while
   * propagation allows, to every ancestor's handlers
   */
  void publish(Level level, const std::string &message);

private:
  std::vector<std::shared_ptr<Handler>> handlers() const;

  const std::string segment_;
  mutable std::mutex mutex_;
  std::weak_ptr<LoggerNode> parent_;
  std::vector<std::shared_ptr<Handler>> handlers_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
};

/**
 * Cheap handle on a LoggerNode; copies share the node
 */
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other) : Logger(other.node_) {}
  Logger &operator=(const Logger &other) {
    node_ = other.node_;
    return *this;
  }

  const LogProxy debug{ this, Level::DEBUG };
  const LogProxy info{ this, Level::INFO };
  const LogProxy warning{ this, Level::WARNING };
  const LogProxy error{ this, Level::ERROR };
  const LogProxy critical{ this, Level::CRITICAL };

  void setLevel(Level level) { node_->setLevel(level); }
  Level getLevel() const { return node_->getLevel(); }
  void setPropagate(bool propagate) { node_->setPropagate(propagate); }
  bool getPropagate() const { return node_->getPropagate(); }

  void addHandler(std::shared_ptr<Handler> handler) {
    node_->addHandler(std::move(handler));
  }
  void addFileHandler(const std::string &path, Level level = Level::DEBUG);
  void clearHandlers() { node_->clearHandlers(); }

  /**
   * Move this logger and its subtree under another logger.
   * Throws std::invalid_argument when that would form a cycle.
   */
  void redirectTo(const std::string &targetName);

  const std::string &getName() const { return node_->getName(); }
  std::string getFullName() const { return node_->getFullName(); }
  Logger getParent() const;

  bool operator==(const Logger &other) const { return node_ == other.node_; }
  bool operator!=(const Logger &other) const { return node_ != other.node_; }

private:
  friend class LogStream;

  std::shared_ptr<LoggerNode> node_;
};

// Dotted names; "" is the root, which alone owns a console handler
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace hx

#endif // HX_LEDGER_LOGGER_H

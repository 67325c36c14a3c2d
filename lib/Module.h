#pragma once

#include "Logger.h"
#include <memory>
#include <string>

namespace hx {

/**
 * Base class for components that need logging.
 * Binds one hierarchical logger per component instance.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "consensus.protocol")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const;

private:
  std::string loggerName_;
  std::shared_ptr<logging::Logger> spLogger_;
};

} // namespace hx

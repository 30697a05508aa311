#pragma once

#include "Logger.h"
#include <string>

namespace pos {

/**
 * Base class for components that log.
 * Each module writes through a named logger; owners nest the loggers of the
 * modules they hold by redirecting them under their own name.
 */
class Module {
public:
  /**
   * @param name Dotted logger name (e.g. "pos.Simulator"), root when empty
   */
  explicit Module(const std::string &name = "");
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-bind this module to another logger
   * @param targetLoggerName Dotted name of the logger to write to
   */
  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const { return logger_; }

private:
  mutable logging::Logger logger_;
};

} // namespace pos

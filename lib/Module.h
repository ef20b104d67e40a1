#ifndef QL_MODULE_H
#define QL_MODULE_H

#include "Logger.h"

#include <string>

namespace ql {

/**
 * Base class for components that log.
 * Each module owns a handle onto a named node of the logger tree.
 */
class Module {
public:
  /**
   * @param name Dotted logger name, e.g. "consensus.pbft"
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger
   * @param targetLoggerName Name of the new parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const { return logger_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace ql

#endif // QL_MODULE_H

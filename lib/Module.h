#ifndef WS_SYNC_MODULE_H
#define WS_SYNC_MODULE_H

#include "Logger.h"

#include <memory>
#include <string>

namespace ws {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "wallet.blistener")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Redirect this module's logger to another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Get the logger instance for this module.
   * Use this to access the logger in derived classes and externally.
   *
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::shared_ptr<logging::Logger> spLogger_;
};

} // namespace ws

#endif // WS_SYNC_MODULE_H

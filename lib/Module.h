#pragma once

#include "Logger.h"
#include <string>

namespace mc {

/**
 * Base class for components that log under their own named logger.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "mc.node.miner")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Move this module's logger under another logger in the tree.
   * @param targetLoggerName Name of the new parent logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Logger for this module; usable from const members.
   */
  logging::Logger &log() const;

private:
  mutable logging::Logger logger_;
};

} // namespace mc

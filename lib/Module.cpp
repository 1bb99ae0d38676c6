#include "Module.h"

namespace mc {

Module::Module(const std::string &name) : logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_.redirectTo(targetLoggerName);
}

logging::Logger &Module::log() const { return logger_; }

} // namespace mc

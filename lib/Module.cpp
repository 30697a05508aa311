#include "Module.h"

namespace pos {

Module::Module(const std::string &name) : logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_ = logging::getLogger(targetLoggerName);
}

} // namespace pos

// Library initialization
#include "kuberde/kuberde.hpp"

#include "core/version.hpp"
#include "log/log.h"

namespace kuberde {

void init(const std::string& name, const LogConfig& log) {
  init_log(name, log);
}

std::string version() {
  return KUBERDE_VERSION_STRING;
}

}  // namespace kuberde

// Library initialization
#include "a2a/a2a.hpp"

#include <spdlog/spdlog.h>

#include "a2a/log/log.h"
#include "a2a/version.hpp"

namespace a2a {

void init(const Config& config, bool console_log) {
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level, console_log);
  spdlog::info("[A2A] version {}", version());
}

std::string version() {
  return A2A_VERSION_STRING;
}

}  // namespace a2a

#include "bactopo/core/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "bactopo/core/error.hpp"

namespace bactopo::core {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] {
    instance = spdlog::get("bactopo");
    if (!instance) {
      instance = spdlog::stderr_color_mt("bactopo");
      instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
  });
  return instance;
}

void set_log_level(std::string_view level) {
  auto lvl = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (lvl == spdlog::level::off && level != "off") {
    throw ConfigError("unknown log level '" + std::string(level) + "'");
  }
  logger()->set_level(lvl);
}

} // namespace bactopo::core

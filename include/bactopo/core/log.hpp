/* Library logger (spdlog). */
#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace bactopo::core {

// Shared "bactopo" logger writing to stderr. Created on first use; safe to
// call from the discovery thread and the compare worker concurrently.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
// Throws ConfigError for anything else.
void set_log_level(std::string_view level);

} // namespace bactopo::core

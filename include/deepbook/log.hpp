// DeepBook SDK - Logging
// Shared spdlog logger for the SDK

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace deepbook::log {

// Logger named "deepbook", created on first use
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error", "critical", "off"; anything else means info
void set_level(std::string_view level);

}  // namespace deepbook::log

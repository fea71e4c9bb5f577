// DeepBook SDK - Logging Implementation

#include <deepbook/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace deepbook::log {

namespace {

constexpr const char* LOGGER_NAME = "deepbook";

std::mutex logger_mutex;

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) return existing;

    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::info);
    return created;
}

void set_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    logger()->set_level(parsed);
}

}  // namespace deepbook::log

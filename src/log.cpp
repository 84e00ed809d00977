// =============================================================================
// log.cpp - spdlog logger for the vault engine
// =============================================================================

#include "lev/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lev::log {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> shared_logger;

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex);
    if (!shared_logger) {
        shared_logger = spdlog::get("lev");
        if (!shared_logger) {
            shared_logger = spdlog::stdout_color_mt("lev");
            shared_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        }
    }
    return shared_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard lock(logger_mutex);
    shared_logger = std::move(replacement);
}

void set_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    logger()->set_level(parsed);
}

} // namespace lev::log

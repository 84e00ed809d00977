#ifndef LEV_LOG_HPP
#define LEV_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace lev::log {

// Shared "lev" logger, created on first use with a stdout color sink
std::shared_ptr<spdlog::logger> logger();

void set_logger(std::shared_ptr<spdlog::logger> logger);

// trace | debug | info | warn | error | critical | off
void set_level(std::string_view level);

} // namespace lev::log

#endif // LEV_LOG_HPP

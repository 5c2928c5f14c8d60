#include "fantasy_core/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fantasy_core {

namespace {
constexpr const char *kLoggerName = "fantasy_core";
std::once_flag g_logger_once;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::call_once(g_logger_once, [] {
    if (!spdlog::get(kLoggerName)) {
      auto lg = spdlog::stderr_color_mt(kLoggerName);
      lg->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
      lg->set_level(spdlog::level::info);
    }
  });
  return spdlog::get(kLoggerName);
}

bool set_log_level(const std::string &level) {
  const auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (lvl == spdlog::level::off && level != "off") {
    logger()->warn("Unknown log level '{}', keeping '{}'", level,
                   get_log_level());
    return false;
  }
  logger()->set_level(lvl);
  return true;
}

std::string get_log_level() {
  const auto sv = spdlog::level::to_string_view(logger()->level());
  return std::string(sv.data(), sv.size());
}

} // namespace fantasy_core

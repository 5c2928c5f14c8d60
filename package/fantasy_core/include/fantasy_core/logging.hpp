#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace fantasy_core {

// Shared "fantasy_core" logger writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names leave the level unchanged and return
// false.
bool set_log_level(const std::string &level);

std::string get_log_level();

} // namespace fantasy_core

#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace resqx {

// Library-wide logger named "resqx", writing to stderr.
// Created on first use; applications may replace its sinks through spdlog.
std::shared_ptr<spdlog::logger> logger();

// True for the level names spdlog understands
bool isLogLevel(std::string_view level);

// Adjust the logger threshold ("trace", "debug", "info", "warn", "error", "off")
// Unknown names leave the level unchanged and return false
bool setLogLevel(std::string_view level);

} // namespace resqx

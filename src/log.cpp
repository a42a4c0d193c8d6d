#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <resqx/log.hpp>

namespace resqx {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;

  std::call_once(once, [] {
    instance = spdlog::get("resqx");
    if (!instance) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      instance = std::make_shared<spdlog::logger>("resqx", sink);
      instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      instance->set_level(spdlog::level::warn);
      spdlog::register_logger(instance);
    }
  });
  return instance;
}

bool isLogLevel(std::string_view level) {
  static constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                               "error", "critical", "off"};
  for (std::string_view name : names) {
    if (name == level) {
      return true;
    }
  }
  return false;
}

bool setLogLevel(std::string_view level) {
  if (!isLogLevel(level)) {
    return false;
  }
  logger()->set_level(spdlog::level::from_str(std::string(level)));
  return true;
}

} // namespace resqx

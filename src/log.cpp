#include "log.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vocab::logging {

bool debug_session_enabled() {
  static const bool enabled = []() {
    const char* env = std::getenv("VOCAB_DEBUG_SESSION");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag flag;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(flag, []() {
    instance = spdlog::get("vocab");
    if (!instance) {
      instance = spdlog::stderr_color_mt("vocab");
    }
    instance->set_level(debug_session_enabled() ? spdlog::level::debug : spdlog::level::info);
  });
  return instance;
}

void set_level(const std::string& level) {
  const auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("Unknown log level: " + level);
  }
  if (debug_session_enabled() && parsed > spdlog::level::debug) {
    return;
  }
  logger()->set_level(parsed);
}

} // namespace vocab::logging

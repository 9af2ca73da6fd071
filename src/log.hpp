#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace vocab::logging {

// Shared "vocab" logger writing to stderr. Debug output is on when
// VOCAB_DEBUG_SESSION is set to anything but "", "0" or "false".
std::shared_ptr<spdlog::logger> logger();

bool debug_session_enabled();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off").
void set_level(const std::string& level);

} // namespace vocab::logging

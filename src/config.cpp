#include "vocab/config.hpp"

#include "json_bridge.hpp"
#include "log.hpp"

#include <fstream>

namespace vocab {

void EngineConfig::validate() const {
  if (max_interval_days < 1) {
    throw std::invalid_argument("max_interval_days must be at least 1, got " +
                                std::to_string(max_interval_days));
  }
  if (page_size == 0) {
    throw std::invalid_argument("page_size must be positive");
  }
  if (database_path.empty()) {
    throw std::invalid_argument("database_path must not be empty");
  }
  const auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    throw std::invalid_argument("Unknown log_level: " + log_level);
  }
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input) {
    throw std::runtime_error("Unable to open engine config: " + path.string());
  }
  nlohmann::json json_config;
  try {
    json_config = nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument("Malformed engine config " + path.string() + ": " + ex.what());
  }
  auto config = bridge::engine_config_from_json(json_config);
  logging::logger()->debug("loaded engine config from {}", path.string());
  return config;
}

} // namespace vocab

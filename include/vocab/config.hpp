#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace vocab {

struct EngineConfig {
  int max_interval_days = 32;
  std::size_t page_size = 100;
  std::string database_path = "vocab.sqlite3";
  std::string log_level = "info";

  void validate() const;
};

// Reads a JSON object; missing keys keep their defaults.
EngineConfig load_engine_config(const std::filesystem::path& path);

} // namespace vocab

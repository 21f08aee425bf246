#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace skillhub {

using json = nlohmann::json;

// Engine configuration
struct Config {
  std::string root;                 // Skill tree root (contains agents/ and skills/)
  std::string log_level = "info";   // trace|debug|info|warn|error|off
  int debounce_ms = 200;            // Watcher quiet period
  int parse_workers = 4;            // Parallel parse tasks per scan
  bool watch = false;               // Keep watching the tree after init

  // Load configuration from ~/.config/skillhub/config.json, then apply SKILLHUB_ROOT
  static Config load_default();

  // Load configuration from a file; missing or invalid files yield defaults
  static Config load(const std::filesystem::path &path);

  // Save configuration to a file
  void save(const std::filesystem::path &path) const;

  json to_json() const;
  static Config from_json(const json &j);
};

namespace config_paths {

std::filesystem::path home_dir();

// ~/.config/skillhub
std::filesystem::path config_dir();

// ~/.config/skillhub/config.json
std::filesystem::path config_file();

}  // namespace config_paths

// Configure the default spdlog logger (stderr sink) at the given level name
void setup_logging(const std::string &level);

}  // namespace skillhub

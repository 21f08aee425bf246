#include "core/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace skillhub {

namespace fs = std::filesystem;

json Config::to_json() const {
  json j;
  j["root"] = root;
  j["log_level"] = log_level;
  j["debounce_ms"] = debounce_ms;
  j["parse_workers"] = parse_workers;
  j["watch"] = watch;
  return j;
}

Config Config::from_json(const json &j) {
  Config config;
  config.root = j.value("root", config.root);
  config.log_level = j.value("log_level", config.log_level);
  config.debounce_ms = std::max(0, j.value("debounce_ms", config.debounce_ms));
  config.parse_workers = std::max(1, j.value("parse_workers", config.parse_workers));
  config.watch = j.value("watch", config.watch);
  return config;
}

Config Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::debug("[config] No config file at {}, using defaults", path.string());
    return Config{};
  }

  try {
    json j = json::parse(file);
    if (!j.is_object()) {
      spdlog::warn("[config] {} is not a JSON object, using defaults", path.string());
      return Config{};
    }
    return from_json(j);
  } catch (const json::exception &e) {
    spdlog::warn("[config] Failed to parse {}: {}", path.string(), e.what());
    return Config{};
  }
}

Config Config::load_default() {
  auto config = load(config_paths::config_file());
  if (const char *root = std::getenv("SKILLHUB_ROOT"); root && *root) {
    config.root = root;
  }
  return config;
}

void Config::save(const fs::path &path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("[config] Cannot write config file: {}", path.string());
    return;
  }
  file << to_json().dump(2) << "\n";
}

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME"); home && *home) {
    return fs::path(home);
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "skillhub";
}

fs::path config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

void setup_logging(const std::string &level) {
  auto logger = spdlog::get("skillhub");
  if (!logger) {
    logger = spdlog::stderr_color_mt("skillhub");
    spdlog::set_default_logger(logger);
  }

  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; only accept "off" when asked for it
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::warn("[config] Unknown log level '{}', using info", level);
    parsed = spdlog::level::info;
  }
  spdlog::set_level(parsed);
}

}  // namespace skillhub

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "skill/registry.hpp"
#include "skill/resolver.hpp"
#include "skill/watcher.hpp"

namespace skillhub::skill {

using json = nlohmann::json;

// Query facade: owns the registry, reloads it from the tree, and answers
// match requests against one consistent snapshot per call.
class SkillEngine {
 public:
  explicit SkillEngine(Config config = {});
  ~SkillEngine();

  SkillEngine(const SkillEngine &) = delete;
  SkillEngine &operator=(const SkillEngine &) = delete;

  // Initial scan. Fails only when the root cannot be read.
  Result<SnapshotPtr> init(const std::filesystem::path &root);

  // Rescan and publish. On failure the previous snapshot stays current.
  Result<SnapshotPtr> reload();

  // Start/stop reloading on filesystem changes
  Result<bool> start_watching();
  void stop();
  bool watching() const;

  MatchResult query(const MatchRequest &request) const;
  MatchResult resolve(std::optional<std::string> language, std::vector<std::string> categories, std::vector<std::string> keywords) const;

  SnapshotPtr snapshot() const {
    return registry_.current();
  }

  std::optional<SkillDescriptor> find(const std::string &name) const;
  std::vector<AgentDescriptor> agents() const;

  const std::filesystem::path &root() const {
    return root_;
  }

 private:
  Config config_;
  std::filesystem::path root_;
  SkillRegistry registry_;
  ChangeWatcher watcher_;
  std::mutex reload_mutex_;  // One reload at a time; readers never take it
};

// JSON rendering for callers and the CLI
json to_json(const Diagnostic &d);
json to_json(const SkillDescriptor &skill, bool include_body = false);
json to_json(const AgentDescriptor &agent);
json to_json(const MatchResult &result, bool include_body = false);
json to_json(const Snapshot &snapshot);

}  // namespace skillhub::skill

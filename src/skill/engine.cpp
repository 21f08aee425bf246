#include "skill/engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

#include "skill/scanner.hpp"

namespace skillhub::skill {

namespace fs = std::filesystem;

SkillEngine::SkillEngine(Config config)
    : config_(std::move(config)), watcher_(std::chrono::milliseconds(config_.debounce_ms)) {}

SkillEngine::~SkillEngine() {
  stop();
}

Result<SnapshotPtr> SkillEngine::init(const fs::path &root) {
  {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    root_ = root;
  }

  auto result = reload();
  if (!result.ok()) {
    spdlog::error("[engine] Initialization failed: {}", result.error ? result.error->describe() : "unknown error");
  }
  return result;
}

Result<SnapshotPtr> SkillEngine::reload() {
  std::lock_guard<std::mutex> lock(reload_mutex_);

  if (root_.empty()) {
    return Result<SnapshotPtr>::failure(ErrorKind::UnreadableRoot, {}, "engine has no root directory");
  }

  auto scanned = scan(root_, ScanOptions{config_.parse_workers});
  if (!scanned.ok()) {
    spdlog::error("[engine] Reload of {} failed, keeping generation {}: {}", root_.string(), registry_.generation(),
                  scanned.error ? scanned.error->describe() : "unknown error");
    return Result<SnapshotPtr>::failure(std::move(*scanned.error));
  }

  auto published = registry_.replace(SkillRegistry::build(std::move(*scanned.value)));
  return Result<SnapshotPtr>::success(std::move(published));
}

Result<bool> SkillEngine::start_watching() {
  if (root_.empty()) {
    return Result<bool>::failure(ErrorKind::UnreadableRoot, {}, "engine has no root directory");
  }

  return watcher_.start(root_, [this]() {
    spdlog::debug("[engine] Change detected under {}", root_.string());
    auto result = reload();
    if (!result.ok()) {
      spdlog::error("[engine] Serving last good snapshot after failed reload");
    }
  });
}

void SkillEngine::stop() {
  watcher_.stop();
}

bool SkillEngine::watching() const {
  return watcher_.running();
}

MatchResult SkillEngine::query(const MatchRequest &request) const {
  // Capture once so the whole call sees a single snapshot
  auto snap = registry_.current();
  return skill::resolve(*snap, request);
}

MatchResult SkillEngine::resolve(std::optional<std::string> language, std::vector<std::string> categories,
                                 std::vector<std::string> keywords) const {
  return query(MatchRequest{std::move(language), std::move(categories), std::move(keywords)});
}

std::optional<SkillDescriptor> SkillEngine::find(const std::string &name) const {
  auto snap = registry_.current();
  if (auto *skill = snap->find(name)) return *skill;
  return std::nullopt;
}

std::vector<AgentDescriptor> SkillEngine::agents() const {
  return registry_.current()->agents;
}

// ============================================================
// JSON rendering
// ============================================================

namespace {

int64_t epoch_seconds(fs::file_time_type t) {
  auto sys = std::chrono::file_clock::to_sys(t);
  return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

}  // namespace

json to_json(const Diagnostic &d) {
  json j;
  j["kind"] = to_string(d.kind);
  if (!d.path.empty()) j["path"] = d.path.string();
  j["message"] = d.message;
  return j;
}

json to_json(const SkillDescriptor &skill, bool include_body) {
  json j;
  j["name"] = skill.name;
  j["description"] = skill.description;
  j["categories"] = skill.categories;
  j["languages"] = skill.languages;
  j["resources"] = skill.resource_refs;
  j["source_path"] = skill.source_path.string();
  j["last_modified"] = epoch_seconds(skill.last_modified);
  if (skill.license) j["license"] = *skill.license;
  if (skill.compatibility) j["compatibility"] = *skill.compatibility;
  if (!skill.metadata.empty()) j["metadata"] = skill.metadata;
  if (include_body) j["body"] = skill.body;
  return j;
}

json to_json(const AgentDescriptor &agent) {
  json j;
  j["name"] = agent.name;
  j["description"] = agent.description;
  j["categories"] = agent.declared_categories;
  j["source_path"] = agent.source_path.string();
  return j;
}

json to_json(const MatchResult &result, bool include_body) {
  json slots = json::array();
  for (const auto &slot : result.slots) {
    json s;
    s["category"] = slot.category;
    s["score"] = slot.score;
    s["skill"] = slot.skill ? to_json(*slot.skill, include_body) : json(nullptr);
    slots.push_back(std::move(s));
  }

  json notes = json::array();
  for (const auto &note : result.notes) {
    notes.push_back(to_json(note));
  }

  json j;
  j["generation"] = result.generation;
  j["slots"] = std::move(slots);
  j["notes"] = std::move(notes);
  return j;
}

json to_json(const Snapshot &snapshot) {
  json skills = json::array();
  for (const auto &skill : snapshot.skills) {
    skills.push_back(to_json(skill));
  }

  json agents = json::array();
  for (const auto &agent : snapshot.agents) {
    agents.push_back(to_json(agent));
  }

  json diagnostics = json::array();
  for (const auto &d : snapshot.errors) {
    diagnostics.push_back(to_json(d));
  }
  for (const auto &d : snapshot.warnings) {
    diagnostics.push_back(to_json(d));
  }

  json j;
  j["root"] = snapshot.root.string();
  j["generation"] = snapshot.generation;
  j["skills"] = std::move(skills);
  j["agents"] = std::move(agents);
  j["categories"] = snapshot.by_category;
  j["languages"] = snapshot.by_language;
  j["diagnostics"] = std::move(diagnostics);
  return j;
}

}  // namespace skillhub::skill

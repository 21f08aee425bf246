#include "skill/scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

#include "skill/parser.hpp"

namespace skillhub::skill {

namespace fs = std::filesystem;

namespace {

struct Candidate {
  fs::path path;
  DescriptorKind kind;
  std::string expected_name;  // Directory name for skills, file stem for agents
};

bool is_hidden(const fs::path &p) {
  auto name = p.filename().string();
  return !name.empty() && name[0] == '.';
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void collect_agents(const fs::path &agents_dir, std::vector<Candidate> &out, Diagnostics &errors) {
  std::error_code ec;
  if (!fs::is_directory(agents_dir, ec)) return;

  fs::directory_iterator it(agents_dir, ec);
  if (ec) {
    errors.push_back({ErrorKind::UnreadableFile, agents_dir, ec.message()});
    return;
  }

  for (const auto &entry : it) {
    auto filename = entry.path().filename().string();
    if (!ends_with(filename, kAgentSuffix) || filename.size() == std::string(kAgentSuffix).size()) continue;
    if (!entry.is_regular_file(ec)) continue;

    auto stem = filename.substr(0, filename.size() - std::string(kAgentSuffix).size());
    out.push_back({entry.path(), DescriptorKind::Agent, stem});
  }
}

// Every immediate subdirectory of skills/ is one skill whose descriptor is
// exactly SKILL.md. Compare file names instead of probing the path so that
// "skill.md" is not accepted on case-insensitive filesystems.
void collect_skills(const fs::path &skills_dir, std::vector<Candidate> &out, Diagnostics &errors) {
  std::error_code ec;
  if (!fs::is_directory(skills_dir, ec)) return;

  fs::directory_iterator it(skills_dir, ec);
  if (ec) {
    errors.push_back({ErrorKind::UnreadableFile, skills_dir, ec.message()});
    return;
  }

  for (const auto &entry : it) {
    if (!entry.is_directory(ec)) continue;
    if (is_hidden(entry.path())) {
      spdlog::debug("[scan] Skipping hidden directory {}", entry.path().string());
      continue;
    }

    fs::directory_iterator inner(entry.path(), ec);
    if (ec) {
      errors.push_back({ErrorKind::UnreadableFile, entry.path(), ec.message()});
      continue;
    }

    bool found = false;
    for (const auto &file : inner) {
      if (file.path().filename() == kSkillFile && file.is_regular_file(ec)) {
        found = true;
        break;
      }
    }

    if (found) {
      out.push_back({entry.path() / kSkillFile, DescriptorKind::Skill, entry.path().filename().string()});
    } else {
      errors.push_back({ErrorKind::MissingDescriptor, entry.path(), std::string("no ") + kSkillFile + " in skill directory"});
    }
  }
}

std::vector<std::string> list_resources(const fs::path &skill_dir) {
  std::vector<std::string> refs;
  auto resources = skill_dir / kResourcesDir;

  std::error_code ec;
  if (!fs::is_directory(resources, ec)) return refs;

  fs::recursive_directory_iterator it(resources, fs::directory_options::skip_permission_denied, ec);
  if (ec) return refs;

  for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) break;
    if (it->is_regular_file(ec)) {
      refs.push_back(it->path().lexically_relative(skill_dir).generic_string());
    }
  }
  std::sort(refs.begin(), refs.end());
  return refs;
}

void resolve_resources(SkillDescriptor &skill) {
  auto dir = skill.directory();
  if (skill.resource_refs.empty()) {
    skill.resource_refs = list_resources(dir);
    return;
  }

  std::error_code ec;
  for (const auto &ref : skill.resource_refs) {
    if (!fs::exists(dir / ref, ec)) {
      spdlog::warn("[scan] Skill '{}' references missing resource '{}'", skill.name, ref);
    }
  }
}

// Parse candidates on up to `workers` tasks. Output order matches input order.
std::vector<Result<Descriptor>> parse_all(const std::vector<Candidate> &candidates, int workers) {
  std::vector<Result<Descriptor>> results(candidates.size());
  if (candidates.empty()) return results;

  size_t task_count = std::min(candidates.size(), static_cast<size_t>(std::max(1, workers)));
  size_t chunk = (candidates.size() + task_count - 1) / task_count;

  std::vector<std::future<void>> tasks;
  for (size_t begin = 0; begin < candidates.size(); begin += chunk) {
    size_t end = std::min(begin + chunk, candidates.size());
    tasks.push_back(std::async(std::launch::async, [&candidates, &results, begin, end]() {
      for (size_t i = begin; i < end; ++i) {
        results[i] = parse_file(candidates[i].path, candidates[i].kind);
      }
    }));
  }
  for (auto &task : tasks) {
    task.get();
  }
  return results;
}

}  // namespace

Result<ScanResult> scan(const fs::path &root, const ScanOptions &options) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return Result<ScanResult>::failure(ErrorKind::UnreadableRoot, root, ec ? ec.message() : "not a directory");
  }
  fs::directory_iterator readable(root, ec);
  if (ec) {
    return Result<ScanResult>::failure(ErrorKind::UnreadableRoot, root, ec.message());
  }

  ScanResult result;
  result.root = fs::weakly_canonical(root, ec);
  if (ec) result.root = fs::absolute(root);

  std::vector<Candidate> candidates;
  for (auto [dir, collect] : {std::pair{kAgentsDir, &collect_agents}, std::pair{kSkillsDir, &collect_skills}}) {
    try {
      collect(root / dir, candidates, result.errors);
    } catch (const fs::filesystem_error &e) {
      // Directory iteration can still fail part way through
      result.errors.push_back({ErrorKind::UnreadableFile, e.path1().empty() ? root / dir : e.path1(), e.code().message()});
    }
  }

  std::sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b) {
    return a.path < b.path;
  });

  auto parsed = parse_all(candidates, options.parse_workers);

  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto &candidate = candidates[i];
    auto &parse_result = parsed[i];
    if (!parse_result.ok()) {
      if (parse_result.error) result.errors.push_back(std::move(*parse_result.error));
      continue;
    }

    if (candidate.kind == DescriptorKind::Skill) {
      auto &skill = std::get<SkillDescriptor>(*parse_result.value);
      if (skill.name != candidate.expected_name) {
        result.errors.push_back({ErrorKind::NameMismatch, skill.source_path,
                                 "declared name '" + skill.name + "' does not match directory '" + candidate.expected_name + "'"});
        continue;
      }
      resolve_resources(skill);
      result.skills.push_back(std::move(skill));
    } else {
      auto &agent = std::get<AgentDescriptor>(*parse_result.value);
      if (agent.name != candidate.expected_name) {
        result.errors.push_back({ErrorKind::NameMismatch, agent.source_path,
                                 "declared name '" + agent.name + "' does not match file name '" + candidate.expected_name + kAgentSuffix + "'"});
        continue;
      }
      result.agents.push_back(std::move(agent));
    }
  }

  std::stable_sort(result.errors.begin(), result.errors.end(), [](const Diagnostic &a, const Diagnostic &b) {
    return a.path < b.path;
  });

  for (const auto &err : result.errors) {
    if (err.kind == ErrorKind::EmptyCategories) {
      spdlog::warn("[scan] {} (add a 'categories' header field to index it)", err.describe());
    } else {
      spdlog::warn("[scan] {}", err.describe());
    }
  }
  spdlog::info("[scan] {}: {} skills, {} agents, {} errors", result.root.string(), result.skills.size(), result.agents.size(),
               result.errors.size());

  return Result<ScanResult>::success(std::move(result));
}

}  // namespace skillhub::skill

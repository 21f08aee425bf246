#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/descriptor.hpp"
#include "skill/scanner.hpp"

namespace skillhub::skill {

// by_language key under which language-agnostic skills are listed
inline constexpr const char *kAgnosticLanguage = "*";

// Immutable view of the registry at one point in time
struct Snapshot {
  std::filesystem::path root;
  std::vector<SkillDescriptor> skills;                              // Scan order, duplicates removed
  std::map<std::string, size_t> by_name;                            // name -> index into skills
  std::map<std::string, std::vector<std::string>> by_category;      // category -> names in scan order
  std::map<std::string, std::vector<std::string>> by_language;      // language -> names in scan order
  std::vector<AgentDescriptor> agents;
  Diagnostics warnings;  // DuplicateNameWarning records
  Diagnostics errors;    // Per-file errors from the scan that produced this snapshot
  uint64_t generation = 0;

  const SkillDescriptor *find(const std::string &name) const;
  const AgentDescriptor *find_agent(const std::string &name) const;

  // Skills tagged with a category, in scan order
  std::vector<const SkillDescriptor *> skills_in(const std::string &category) const;

  // Skills usable for a language: declared for it, or language-agnostic
  std::vector<const SkillDescriptor *> skills_for(const std::string &language) const;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

// Registry of skill snapshots. Readers load the current snapshot with a
// single atomic operation; replace() publishes a fully built one.
class SkillRegistry {
 public:
  SkillRegistry();

  // Index a scan result. Duplicate names keep the first in scan order.
  static std::shared_ptr<Snapshot> build(ScanResult scan);

  // Current snapshot; never null
  SnapshotPtr current() const;

  // Stamp the next generation on `next` and publish it. Returns the published snapshot.
  SnapshotPtr replace(std::shared_ptr<Snapshot> next);

  uint64_t generation() const;

 private:
  std::atomic<SnapshotPtr> snapshot_;
  std::mutex write_mutex_;  // Serializes writers only
};

}  // namespace skillhub::skill

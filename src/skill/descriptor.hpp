#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace skillhub::skill {

// Parsed SKILL.md representation
struct SkillDescriptor {
  std::string name;                             // Required: lowercase alphanumeric with hyphens
  std::string description;                      // Required: 1-1024 chars
  std::vector<std::string> categories;          // Required: at least one tag
  std::vector<std::string> languages;           // Empty means language-agnostic
  std::vector<std::string> resource_refs;       // Relative to the skill directory
  std::string body;                             // Markdown content after the header
  std::optional<std::string> license;           // Optional
  std::optional<std::string> compatibility;     // Optional
  std::map<std::string, std::string> metadata;  // Optional: string-to-string map
  std::filesystem::path source_path;            // Absolute path to the SKILL.md file
  std::filesystem::file_time_type last_modified{};

  bool language_agnostic() const {
    return languages.empty();
  }

  bool supports_language(const std::string &language) const;
  bool has_category(const std::string &category) const;

  std::filesystem::path directory() const {
    return source_path.parent_path();
  }
};

// Parsed <name>.agent.md representation; agents are never matched
struct AgentDescriptor {
  std::string name;
  std::string description;
  std::vector<std::string> declared_categories;
  std::string body;
  std::filesystem::path source_path;
  std::filesystem::file_time_type last_modified{};
};

enum class DescriptorKind { Skill, Agent };

using Descriptor = std::variant<SkillDescriptor, AgentDescriptor>;

}  // namespace skillhub::skill

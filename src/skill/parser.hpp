#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/descriptor.hpp"

namespace skillhub::skill {

inline constexpr size_t kMaxNameLength = 64;
inline constexpr size_t kMaxDescriptionLength = 1024;

// Validate a descriptor name:
//   - 1-64 characters
//   - Must match: ^[a-z0-9][a-z0-9-]*$
bool validate_name(const std::string &name);

// Lowercase, trim and de-duplicate tags, keeping first occurrence order
std::vector<std::string> normalize_tags(const std::vector<std::string> &tags);

// Parse descriptor text. source_path is recorded as-is; nothing is read from disk.
Result<Descriptor> parse(const std::string &content, const std::filesystem::path &source_path, DescriptorKind kind);

Result<SkillDescriptor> parse_skill(const std::string &content, const std::filesystem::path &source_path);
Result<AgentDescriptor> parse_agent(const std::string &content, const std::filesystem::path &source_path);

// Read and parse a descriptor file, filling in the absolute path and modification time
Result<Descriptor> parse_file(const std::filesystem::path &path, DescriptorKind kind);

// Render the header block (including --- delimiters) of a descriptor
std::string serialize_header(const SkillDescriptor &skill);
std::string serialize_header(const AgentDescriptor &agent);

}  // namespace skillhub::skill

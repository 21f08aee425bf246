#include "skill/parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>

namespace skillhub::skill {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  size_t end = s.find_last_not_of(" \t\r\n");
  return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::string strip_quotes(const std::string &s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// One top-level header key. A key holds a scalar, a block list ("- item"
// lines) or a nested mapping (indented "key: value" lines), never a mix.
struct HeaderEntry {
  std::string scalar;
  std::vector<std::string> items;
  std::map<std::string, std::string> nested;
};

using Header = std::map<std::string, HeaderEntry>;

struct SplitResult {
  std::string header;
  std::string body;
};

// ============================================================================
// Header block extraction
// ============================================================================

// Split "---\n<header>\n---\n<body>". Delimiter lines may carry trailing
// whitespace or a CR; a leading UTF-8 BOM is skipped.
Result<SplitResult> split_header(const std::string &content, const fs::path &source_path) {
  static const std::string kUtf8Bom = "\xEF\xBB\xBF";
  std::istringstream stream(content.rfind(kUtf8Bom, 0) == 0 ? content.substr(kUtf8Bom.size()) : content);
  std::string line;

  // Skip leading blank lines before the opening delimiter
  bool opened = false;
  while (std::getline(stream, line)) {
    auto t = trim(line);
    if (t.empty()) continue;
    opened = (t == "---");
    break;
  }
  if (!opened) {
    return Result<SplitResult>::failure(ErrorKind::MalformedHeader, source_path, "missing '---' header block");
  }

  SplitResult split;
  bool closed = false;
  while (std::getline(stream, line)) {
    if (trim(line) == "---") {
      closed = true;
      break;
    }
    split.header += line;
    split.header += '\n';
  }
  if (!closed) {
    return Result<SplitResult>::failure(ErrorKind::MalformedHeader, source_path, "unterminated header block");
  }

  std::ostringstream rest;
  rest << stream.rdbuf();
  split.body = rest.str();
  return Result<SplitResult>::success(std::move(split));
}

// ============================================================================
// Flat key-value parsing
// ============================================================================

Result<Header> parse_header_block(const std::string &text, const fs::path &source_path) {
  Header header;
  std::istringstream stream(text);
  std::string line;
  std::string current_key;
  int line_no = 0;

  auto malformed = [&](const std::string &why) {
    return Result<Header>::failure(ErrorKind::MalformedHeader, source_path, "header line " + std::to_string(line_no) + ": " + why);
  };

  while (std::getline(stream, line)) {
    ++line_no;
    auto content = trim(line);
    if (content.empty() || content[0] == '#') continue;

    bool indented = line[0] == ' ' || line[0] == '\t';

    // Block list item: "- value"
    if (content == "-" || content.rfind("- ", 0) == 0) {
      if (current_key.empty()) return malformed("list item without a key");
      auto &entry = header[current_key];
      if (!entry.scalar.empty() || !entry.nested.empty()) return malformed("list item under scalar key '" + current_key + "'");
      entry.items.push_back(strip_quotes(trim(content.substr(1))));
      continue;
    }

    if (indented) {
      if (current_key.empty()) return malformed("indented line without a key");
      auto &entry = header[current_key];
      auto colon_pos = content.find(':');
      bool mapping_allowed = !entry.nested.empty() || (entry.scalar.empty() && entry.items.empty());
      if (colon_pos != std::string::npos && mapping_allowed) {
        auto key = trim(content.substr(0, colon_pos));
        if (key.empty()) return malformed("empty nested key");
        entry.nested[key] = strip_quotes(trim(content.substr(colon_pos + 1)));
      } else if (!entry.items.empty() || !entry.nested.empty()) {
        return malformed("unexpected continuation under '" + current_key + "'");
      } else {
        // Continuation of the previous scalar value
        if (!entry.scalar.empty()) entry.scalar += " ";
        entry.scalar += content;
      }
      continue;
    }

    auto colon_pos = line.find(':');
    if (colon_pos == std::string::npos) return malformed("expected 'key: value'");

    current_key = trim(line.substr(0, colon_pos));
    if (current_key.empty()) return malformed("empty key");

    HeaderEntry entry;
    entry.scalar = trim(line.substr(colon_pos + 1));
    header[current_key] = std::move(entry);
  }

  for (auto &[key, entry] : header) {
    entry.scalar = strip_quotes(entry.scalar);
  }
  return Result<Header>::success(std::move(header));
}

// Accepts "[a, b]", "a, b" or a block list
std::vector<std::string> list_field(const Header &header, const std::string &key) {
  auto it = header.find(key);
  if (it == header.end()) return {};

  const auto &entry = it->second;
  if (!entry.items.empty()) {
    std::vector<std::string> out;
    for (const auto &item : entry.items) {
      if (!item.empty()) out.push_back(item);
    }
    return out;
  }

  auto value = entry.scalar;
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    value = value.substr(1, value.size() - 2);
  }

  std::vector<std::string> out;
  std::istringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    auto item = strip_quotes(trim(part));
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

std::string scalar_field(const Header &header, const std::string &key) {
  auto it = header.find(key);
  return it == header.end() ? "" : it->second.scalar;
}

// Checks shared by skills and agents: required fields, name format, description length
std::optional<Diagnostic> validate_identity(const Header &header, const fs::path &source_path) {
  auto name = scalar_field(header, "name");
  if (name.empty()) {
    return Diagnostic{ErrorKind::MissingField, source_path, "missing required 'name' field"};
  }

  auto description = scalar_field(header, "description");
  if (description.empty()) {
    return Diagnostic{ErrorKind::MissingField, source_path, "missing required 'description' field"};
  }

  if (!validate_name(name)) {
    return Diagnostic{ErrorKind::InvalidName, source_path, "invalid name '" + name + "'"};
  }

  if (description.size() > kMaxDescriptionLength) {
    return Diagnostic{ErrorKind::DescriptionTooLong, source_path,
                      "description exceeds " + std::to_string(kMaxDescriptionLength) + " characters"};
  }
  return std::nullopt;
}

bool escapes_directory(const std::string &ref) {
  fs::path p(ref);
  if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return true;
  return std::any_of(p.begin(), p.end(), [](const fs::path &part) {
    return part == "..";
  });
}

// Values the reader would alter (quote stripping, trimming, list splitting)
// are written in double quotes. The reader strips exactly one pair.
std::string quote_if_needed(const std::string &value) {
  bool needs_quotes = value.empty() || value != trim(value) || value.front() == '"' || value.front() == '\'' ||
                      value.back() == '"' || value.back() == '\'' || value.find_first_of(",[]#") != std::string::npos;
  return needs_quotes ? "\"" + value + "\"" : value;
}

// Block form keeps commas and brackets inside items
void append_list(std::ostringstream &out, const std::string &key, const std::vector<std::string> &items) {
  out << key << ":\n";
  for (const auto &item : items) {
    out << "  - " << quote_if_needed(item) << "\n";
  }
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

bool validate_name(const std::string &name) {
  if (name.empty() || name.size() > kMaxNameLength) return false;

  static const std::regex pattern("^[a-z0-9][a-z0-9-]*$");
  return std::regex_match(name, pattern);
}

std::vector<std::string> normalize_tags(const std::vector<std::string> &tags) {
  std::vector<std::string> out;
  for (const auto &tag : tags) {
    auto t = to_lower(trim(tag));
    if (t.empty()) continue;
    if (std::find(out.begin(), out.end(), t) == out.end()) {
      out.push_back(std::move(t));
    }
  }
  return out;
}

bool SkillDescriptor::supports_language(const std::string &language) const {
  if (languages.empty()) return true;
  auto wanted = to_lower(trim(language));
  return std::find(languages.begin(), languages.end(), wanted) != languages.end();
}

bool SkillDescriptor::has_category(const std::string &category) const {
  auto wanted = to_lower(trim(category));
  return std::find(categories.begin(), categories.end(), wanted) != categories.end();
}

Result<SkillDescriptor> parse_skill(const std::string &content, const fs::path &source_path) {
  auto split = split_header(content, source_path);
  if (!split.ok()) return Result<SkillDescriptor>::failure(std::move(*split.error));

  auto header = parse_header_block(split.value->header, source_path);
  if (!header.ok()) return Result<SkillDescriptor>::failure(std::move(*header.error));
  const auto &fields = *header.value;

  if (auto err = validate_identity(fields, source_path)) {
    return Result<SkillDescriptor>::failure(std::move(*err));
  }

  SkillDescriptor skill;
  skill.name = scalar_field(fields, "name");
  skill.description = scalar_field(fields, "description");
  skill.categories = normalize_tags(list_field(fields, "categories"));
  if (skill.categories.empty()) {
    return Result<SkillDescriptor>::failure(ErrorKind::EmptyCategories, source_path,
                                            "skill '" + skill.name + "' declares no categories");
  }
  skill.languages = normalize_tags(list_field(fields, "languages"));

  for (auto &ref : list_field(fields, "resources")) {
    if (escapes_directory(ref)) {
      return Result<SkillDescriptor>::failure(ErrorKind::MalformedHeader, source_path,
                                              "resource '" + ref + "' must be relative to the skill directory");
    }
    skill.resource_refs.push_back(fs::path(ref).lexically_normal().generic_string());
  }

  if (auto it = fields.find("license"); it != fields.end() && !it->second.scalar.empty()) {
    skill.license = it->second.scalar;
  }
  if (auto it = fields.find("compatibility"); it != fields.end() && !it->second.scalar.empty()) {
    skill.compatibility = it->second.scalar;
  }
  if (auto it = fields.find("metadata"); it != fields.end()) {
    skill.metadata = it->second.nested;
  }

  skill.body = std::move(split.value->body);
  skill.source_path = source_path;
  return Result<SkillDescriptor>::success(std::move(skill));
}

Result<AgentDescriptor> parse_agent(const std::string &content, const fs::path &source_path) {
  auto split = split_header(content, source_path);
  if (!split.ok()) return Result<AgentDescriptor>::failure(std::move(*split.error));

  auto header = parse_header_block(split.value->header, source_path);
  if (!header.ok()) return Result<AgentDescriptor>::failure(std::move(*header.error));
  const auto &fields = *header.value;

  if (auto err = validate_identity(fields, source_path)) {
    return Result<AgentDescriptor>::failure(std::move(*err));
  }

  AgentDescriptor agent;
  agent.name = scalar_field(fields, "name");
  agent.description = scalar_field(fields, "description");
  agent.declared_categories = normalize_tags(list_field(fields, "categories"));
  agent.body = std::move(split.value->body);
  agent.source_path = source_path;
  return Result<AgentDescriptor>::success(std::move(agent));
}

Result<Descriptor> parse(const std::string &content, const fs::path &source_path, DescriptorKind kind) {
  if (kind == DescriptorKind::Skill) {
    auto r = parse_skill(content, source_path);
    if (!r.ok()) return Result<Descriptor>::failure(std::move(*r.error));
    return Result<Descriptor>::success(std::move(*r.value));
  }

  auto r = parse_agent(content, source_path);
  if (!r.ok()) return Result<Descriptor>::failure(std::move(*r.error));
  return Result<Descriptor>::success(std::move(*r.value));
}

Result<Descriptor> parse_file(const fs::path &path, DescriptorKind kind) {
  std::error_code ec;
  auto absolute = fs::weakly_canonical(path, ec);
  if (ec) absolute = fs::absolute(path, ec);

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<Descriptor>::failure(ErrorKind::UnreadableFile, absolute, "cannot open file");
  }

  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    return Result<Descriptor>::failure(ErrorKind::UnreadableFile, absolute, "read error");
  }

  auto result = parse(ss.str(), absolute, kind);
  if (!result.ok()) return result;

  auto mtime = fs::last_write_time(path, ec);
  std::visit(
      [&](auto &d) {
        if (!ec) d.last_modified = mtime;
      },
      *result.value);
  return result;
}

std::string serialize_header(const SkillDescriptor &skill) {
  std::ostringstream out;
  out << "---\n";
  out << "name: " << skill.name << "\n";
  out << "description: " << quote_if_needed(skill.description) << "\n";
  append_list(out, "categories", skill.categories);
  if (!skill.languages.empty()) append_list(out, "languages", skill.languages);
  if (!skill.resource_refs.empty()) append_list(out, "resources", skill.resource_refs);
  if (skill.license) out << "license: " << quote_if_needed(*skill.license) << "\n";
  if (skill.compatibility) out << "compatibility: " << quote_if_needed(*skill.compatibility) << "\n";
  if (!skill.metadata.empty()) {
    out << "metadata:\n";
    for (const auto &[key, value] : skill.metadata) {
      out << "  " << key << ": " << quote_if_needed(value) << "\n";
    }
  }
  out << "---\n";
  return out.str();
}

std::string serialize_header(const AgentDescriptor &agent) {
  std::ostringstream out;
  out << "---\n";
  out << "name: " << agent.name << "\n";
  out << "description: " << quote_if_needed(agent.description) << "\n";
  if (!agent.declared_categories.empty()) append_list(out, "categories", agent.declared_categories);
  out << "---\n";
  return out.str();
}

}  // namespace skillhub::skill

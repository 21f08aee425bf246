#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "skill/engine.hpp"

using namespace skillhub;
using namespace skillhub::skill;

namespace {

struct Options {
  std::string config_path;
  std::string root;
  std::string log_level;
  std::optional<std::string> language;
  std::vector<std::string> categories;
  std::vector<std::string> keywords;
  bool list = false;
  bool agents = false;
  bool all = false;
  bool body = false;
  bool watch = false;
};

void print_usage(const char *prog) {
  std::cerr << "Usage: " << prog << " [options]\n"
            << "  --root DIR         Skill tree root (agents/ and skills/)\n"
            << "  --config FILE      Config file (default ~/.config/skillhub/config.json)\n"
            << "  --language LANG    Target language\n"
            << "  --category CAT     Requested category (repeatable, order preserved)\n"
            << "  --keyword WORD     Tie-breaking keyword (repeatable)\n"
            << "  --all              Print every ranked candidate per category\n"
            << "  --body             Include skill bodies in the output\n"
            << "  --list             Print the registry snapshot\n"
            << "  --agents           Print agent descriptors\n"
            << "  --watch            Keep running; read one JSON request per stdin line\n"
            << "  --log-level LEVEL  trace|debug|info|warn|error|off\n";
}

bool parse_args(int argc, char *argv[], Options &opts) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](std::string &out) {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--root") {
      if (!next(opts.root)) return false;
    } else if (arg == "--config") {
      if (!next(opts.config_path)) return false;
    } else if (arg == "--log-level") {
      if (!next(opts.log_level)) return false;
    } else if (arg == "--language") {
      if (!next(value)) return false;
      opts.language = value;
    } else if (arg == "--category") {
      if (!next(value)) return false;
      opts.categories.push_back(value);
    } else if (arg == "--keyword") {
      if (!next(value)) return false;
      opts.keywords.push_back(value);
    } else if (arg == "--all") {
      opts.all = true;
    } else if (arg == "--body") {
      opts.body = true;
    } else if (arg == "--list") {
      opts.list = true;
    } else if (arg == "--agents") {
      opts.agents = true;
    } else if (arg == "--watch") {
      opts.watch = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

json ranked_json(const Snapshot &snapshot, const MatchRequest &request) {
  std::vector<std::string> categories = request.categories;
  if (categories.empty()) categories.push_back(kAnyCategory);

  json out = json::array();
  for (const auto &category : categories) {
    json candidates = json::array();
    for (const auto &scored : rank(snapshot, request, category)) {
      candidates.push_back({{"name", scored.skill->name}, {"score", scored.score}});
    }
    out.push_back({{"category", category}, {"candidates", std::move(candidates)}});
  }
  return out;
}

// {"language": "java", "categories": ["mocking"], "keywords": ["spring"]}
std::optional<MatchRequest> request_from_json(const std::string &line) {
  try {
    auto j = json::parse(line);
    MatchRequest request;
    if (j.contains("language") && j["language"].is_string()) {
      request.language = j["language"].get<std::string>();
    }
    request.categories = j.value("categories", std::vector<std::string>{});
    request.keywords = j.value("keywords", std::vector<std::string>{});
    return request;
  } catch (const json::exception &e) {
    spdlog::warn("Ignoring malformed request: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  Options opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage(argv[0]);
    return 1;
  }

  // ===== Configuration =====
  Config config = opts.config_path.empty() ? Config::load_default() : Config::load(opts.config_path);
  if (!opts.root.empty()) config.root = opts.root;
  if (!opts.log_level.empty()) config.log_level = opts.log_level;
  if (opts.watch) config.watch = true;
  if (config.root.empty()) config.root = ".";

  setup_logging(config.log_level);

  // ===== Engine =====
  SkillEngine engine(config);
  auto init = engine.init(config.root);
  if (!init.ok()) {
    std::cerr << "Error: " << (init.error ? init.error->describe() : "initialization failed") << "\n";
    return 1;
  }

  if (opts.list) {
    std::cout << to_json(*engine.snapshot()).dump(2) << std::endl;
    return 0;
  }

  if (opts.agents) {
    json agents = json::array();
    for (const auto &agent : engine.agents()) {
      agents.push_back(to_json(agent));
    }
    std::cout << agents.dump(2) << std::endl;
    return 0;
  }

  if (!config.watch) {
    MatchRequest request{opts.language, opts.categories, opts.keywords};
    if (opts.all) {
      std::cout << ranked_json(*engine.snapshot(), request).dump(2) << std::endl;
    } else {
      std::cout << to_json(engine.query(request), opts.body).dump(2) << std::endl;
    }
    return 0;
  }

  // ===== Watch mode: one request per line until EOF =====
  auto watching = engine.start_watching();
  if (!watching.ok()) {
    std::cerr << "Error: " << (watching.error ? watching.error->describe() : "cannot watch root") << "\n";
    return 1;
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    auto request = request_from_json(line);
    if (!request) {
      json error = json::object();
      error["error"] = "malformed request";
      std::cout << error.dump() << std::endl;
      continue;
    }
    std::cout << to_json(engine.query(*request), opts.body).dump() << std::endl;
  }

  engine.stop();
  return 0;
}

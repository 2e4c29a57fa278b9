#include "foundry/header.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace foundry {

namespace {
std::string trim_whitespace(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string rule_line(const Registry& registry, const std::string& id) {
  const auto it = registry.rule_descriptions.find(id);
  const auto desc = it != registry.rule_descriptions.end() ? it->second : title_from_id(id);
  return "- `" + id + "` \xE2\x80\x94 " + desc;
}
} // namespace

bool has_block(const std::string& text) {
  return text.find(kMarkerStart) != std::string::npos;
}

std::string title_from_id(const std::string& id) {
  std::string stem = id;
  if (stem.size() >= 3 && stem.compare(stem.size() - 3, 3, ".md") == 0) {
    stem.resize(stem.size() - 3);
  }
  std::replace(stem.begin(), stem.end(), '-', ' ');
  bool word_start = true;
  for (auto& c : stem) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c = static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
      word_start = false;
    } else {
      word_start = true;
    }
  }
  return stem;
}

std::string render_header(const Registry& registry,
                          const std::vector<std::string>& deployed_rules,
                          const std::set<std::string>& selected_langs) {
  const auto tooling = registry.tooling_rules();
  std::set<std::string> tooling_first;
  std::set<std::string> others;
  for (const auto& rule : deployed_rules) {
    if (tooling.count(rule) > 0) {
      tooling_first.insert(rule);
    } else {
      others.insert(rule);
    }
  }

  std::ostringstream out;
  out << kMarkerStart << "\n";
  out << "## Rules\n\n";
  out << "Read rules in `.claude/rules/` before making changes:\n";
  if (tooling_first.empty() && others.empty()) {
    out << "- (none deployed)\n";
  }
  for (const auto& rule : tooling_first) out << rule_line(registry, rule) << "\n";
  for (const auto& rule : others) out << rule_line(registry, rule) << "\n";

  out << "\n## Environment\n\n```bash\n";
  bool any_env = false;
  for (const auto& lang : selected_langs) {
    const auto* snippet = registry.find_env(lang);
    if (!snippet) continue;
    if (!snippet->setup.empty()) out << snippet->setup << "  # Setup\n";
    if (!snippet->test.empty()) out << snippet->test << "  # Tests\n";
    any_env = true;
  }
  if (!any_env) {
    out << "# No language-specific commands configured\n";
  }
  out << "```\n";

  out << "\n## Architecture\n\n";
  out << "Read `codemaps/INDEX.md` before modifying unfamiliar modules.\n";
  out << "Run `/update-codemaps` after significant structural changes.\n";

  out << "\n## Documentation\n\n";
  out << "Read `docs/` for detailed project documentation (if it exists).\n";
  out << "- `docs/ARCHITECTURE.md` \xE2\x80\x94 design decisions and patterns\n";
  out << "- `docs/DEVELOPMENT.md` \xE2\x80\x94 setup and workflow guides\n";
  out << "- `CLAUDE.md.old` \xE2\x80\x94 previous CLAUDE.md, if setup replaced or merged one\n";
  out << kMarkerEnd << "\n";
  return out.str();
}

std::string splice_update(const std::string& existing, const std::string& block) {
  const auto start = existing.find(kMarkerStart);
  if (start == std::string::npos) return existing;
  const auto end = existing.find(kMarkerEnd, start + std::strlen(kMarkerStart));
  if (end == std::string::npos) return existing;
  const auto tail = end + std::strlen(kMarkerEnd);
  return existing.substr(0, start) + trim_whitespace(block) + existing.substr(tail);
}

std::string splice_prepend(const std::string& existing, const std::string& block) {
  return block + "\n" + existing;
}

std::string render_document(const std::string& project_name, const std::string& block) {
  return "# " + project_name + "\n\n" + block + "\n";
}

} // namespace foundry

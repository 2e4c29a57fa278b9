#include "foundry/registry.h"

#include "foundry/serialization.h"

#include <algorithm>
#include <utility>

namespace foundry {

namespace {
DetectionMeta detect_ext(std::vector<std::string> exts, std::vector<std::string> configs = {}) {
  DetectionMeta meta;
  meta.extensions = std::move(exts);
  meta.config_files = std::move(configs);
  return meta;
}

DetectionMeta detect_deps(std::vector<std::string> keywords) {
  DetectionMeta meta;
  meta.dep_keywords = std::move(keywords);
  return meta;
}

DetectionMeta detect_dir(std::vector<std::string> dirs) {
  DetectionMeta meta;
  meta.detect_dirs = std::move(dirs);
  return meta;
}

DetectionMeta manual_only() {
  DetectionMeta meta;
  meta.manual = true;
  return meta;
}

MigrationEntry move_to(const char* old_cat, const char* old_id, const char* new_cat, const char* new_id) {
  MigrationEntry entry;
  entry.old_category = old_cat;
  entry.old_id = old_id;
  entry.new_category = new_cat;
  entry.new_id = new_id;
  return entry;
}

MigrationEntry drop(const char* old_cat, const char* old_id) {
  MigrationEntry entry;
  entry.old_category = old_cat;
  entry.old_id = old_id;
  entry.drop = true;
  return entry;
}

const char* kEditPy = "tool == \"Edit\" && tool_input.file_path matches \"\\.py$\"";
const char* kEditJs = "tool == \"Edit\" && tool_input.file_path matches \"\\.(ts|tsx|js|jsx)$\"";
const char* kEditTs = "tool == \"Edit\" && tool_input.file_path matches \"\\.(ts|tsx)$\"";
const char* kEditRs = "tool == \"Edit\" && tool_input.file_path matches \"\\.rs$\"";

Registry build_default_registry() {
  Registry reg;
  reg.base_rules = {
      "coding-style.md", "git-workflow.md", "security.md", "testing.md", "architecture.md",
      "performance.md", "agents.md", "hooks.md", "codemaps.md",
  };

  ModularCategory lang;
  lang.name = "lang";
  lang.rules = {
      {"python.md", detect_ext({".py"}, {"pyproject.toml", "requirements.txt"})},
      {"nodejs.md", detect_ext({}, {"package.json"})},
      {"cpp.md", detect_ext({".c", ".cpp", ".cc", ".cxx", ".hpp"}, {"CMakeLists.txt"})},
      {"go.md", detect_ext({".go"}, {"go.mod"})},
      {"rust.md", detect_ext({".rs"}, {"Cargo.toml"})},
      {"matlab.md", detect_ext({".m"})},
  };

  ModularCategory templates;
  templates.name = "templates";
  templates.rules = {
      {"react-app.md", detect_deps({"react"})},
      {"desktop-gui-qt.md", detect_deps({"PySide6", "PyQt"})},
      {"embedded-c.md", manual_only()},
      {"embedded-dsp.md", manual_only()},
      {"rest-api.md", manual_only()},
      {"library.md", {}},
      {"scripts.md", {}},
      {"monolith.md", {}},
      {"data-pipeline.md", {}},
  };

  ModularCategory platform;
  platform.name = "platform";
  platform.rules = {{"github.md", detect_dir({".github"})}};

  ModularCategory security;
  security.name = "security";
  security.require_one = true;
  security.rules = {{"enterprise.md", {}}, {"internal.md", {}}, {"sandbox.md", {}}};

  reg.modular = {lang, templates, platform, security};

  reg.hooks = {
      {"ruff-format.sh", {"python.md"}, "Python formatting (ruff)", kEditPy},
      {"prettier-format.sh", {"nodejs.md", "react-app.md"}, "JS/TS formatting (prettier)", kEditJs},
      {"tsc-check.sh", {"nodejs.md", "react-app.md"}, "TypeScript type checking", kEditTs},
      {"mypy-check.sh", {"python.md"}, "Python type checking (mypy)", kEditPy},
      {"cargo-check.sh", {"rust.md"}, "Rust type checking (cargo check)", kEditRs},
  };

  reg.skills = {"clickhouse-io", "gui-threading", "python-qt-gui"};

  reg.lsp_plugins = {
      {"python.md", "pyright-lsp", "pyright-langserver"},
      {"nodejs.md", "typescript-lsp", "typescript-language-server"},
      {"react-app.md", "typescript-lsp", "typescript-language-server"},
      {"rust.md", "rust-analyzer-lsp", "rust-analyzer"},
      {"go.md", "gopls-lsp", "gopls"},
      {"cpp.md", "clangd-lsp", "clangd"},
  };

  reg.workflow_plugins = {
      {"feature-dev", "7-phase feature workflow"},
      {"pr-review-toolkit", "PR analysis suite"},
      {"code-review", "Automated PR feedback"},
      {"code-simplifier", "Autonomous refactoring"},
  };

  reg.env_snippets = {
      {"cpp.md", "mkdir -p build && cd build && cmake ..", "ctest --test-dir build"},
      {"go.md", "go mod download", "go test ./..."},
      {"nodejs.md", "npm install", "npm test"},
      {"python.md", "uv venv && uv pip install -e .[dev]", "uv run pytest"},
      {"rust.md", "cargo build", "cargo test"},
  };

  reg.rule_descriptions = {
      {"python.md", "Python tooling (uv, pytest, ruff)"},
      {"rust.md", "Rust tooling (cargo, clippy)"},
      {"go.md", "Go tooling (go mod, golangci-lint)"},
      {"nodejs.md", "Node.js tooling (npm)"},
      {"cpp.md", "C/C++ tooling (CMake, clang)"},
      {"matlab.md", "MATLAB tooling"},
      {"github.md", "GitHub workflow (gh CLI, PR conventions)"},
      {"coding-style.md", "Code style guidelines"},
      {"git-workflow.md", "Git workflow and commit conventions"},
      {"security.md", "Security checks and practices"},
      {"testing.md", "Testing requirements (TDD, 80% coverage)"},
      {"architecture.md", "Architecture principles"},
      {"performance.md", "Performance and model selection"},
      {"agents.md", "Agent orchestration"},
      {"codemaps.md", "Codemap system"},
      {"hooks.md", "Hooks system"},
  };

  reg.tooling_groups = {"lang", "platform"};
  reg.protected_skill_dirs = {"learned", "learned-local"};

  reg.migration.revision = 2;
  reg.migration.old_categories = {"domain", "style", "arch"};
  reg.migration.entries = {
      move_to("lang", "react.md", "templates", "react-app.md"),
      move_to("lang", "python-qt.md", "templates", "desktop-gui-qt.md"),
      move_to("lang", "c-embedded.md", "templates", "embedded-c.md"),
      drop("lang", "c.md"),
      move_to("domain", "embedded.md", "templates", "embedded-c.md"),
      move_to("domain", "dsp-audio.md", "templates", "embedded-dsp.md"),
      move_to("domain", "gui-threading.md", "templates", "desktop-gui-qt.md"),
      drop("domain", "gui.md"),
      move_to("style", "backend.md", "templates", "rest-api.md"),
      move_to("style", "library.md", "templates", "library.md"),
      move_to("style", "scripts.md", "templates", "scripts.md"),
      move_to("style", "data-pipeline.md", "templates", "data-pipeline.md"),
      move_to("arch", "rest-api.md", "templates", "rest-api.md"),
      move_to("arch", "react-app.md", "templates", "react-app.md"),
      move_to("arch", "monolith.md", "templates", "monolith.md"),
  };
  return reg;
}

std::vector<std::string> list_dir_names(const std::filesystem::path& dir,
                                        const std::string& suffix,
                                        bool want_dirs) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return out;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    const auto name = entry.path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    std::error_code type_ec;
    const bool is_dir = entry.is_directory(type_ec);
    if (want_dirs != is_dir) continue;
    if (!suffix.empty() && entry.path().extension().string() != suffix) continue;
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}
} // namespace

const std::vector<Category>& all_categories() {
  static const std::vector<Category> kAll = {
      Category::Rules, Category::Agents, Category::Commands, Category::Skills, Category::Hooks};
  return kAll;
}

std::string category_name(Category category) {
  switch (category) {
    case Category::Rules: return "rules";
    case Category::Agents: return "agents";
    case Category::Commands: return "commands";
    case Category::Skills: return "skills";
    case Category::Hooks: return "hooks";
  }
  return "rules";
}

std::optional<Category> parse_category(const std::string& name) {
  for (const auto category : all_categories()) {
    if (category_name(category) == name) return category;
  }
  return std::nullopt;
}

std::filesystem::path category_subdir(Category category) {
  if (category == Category::Hooks) {
    return std::filesystem::path("hooks") / "library";
  }
  return category_name(category);
}

ItemShape category_shape(Category category) {
  return category == Category::Skills ? ItemShape::Directory : ItemShape::File;
}

const MigrationEntry* MigrationTable::find(const std::string& category, const std::string& id) const {
  for (const auto& entry : entries) {
    if (entry.old_category == category && entry.old_id == id) return &entry;
  }
  return nullptr;
}

bool MigrationTable::is_old_category(const std::string& category) const {
  return std::find(old_categories.begin(), old_categories.end(), category) != old_categories.end();
}

const ModularCategory* Registry::find_modular(const std::string& name) const {
  for (const auto& cat : modular) {
    if (cat.name == name) return &cat;
  }
  return nullptr;
}

const HookScript* Registry::find_hook(const std::string& name) const {
  for (const auto& hook : hooks) {
    if (hook.name == name) return &hook;
  }
  return nullptr;
}

const EnvSnippet* Registry::find_env(const std::string& lang) const {
  for (const auto& snippet : env_snippets) {
    if (snippet.lang == lang) return &snippet;
  }
  return nullptr;
}

bool Registry::is_base_rule(const std::string& id) const {
  return std::find(base_rules.begin(), base_rules.end(), id) != base_rules.end();
}

std::set<std::string> Registry::tooling_rules() const {
  std::set<std::string> out;
  for (const auto& group : tooling_groups) {
    if (const auto* cat = find_modular(group)) {
      for (const auto& rule : cat->rules) out.insert(rule.id);
    }
  }
  return out;
}

std::set<std::string> Registry::reserved_words() const {
  std::set<std::string> out;
  for (const auto category : all_categories()) out.insert(category_name(category));
  for (const auto& dir : protected_skill_dirs) out.insert(dir);
  for (const auto& cat : modular) out.insert(cat.name);
  for (const auto& old : migration.old_categories) out.insert(old);
  return out;
}

bool Registry::claims_prefix(const std::string& prefix) const {
  const auto head = prefix + "-";
  const auto starts = [&](const std::string& name) { return name.rfind(head, 0) == 0; };
  for (const auto& id : base_rules) {
    if (starts(id)) return true;
  }
  for (const auto& cat : modular) {
    for (const auto& rule : cat.rules) {
      if (starts(rule.id)) return true;
    }
  }
  for (const auto& skill : skills) {
    if (starts(skill)) return true;
  }
  for (const auto& hook : hooks) {
    if (starts(hook.name)) return true;
  }
  return false;
}

const Registry& default_registry() {
  static const Registry kRegistry = build_default_registry();
  return kRegistry;
}

ContentItem base_rule_item(const std::filesystem::path& root, const std::string& id) {
  ContentItem item;
  item.category = Category::Rules;
  item.identifier = id;
  item.source = root / "rules" / id;
  return item;
}

ContentItem modular_rule_item(const std::filesystem::path& root,
                              const std::string& group,
                              const std::string& id) {
  ContentItem item;
  item.category = Category::Rules;
  item.identifier = id;
  item.group = group;
  item.source = root / "rule-library" / group / id;
  return item;
}

ContentItem catalog_item(const std::filesystem::path& root, Category category, const std::string& id) {
  ContentItem item;
  item.category = category;
  item.identifier = id;
  item.shape = category_shape(category);
  switch (category) {
    case Category::Rules:
      item.source = root / "rules" / id;
      break;
    case Category::Agents:
      item.source = root / "agents" / id;
      break;
    case Category::Commands:
      item.source = root / "commands" / id;
      break;
    case Category::Skills:
      item.source = root / "skills" / id;
      break;
    case Category::Hooks:
      item.source = root / "hooks" / "library" / id;
      item.executable = true;
      break;
  }
  return item;
}

std::vector<std::string> list_agents(const std::filesystem::path& root) {
  return list_dir_names(root / "agents", ".md", false);
}

std::vector<std::string> list_commands(const std::filesystem::path& root) {
  return list_dir_names(root / "commands", ".md", false);
}

std::vector<std::string> list_learned_categories(const std::filesystem::path& root) {
  return list_dir_names(root / "skills" / "learned", "", true);
}

std::string read_tool_version(const std::filesystem::path& root) {
  std::string text;
  if (!data::read_text_file(root / "VERSION", text)) {
    return "dev";
  }
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "dev";
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace foundry

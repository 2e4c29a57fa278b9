#include "foundry/config.h"
#include "foundry/header.h"
#include "foundry/log.h"
#include "foundry/manifest.h"
#include "foundry/migration.h"
#include "foundry/ownership.h"
#include "foundry/private_sources.h"
#include "foundry/reconcile.h"
#include "foundry/registry.h"
#include "foundry/selection.h"
#include "foundry/settings.h"
#include "foundry/setup.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;
  out << contents;
  return true;
}

fs::path make_temp_dir(const std::string& tag) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto dir = fs::temp_directory_path() / ("foundry_core_" + tag + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

const std::string kStart = foundry::kMarkerStart;
const std::string kEnd = foundry::kMarkerEnd;
} // namespace

int main() {
  foundry::log::init("foundry_core_tests", fs::path());
  foundry::log::set_console(false);

  const auto& registry = foundry::default_registry();
  int failures = 0;

  // Test: registry shape.
  {
    const auto reserved = registry.reserved_words();
    for (const char* word : {"rules", "agents", "commands", "skills", "hooks", "learned", "learned-local", "lang",
                             "templates", "platform", "security", "domain", "style", "arch"}) {
      if (reserved.count(word) == 0) {
        std::cerr << "reserved words missing " << word << "\n";
        ++failures;
      }
    }
    const auto tooling = registry.tooling_rules();
    if (tooling.count("python.md") == 0 || tooling.count("github.md") == 0 || tooling.count("react-app.md") != 0) {
      std::cerr << "tooling rules should cover lang and platform only\n";
      ++failures;
    }
    if (foundry::category_subdir(foundry::Category::Hooks) != fs::path("hooks") / "library") {
      std::cerr << "hooks should deploy under hooks/library\n";
      ++failures;
    }
    if (!foundry::parse_category("skills") || foundry::parse_category("style")) {
      std::cerr << "category parsing mismatch\n";
      ++failures;
    }
    const auto* security = registry.find_modular("security");
    if (!security || !security->require_one) {
      std::cerr << "security category should require a selection\n";
      ++failures;
    }
    if (registry.migration.revision != foundry::kManifestSchemaVersion) {
      std::cerr << "migration revision should match manifest schema\n";
      ++failures;
    }
  }

  // Test: prefix validation.
  {
    for (const char* ok : {"company", "my-team", "team42"}) {
      if (foundry::validate_prefix(ok, {}, registry)) {
        std::cerr << "prefix rejected unexpectedly: " << ok << "\n";
        ++failures;
      }
    }
    const auto upper = foundry::validate_prefix("Company", {}, registry);
    if (!upper || upper->find("lowercase") == std::string::npos) {
      std::cerr << "uppercase prefix should mention lowercase\n";
      ++failures;
    }
    for (const char* bad : {"42team", "my_team", "", "-team", "team.x"}) {
      if (!foundry::validate_prefix(bad, {}, registry)) {
        std::cerr << "prefix accepted unexpectedly: '" << bad << "'\n";
        ++failures;
      }
    }
    for (const char* reserved : {"security", "lang", "learned", "domain", "skills"}) {
      const auto err = foundry::validate_prefix(reserved, {}, registry);
      if (!err || err->find("conflicts") == std::string::npos) {
        std::cerr << "reserved prefix should conflict: " << reserved << "\n";
        ++failures;
      }
    }
    // Catalog content already occupies these namespaces.
    for (const char* claimed : {"git", "coding", "python", "react", "embedded", "ruff"}) {
      const auto err = foundry::validate_prefix(claimed, {}, registry);
      if (!err || err->find("conflicts") == std::string::npos) {
        std::cerr << "catalog-claimed prefix should conflict: " << claimed << "\n";
        ++failures;
      }
    }
    const auto on_disk = foundry::validate_prefix("tdd", {}, registry, {"tdd-guide-python.md", "plan.md"});
    if (!on_disk || on_disk->find("tdd-") == std::string::npos) {
      std::cerr << "prefix claimed by an agent file should conflict\n";
      ++failures;
    }
    if (foundry::validate_prefix("plan", {}, registry, {"plan.md"})) {
      std::cerr << "exact catalog name is not a prefix claim\n";
      ++failures;
    }
    const auto dup = foundry::validate_prefix("company", {"company"}, registry);
    if (!dup || dup->find("already registered") == std::string::npos) {
      std::cerr << "duplicate prefix should be already registered\n";
      ++failures;
    }
    if (foundry::validate_prefix("company", {"team"}, registry)) {
      std::cerr << "distinct prefix should be accepted\n";
      ++failures;
    }
  }

  // Test: migration moves old categories into templates.
  {
    const auto& table = registry.migration;
    const auto out = foundry::migrate_modular_rules({{"domain", {"embedded.md"}}}, table);
    if (out.count("domain") != 0) {
      std::cerr << "domain key should be removed\n";
      ++failures;
    }
    if (out.count("templates") == 0 || !contains(out.at("templates"), "embedded-c.md")) {
      std::cerr << "templates should gain embedded-c.md\n";
      ++failures;
    }

    const auto lang = foundry::migrate_modular_rules({{"lang", {"python.md", "react.md"}}}, table);
    if (lang.count("lang") == 0 || lang.at("lang") != std::vector<std::string>{"python.md"}) {
      std::cerr << "lang should retain only python.md\n";
      ++failures;
    }
    if (lang.count("templates") == 0 || lang.at("templates") != std::vector<std::string>{"react-app.md"}) {
      std::cerr << "templates should gain react-app.md\n";
      ++failures;
    }
  }

  // Test: migration drops, unions and leaves untouched categories alone.
  {
    const auto& table = registry.migration;
    const foundry::ModularSelection input = {
        {"arch", {"react-app.md", "unknown.md"}},
        {"domain", {"embedded.md", "gui.md"}},
        {"lang", {"c.md", "c-embedded.md", "rust.md"}},
        {"platform", {"github.md", "gitlab.md"}},
        {"style", {"mystery.md"}},
        {"templates", {"library.md"}},
    };
    const auto out = foundry::migrate_modular_rules(input, table);
    for (const char* old_key : {"arch", "domain", "style"}) {
      if (out.count(old_key) != 0) {
        std::cerr << "old category survived migration: " << old_key << "\n";
        ++failures;
      }
    }
    if (out.count("platform") == 0 || out.at("platform") != input.at("platform")) {
      std::cerr << "untouched category should be copied verbatim\n";
      ++failures;
    }
    if (out.count("lang") == 0 || out.at("lang") != std::vector<std::string>{"rust.md"}) {
      std::cerr << "lang should keep rust.md only after c.md drop\n";
      ++failures;
    }
    const auto& templates = out.at("templates");
    const auto embedded = std::count(templates.begin(), templates.end(), std::string("embedded-c.md"));
    if (embedded != 1 || !contains(templates, "library.md") || !contains(templates, "react-app.md")) {
      std::cerr << "templates union incorrect\n";
      ++failures;
    }
    if (contains(templates, "gui.md") || contains(templates, "unknown.md") || contains(templates, "mystery.md")) {
      std::cerr << "dropped or unmapped old items leaked into templates\n";
      ++failures;
    }

    const auto again = foundry::migrate_modular_rules(out, table);
    if (again != out) {
      std::cerr << "migration is not idempotent\n";
      ++failures;
    }
    for (const auto& sample : std::vector<foundry::ModularSelection>{
             {}, {{"lang", {"python.md"}}}, {{"style", {"backend.md"}}, {"arch", {"rest-api.md"}}}}) {
      const auto once = foundry::migrate_modular_rules(sample, table);
      if (foundry::migrate_modular_rules(once, table) != once) {
        std::cerr << "migration not idempotent for sample\n";
        ++failures;
      }
    }
    const auto merged = foundry::migrate_modular_rules({{"style", {"backend.md"}}, {"arch", {"rest-api.md"}}}, table);
    if (merged.at("templates") != std::vector<std::string>{"rest-api.md"}) {
      std::cerr << "duplicate targets should collapse to one entry\n";
      ++failures;
    }
  }

  // Test: migration with a synthetic table.
  {
    foundry::MigrationTable table;
    table.revision = 7;
    table.old_categories = {"legacy"};
    foundry::MigrationEntry entry;
    entry.old_category = "legacy";
    entry.old_id = "a.md";
    entry.new_category = "fresh";
    entry.new_id = "b.md";
    table.entries.push_back(entry);

    foundry::Manifest manifest;
    manifest.schema_version = 1;
    manifest.modular_rules = {{"legacy", {"a.md", "z.md"}}, {"other", {"q.md"}}};
    if (!foundry::needs_migration(manifest, table)) {
      std::cerr << "synthetic manifest should need migration\n";
      ++failures;
    }
    const auto migrated = foundry::migrate_manifest(manifest, table);
    if (migrated.schema_version != 7 || migrated.modular_rules.count("legacy") != 0 ||
        migrated.modular_rules.at("fresh") != std::vector<std::string>{"b.md"} ||
        migrated.modular_rules.at("other") != std::vector<std::string>{"q.md"}) {
      std::cerr << "synthetic migration incorrect\n";
      ++failures;
    }
    if (foundry::needs_migration(migrated, table)) {
      std::cerr << "migrated manifest should be current\n";
      ++failures;
    }
  }

  // Test: ownership classification.
  {
    const auto policy = foundry::make_ownership_policy(registry, {"acme", "acme-team", "company"});
    using foundry::Category;
    using foundry::Ownership;
    const auto cls = [&](Category c, const std::string& name, bool dir) {
      return foundry::classify_entry(c, name, dir, policy);
    };
    if (cls(Category::Skills, "learned", true).kind != Ownership::Protected ||
        cls(Category::Skills, "learned-local", true).kind != Ownership::Protected) {
      std::cerr << "learned dirs must be protected\n";
      ++failures;
    }
    if (cls(Category::Rules, ".gitkeep", false).kind != Ownership::Protected ||
        cls(Category::Rules, "notes.txt", false).kind != Ownership::Protected ||
        cls(Category::Skills, "README.md", false).kind != Ownership::Protected ||
        cls(Category::Hooks, "helper.py", false).kind != Ownership::Protected) {
      std::cerr << "entries outside the managed shape must be protected\n";
      ++failures;
    }
    const auto owned = cls(Category::Rules, "company-dsp.md", false);
    if (owned.kind != Ownership::PrivateOwned || owned.prefix != "company") {
      std::cerr << "company-dsp.md should be owned by company\n";
      ++failures;
    }
    const auto longest = cls(Category::Agents, "acme-team-reviewer.md", false);
    if (longest.kind != Ownership::PrivateOwned || longest.prefix != "acme-team") {
      std::cerr << "longest prefix should own the entry\n";
      ++failures;
    }
    const auto shorter = cls(Category::Agents, "acme-reviewer.md", false);
    if (shorter.kind != Ownership::PrivateOwned || shorter.prefix != "acme") {
      std::cerr << "acme-reviewer.md should be owned by acme\n";
      ++failures;
    }
    if (cls(Category::Rules, "python.md", false).kind != Ownership::ManagedUnowned ||
        cls(Category::Skills, "old-skill", true).kind != Ownership::ManagedUnowned ||
        cls(Category::Hooks, "ruff-format.sh", false).kind != Ownership::ManagedUnowned) {
      std::cerr << "registry entries should be managed\n";
      ++failures;
    }
    if (cls(Category::Rules, "companyx.md", false).kind != Ownership::ManagedUnowned ||
        cls(Category::Rules, "company", false).kind == Ownership::PrivateOwned) {
      std::cerr << "prefix match must require the hyphen separator\n";
      ++failures;
    }
  }

  // Test: destination naming and collisions.
  {
    const fs::path root = "/content";
    std::vector<foundry::ContentItem> items = {
        foundry::modular_rule_item(root, "templates", "testing.md"),
        foundry::base_rule_item(root, "testing.md"),
        foundry::modular_rule_item(root, "lang", "shared.md"),
        foundry::modular_rule_item(root, "platform", "shared.md"),
        foundry::modular_rule_item(root, "lang", "python.md"),
    };
    const auto names = foundry::destination_names(items, "");
    const std::vector<std::string> expected = {"templates-testing.md", "testing.md", "shared.md",
                                               "platform-shared.md", "python.md"};
    if (names != expected) {
      std::cerr << "collision naming mismatch\n";
      ++failures;
    }
    const auto priv = foundry::destination_names({foundry::private_item("/src", foundry::Category::Rules,
                                                                        "lang/custom-dsp.md")},
                                                 "company");
    if (priv.size() != 1 || priv[0] != "company-custom-dsp.md") {
      std::cerr << "private naming should use prefix and basename\n";
      ++failures;
    }
  }

  // Test: marker detection.
  {
    if (!foundry::has_block("intro\n" + kStart + "\nbody\n" + kEnd)) {
      std::cerr << "exact start marker should be detected\n";
      ++failures;
    }
    for (const char* near : {"<!-- CLAUDE-FOUNDRY -->", "<!--claude-foundry-->", "<!-- claude foundry -->",
                             "<!-- claude-foundry->", "<!--  claude-foundry -->"}) {
      if (foundry::has_block(std::string("x\n") + near + "\n")) {
        std::cerr << "near-miss marker detected: " << near << "\n";
        ++failures;
      }
    }
  }

  // Test: splice update preserves outside bytes.
  {
    const std::string doc = "A\n" + kStart + "\nold\n" + kEnd + "\nB";
    const auto out = foundry::splice_update(doc, kStart + "\nnew\n" + kEnd);
    if (out != "A\n" + kStart + "\nnew\n" + kEnd + "\nB") {
      std::cerr << "splice update mismatch: " << out << "\n";
      ++failures;
    }
    const std::string head = "Ærøskøbing \xE6\x97\xA5\xE6\x9C\xAC\n\n";
    const std::string tail = "\n\n## Notes \xF0\x9F\x9A\x80 caf\xC3\xA9\n";
    const std::string unicode_doc = head + kStart + "\nold\n" + kEnd + tail;
    const auto spliced = foundry::splice_update(unicode_doc, "\n\n" + kStart + "\nfresh\n" + kEnd + "\n\n");
    if (spliced != head + kStart + "\nfresh\n" + kEnd + tail) {
      std::cerr << "non-ASCII content not preserved\n";
      ++failures;
    }
    const std::string no_end = "A\n" + kStart + "\nold\n";
    if (foundry::splice_update(no_end, kStart + "\nnew\n" + kEnd) != no_end) {
      std::cerr << "missing end marker should leave doc unchanged\n";
      ++failures;
    }
    const std::string reversed = kEnd + "\n" + kStart + "\n";
    if (foundry::splice_update(reversed, kStart + "\nnew\n" + kEnd) != reversed) {
      std::cerr << "end marker before start should leave doc unchanged\n";
      ++failures;
    }
    if (foundry::splice_update("plain", kStart + "\nnew\n" + kEnd) != "plain") {
      std::cerr << "doc without markers should be unchanged\n";
      ++failures;
    }
    if (foundry::splice_prepend("user text\n", "BLOCK\n") != "BLOCK\n\nuser text\n") {
      std::cerr << "prepend mismatch\n";
      ++failures;
    }
    if (foundry::render_document("proj", "BLOCK\n") != "# proj\n\nBLOCK\n\n") {
      std::cerr << "render document mismatch\n";
      ++failures;
    }
  }

  // Test: header rendering order and determinism.
  {
    const auto header = foundry::render_header(registry, {"testing.md", "python.md", "data-pipeline.md", "github.md",
                                                          "coding-style.md"},
                                               {"python.md"});
    const auto pos = [&](const std::string& needle) { return header.find(needle); };
    if (header.rfind(kStart, 0) != 0 || header.find(kEnd) == std::string::npos) {
      std::cerr << "header should be wrapped in markers\n";
      ++failures;
    }
    if (!(pos("`github.md`") < pos("`python.md`") && pos("`python.md`") < pos("`coding-style.md`") &&
          pos("`coding-style.md`") < pos("`data-pipeline.md`") && pos("`data-pipeline.md`") < pos("`testing.md`"))) {
      std::cerr << "tooling rules should come first, each group sorted\n";
      ++failures;
    }
    if (header.find("Data Pipeline") == std::string::npos ||
        header.find("Python tooling (uv, pytest, ruff)") == std::string::npos) {
      std::cerr << "rule descriptions missing\n";
      ++failures;
    }
    if (header.find("uv run pytest  # Tests") == std::string::npos ||
        header.find("CLAUDE.md.old") == std::string::npos || header.find("codemaps/INDEX.md") == std::string::npos) {
      std::cerr << "header sections incomplete\n";
      ++failures;
    }
    const auto reordered = foundry::render_header(registry, {"coding-style.md", "github.md", "data-pipeline.md",
                                                             "python.md", "testing.md"},
                                                  {"python.md"});
    if (reordered != header) {
      std::cerr << "header not deterministic across input order\n";
      ++failures;
    }
    const auto empty = foundry::render_header(registry, {}, {});
    if (empty.find("- (none deployed)") == std::string::npos ||
        empty.find("# No language-specific commands configured") == std::string::npos) {
      std::cerr << "empty header placeholders missing\n";
      ++failures;
    }
    if (foundry::splice_update(foundry::splice_update("x\n" + header + "y\n", empty), header) != "x\n" + header + "y\n") {
      std::cerr << "splice round trip changed the document\n";
      ++failures;
    }
  }

  // Test: manifest json.
  {
    foundry::Manifest manifest;
    manifest.schema_version = 2;
    manifest.version = "1.4.0";
    manifest.base_rules = {"security.md"};
    manifest.modular_rules = {{"lang", {"python.md"}}};
    foundry::PrivateSourceRef ref;
    ref.path = "/opt/company";
    ref.prefix = "company";
    ref.rules = {"lang/custom-dsp.md"};
    ref.hooks = {"lint.sh"};
    manifest.private_sources.push_back(ref);
    const auto j = foundry::manifest_to_json(manifest);
    std::string error;
    const auto back = foundry::manifest_from_json(j, error);
    if (!back || back->version != "1.4.0" || back->modular_rules != manifest.modular_rules ||
        back->private_sources.size() != 1 || back->private_sources[0].hooks != ref.hooks ||
        back->private_prefixes() != std::vector<std::string>{"company"}) {
      std::cerr << "manifest json mismatch: " << error << "\n";
      ++failures;
    }

    const auto legacy = foundry::manifest_from_json(json{{"base_rules", json::array({"security.md"})}}, error);
    if (!legacy || legacy->schema_version != 1) {
      std::cerr << "unversioned manifest should load as schema 1\n";
      ++failures;
    }
    if (foundry::manifest_from_json(json{{"base_rules", "security.md"}}, error) ||
        foundry::manifest_from_json(json{{"modular_rules", json::array({"x"})}}, error) ||
        foundry::manifest_from_json(json::array(), error)) {
      std::cerr << "wrong-typed manifest should be rejected\n";
      ++failures;
    }
  }

  // Test: menu input handling.
  {
    const std::set<size_t> current = {0};
    const auto toggled = foundry::apply_menu_input("2 1 9 x", 3, current, false);
    if (toggled.kind != foundry::MenuStep::Kind::Continue || toggled.selected != std::set<size_t>{1}) {
      std::cerr << "toggle handling mismatch\n";
      ++failures;
    }
    if (current != std::set<size_t>{0}) {
      std::cerr << "menu input mutated the current selection\n";
      ++failures;
    }
    if (foundry::apply_menu_input("", 3, current, false).kind != foundry::MenuStep::Kind::Accepted) {
      std::cerr << "empty input should accept\n";
      ++failures;
    }
    if (foundry::apply_menu_input("  ", 3, {}, true).kind != foundry::MenuStep::Kind::NeedsSelection) {
      std::cerr << "required menu should refuse an empty selection\n";
      ++failures;
    }
    for (const char* back : {"b", "B", "back", "BACK"}) {
      if (foundry::apply_menu_input(back, 3, current, false).kind != foundry::MenuStep::Kind::Back) {
        std::cerr << "back not recognised: " << back << "\n";
        ++failures;
      }
    }
    for (const char* quit : {"q", "Q", "quit", "Quit "}) {
      if (foundry::apply_menu_input(quit, 3, current, false).kind != foundry::MenuStep::Kind::Quit) {
        std::cerr << "quit not recognised: " << quit << "\n";
        ++failures;
      }
    }
  }

  // Test: resolvers.
  {
    foundry::MenuRequest request;
    request.title = "Rules";
    request.labels = {"a", "b", "c"};
    request.defaults = {2};
    foundry::DefaultsResolver defaults;
    const auto picked = defaults.Select(request);
    if (picked.kind != foundry::SelectionResult::Kind::Accepted || picked.selected != request.defaults) {
      std::cerr << "defaults resolver should accept defaults\n";
      ++failures;
    }
    if (defaults.Confirm("ok?", true) || defaults.Interactive()) {
      std::cerr << "defaults resolver should decline confirmations\n";
      ++failures;
    }

    std::istringstream in("1\n\nyes\nr\n");
    std::ostringstream out;
    foundry::ConsoleResolver console(in, out);
    const auto chosen = console.Select(request);
    if (chosen.kind != foundry::SelectionResult::Kind::Accepted || chosen.selected != std::set<size_t>{0, 2}) {
      std::cerr << "console resolver toggle mismatch\n";
      ++failures;
    }
    if (!console.Confirm("proceed?", false) || console.Choose("pick", "R/M/Q", 'M') != 'R') {
      std::cerr << "console confirm/choose mismatch\n";
      ++failures;
    }
    if (out.str().find("[X] 3. c") == std::string::npos) {
      std::cerr << "console menu should mark defaults\n";
      ++failures;
    }

    std::istringstream quit_in("b\n");
    std::ostringstream quit_out;
    foundry::ConsoleResolver quitter(quit_in, quit_out);
    if (quitter.Select(request).kind != foundry::SelectionResult::Kind::Back) {
      std::cerr << "console resolver should report back\n";
      ++failures;
    }
  }

  // Test: version comparison.
  {
    if (foundry::compare_versions("1.2.0", "1.10.0") >= 0 || foundry::compare_versions("v2.0", "2.0.0") != 0 ||
        foundry::compare_versions("3.1", "3.0.9") <= 0) {
      std::cerr << "version comparison mismatch\n";
      ++failures;
    }
  }

  // Test: settings generation.
  {
    const auto settings = foundry::generate_settings_json(registry, {"ruff-format.sh"}, {"pyright-lsp"});
    if (!settings["enabledPlugins"].value("pyright-lsp@claude-plugins-official", false)) {
      std::cerr << "plugin not enabled in settings\n";
      ++failures;
    }
    const auto& post = settings["hooks"]["PostToolUse"];
    if (post.size() != 1 || post[0]["hooks"][0]["command"] != ".claude/hooks/library/ruff-format.sh" ||
        post[0]["matcher"].get<std::string>().find("\\.py$") == std::string::npos) {
      std::cerr << "hook entry mismatch: " << settings.dump() << "\n";
      ++failures;
    }
    if (!foundry::generate_settings_json(registry, {}, {}).empty()) {
      std::cerr << "empty selections should give empty settings\n";
      ++failures;
    }
  }

  // Test: tool config loading.
  {
    const auto dir = make_temp_dir("config");
    const auto yaml_path = dir / "foundry.yaml";
    write_text(yaml_path, "foundry:\n  doc_file: AGENTS.md\n  claude_dir: .cfg\n");
    const auto yaml_cfg = foundry::load_tool_config(yaml_path);
    if (yaml_cfg.doc_file != "AGENTS.md" || yaml_cfg.claude_dir != ".cfg" ||
        yaml_cfg.manifest_file != "setup-manifest.json") {
      std::cerr << "yaml config not applied\n";
      ++failures;
    }
    const auto json_path = dir / "foundry.json";
    write_text(json_path, "{\"repo_url\": \"acme/foundry\", \"projects_dir\": \"/tmp/p\"}");
    const auto json_cfg = foundry::load_tool_config(json_path);
    if (json_cfg.repo_url != "acme/foundry" || json_cfg.projects_dir != "/tmp/p") {
      std::cerr << "json config not applied\n";
      ++failures;
    }
    write_text(dir / "broken.yaml", "foundry: [unclosed\n");
    const auto broken = foundry::load_tool_config(dir / "broken.yaml");
    const auto missing = foundry::load_tool_config(dir / "absent.yaml");
    if (broken.doc_file != "CLAUDE.md" || missing.claude_dir != ".claude") {
      std::cerr << "bad config should fall back to defaults\n";
      ++failures;
    }
    write_text(dir / "typed.json", "{\"claude_dir\": 5, \"doc_file\": \"AGENTS.md\"}");
    const auto typed = foundry::load_tool_config(dir / "typed.json");
    if (typed.claude_dir != ".claude" || typed.doc_file != "CLAUDE.md") {
      std::cerr << "non-string json field should fall back to defaults\n";
      ++failures;
    }
    write_text(dir / "nested.json", "{\"foundry\": {\"projects_dir\": [\"a\"]}}");
    if (foundry::load_tool_config(dir / "nested.json").projects_dir != foundry::ToolConfig{}.projects_dir) {
      std::cerr << "array json field should fall back to defaults\n";
      ++failures;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  // Test: logging ring buffer.
  {
    foundry::log::warn("ring check");
    const auto lines = foundry::log::recent(5);
    if (lines.empty() || lines.back().find("[WARN] ring check") == std::string::npos) {
      std::cerr << "log ring should hold the last warning\n";
      ++failures;
    }
  }

  foundry::log::shutdown();
  if (failures == 0) {
    std::cout << "foundry_core_tests: all passed\n";
  }
  return failures ? 1 : 0;
}

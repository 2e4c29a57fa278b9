#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace foundry {

static constexpr int kManifestSchemaVersion = 2;

enum class Category {
  Rules,
  Agents,
  Commands,
  Skills,
  Hooks
};

enum class ItemShape {
  File,
  Directory
};

const std::vector<Category>& all_categories();
std::string category_name(Category category);
std::optional<Category> parse_category(const std::string& name);
// Destination directory relative to the .claude dir ("hooks/library" for hooks).
std::filesystem::path category_subdir(Category category);
ItemShape category_shape(Category category);

struct ContentItem {
  Category category = Category::Rules;
  std::string identifier;
  ItemShape shape = ItemShape::File;
  std::filesystem::path source;
  bool executable = false;
  // Modular rule category ("lang", "templates", ...); empty for base rules.
  std::string group;
};

struct DetectionMeta {
  std::vector<std::string> extensions;
  std::vector<std::string> config_files;
  std::vector<std::string> dep_keywords;
  std::vector<std::string> detect_dirs;
  bool manual = false;
};

struct ModularRule {
  std::string id;
  DetectionMeta detect;
};

struct ModularCategory {
  std::string name;
  std::vector<ModularRule> rules;
  bool require_one = false;
};

struct HookScript {
  std::string name;
  std::vector<std::string> langs;
  std::string description;
  std::string matcher;
};

struct LspPlugin {
  std::string lang;
  std::string plugin;
  std::string binary;
};

struct WorkflowPlugin {
  std::string name;
  std::string description;
};

struct EnvSnippet {
  std::string lang;
  std::string setup;
  std::string test;
};

struct MigrationEntry {
  std::string old_category;
  std::string old_id;
  std::string new_category;
  std::string new_id;
  bool drop = false;
};

struct MigrationTable {
  int revision = 0;
  std::vector<std::string> old_categories;
  std::vector<MigrationEntry> entries;

  const MigrationEntry* find(const std::string& category, const std::string& id) const;
  bool is_old_category(const std::string& category) const;
};

struct Registry {
  std::vector<std::string> base_rules;
  std::vector<ModularCategory> modular;
  std::vector<HookScript> hooks;
  std::vector<std::string> skills;
  std::vector<LspPlugin> lsp_plugins;
  std::vector<WorkflowPlugin> workflow_plugins;
  std::vector<EnvSnippet> env_snippets;
  std::map<std::string, std::string> rule_descriptions;
  std::vector<std::string> tooling_groups;
  std::vector<std::string> protected_skill_dirs;
  MigrationTable migration;

  const ModularCategory* find_modular(const std::string& name) const;
  const HookScript* find_hook(const std::string& name) const;
  const EnvSnippet* find_env(const std::string& lang) const;
  bool is_base_rule(const std::string& id) const;
  // Rule ids of the tooling groups (languages and platforms).
  std::set<std::string> tooling_rules() const;
  // Names a private prefix may never take.
  std::set<std::string> reserved_words() const;
  // True when a catalog entry is named "<prefix>-...", so entries of that
  // prefix would be indistinguishable from catalog content.
  bool claims_prefix(const std::string& prefix) const;
};

const Registry& default_registry();

// Source resolution against a content root checkout.
ContentItem base_rule_item(const std::filesystem::path& root, const std::string& id);
ContentItem modular_rule_item(const std::filesystem::path& root,
                              const std::string& group,
                              const std::string& id);
ContentItem catalog_item(const std::filesystem::path& root, Category category, const std::string& id);

// Catalog listings that live on disk rather than in the static registry.
std::vector<std::string> list_agents(const std::filesystem::path& root);
std::vector<std::string> list_commands(const std::filesystem::path& root);
std::vector<std::string> list_learned_categories(const std::filesystem::path& root);

std::string read_tool_version(const std::filesystem::path& root);

} // namespace foundry

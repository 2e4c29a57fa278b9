#include "foundry/setup.h"

#include "foundry/detect.h"
#include "foundry/header.h"
#include "foundry/log.h"
#include "foundry/migration.h"
#include "foundry/ownership.h"
#include "foundry/paths.h"
#include "foundry/private_sources.h"
#include "foundry/serialization.h"
#include "foundry/settings.h"

#include <algorithm>
#include <sstream>
#include <system_error>

namespace foundry {
namespace fs = std::filesystem;

namespace {
struct PluginChoice {
  std::string name;
  std::string label;
};

std::set<size_t> indices_of(const std::vector<std::string>& items, const std::vector<std::string>& chosen) {
  std::set<size_t> out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (std::find(chosen.begin(), chosen.end(), items[i]) != chosen.end()) out.insert(i);
  }
  return out;
}

std::vector<std::string> pick(const std::vector<std::string>& items, const std::set<size_t>& selected) {
  std::vector<std::string> out;
  for (const auto idx : selected) {
    if (idx < items.size()) out.push_back(items[idx]);
  }
  return out;
}

// Keeps registry order, drops anything the catalog no longer offers.
std::vector<std::string> filter_known(const std::vector<std::string>& items, const std::vector<std::string>& chosen) {
  return pick(items, indices_of(items, chosen));
}

std::vector<std::string> rule_ids(const ModularCategory& category) {
  std::vector<std::string> out;
  for (const auto& rule : category.rules) out.push_back(rule.id);
  return out;
}

std::vector<std::string> hook_names(const Registry& registry) {
  std::vector<std::string> out;
  for (const auto& hook : registry.hooks) out.push_back(hook.name);
  return out;
}

std::string stem_of(const std::string& id) {
  return fs::path(id).stem().string();
}

std::vector<std::string> auto_hooks(const Registry& registry, const std::set<std::string>& tooling) {
  std::vector<std::string> out;
  for (const auto& hook : registry.hooks) {
    for (const auto& lang : hook.langs) {
      if (tooling.count(lang) > 0) {
        out.push_back(hook.name);
        break;
      }
    }
  }
  return out;
}

std::vector<std::string> auto_agents(const std::vector<std::string>& agents, const std::set<std::string>& tooling) {
  std::vector<std::string> out;
  const bool typescript = tooling.count("nodejs.md") > 0 || tooling.count("react-app.md") > 0;
  for (const auto& agent : agents) {
    bool hit = typescript && agent.find("typescript") != std::string::npos;
    for (const auto& rule : tooling) {
      const auto key = stem_of(rule);
      if (agent.find("-" + key + ".") != std::string::npos || agent.rfind(key + ".", 0) == 0) hit = true;
    }
    if (hit) out.push_back(agent);
  }
  return out;
}

std::vector<std::string> auto_skills(const Registry& registry, const std::set<std::string>& tooling) {
  std::vector<std::string> out;
  if (tooling.count("desktop-gui-qt.md") == 0) return out;
  for (const auto& skill : registry.skills) {
    if (skill == "gui-threading" || skill == "python-qt-gui") out.push_back(skill);
  }
  return out;
}

std::vector<PluginChoice> plugin_catalog(const Registry& registry, const std::set<std::string>& tooling) {
  std::vector<PluginChoice> out;
  std::set<std::string> seen;
  for (const auto& lsp : registry.lsp_plugins) {
    if (tooling.count(lsp.lang) == 0 || !seen.insert(lsp.plugin).second) continue;
    out.push_back({lsp.plugin, lsp.plugin + " - LSP: " + lsp.binary});
  }
  for (const auto& wf : registry.workflow_plugins) {
    out.push_back({wf.name, wf.name + " - " + wf.description});
  }
  return out;
}

std::vector<std::string> plugin_names(const std::vector<PluginChoice>& catalog) {
  std::vector<std::string> out;
  for (const auto& choice : catalog) out.push_back(choice.name);
  return out;
}

void apply_derived_defaults(const fs::path& root, const Registry& registry, Selections& sel) {
  const auto tooling = sel.tooling();
  sel.hooks = auto_hooks(registry, tooling);
  sel.agents = auto_agents(list_agents(root), tooling);
  sel.skills = auto_skills(registry, tooling);
  sel.plugins = plugin_names(plugin_catalog(registry, tooling));
}

bool write_if_changed(const fs::path& path, const std::string& contents, const std::string& label, DeploymentReport& report) {
  std::string existing;
  if (data::read_text_file(path, existing) && existing == contents) {
    return true;
  }
  if (!data::write_text_file(path, contents)) {
    report.errors.push_back({IssueKind::WriteError, label, "failed to write " + path.string()});
    return false;
  }
  report.written.push_back(label);
  return true;
}

std::vector<int> version_parts(const std::string& text, bool& numeric) {
  std::string v = text;
  if (!v.empty() && (v[0] == 'v' || v[0] == 'V')) v.erase(0, 1);
  std::vector<int> parts;
  numeric = !v.empty();
  std::stringstream ss(v);
  std::string part;
  while (std::getline(ss, part, '.')) {
    if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos || part.size() > 9) {
      numeric = false;
      break;
    }
    parts.push_back(std::stoi(part));
  }
  return parts;
}

std::string trimmed(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

enum class DocMode {
  Create,
  Update,
  Replace,
  Merge
};

const char* doc_mode_name(DocMode mode) {
  switch (mode) {
    case DocMode::Create: return "created";
    case DocMode::Update: return "updated";
    case DocMode::Replace: return "replaced";
    case DocMode::Merge: return "merged";
  }
  return "updated";
}

InitResult finish(InitStatus status, int exit_code, const std::string& message) {
  InitResult result;
  result.status = status;
  result.exit_code = exit_code;
  result.message = message;
  if (status == InitStatus::Configured) {
    log::info(message);
  } else {
    log::warn(message);
  }
  return result;
}
} // namespace

std::set<std::string> Selections::langs() const {
  std::set<std::string> out;
  const auto it = modular_rules.find("lang");
  if (it != modular_rules.end()) out.insert(it->second.begin(), it->second.end());
  return out;
}

std::set<std::string> Selections::tooling() const {
  auto out = langs();
  const auto it = modular_rules.find("templates");
  if (it != modular_rules.end()) out.insert(it->second.begin(), it->second.end());
  return out;
}

int compare_versions(const std::string& a, const std::string& b) {
  bool numeric_a = false;
  bool numeric_b = false;
  const auto pa = version_parts(a, numeric_a);
  const auto pb = version_parts(b, numeric_b);
  if (!numeric_a || !numeric_b) {
    return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
  }
  const size_t n = std::max(pa.size(), pb.size());
  for (size_t i = 0; i < n; ++i) {
    const int x = i < pa.size() ? pa[i] : 0;
    const int y = i < pb.size() ? pb[i] : 0;
    if (x != y) return x < y ? -1 : 1;
  }
  return 0;
}

Selections default_selections(const fs::path& project,
                              const fs::path& root,
                              const ToolConfig& config,
                              const Registry& registry,
                              const Manifest* manifest) {
  Selections sel;
  const auto agents = list_agents(root);
  const auto learned = list_learned_categories(root);
  std::vector<std::string> mcp_names;
  for (const auto& entry : list_mcp_servers(root / config.mcp_servers_file)) mcp_names.push_back(entry.first);

  if (manifest) {
    sel.base_rules = filter_known(registry.base_rules, manifest->base_rules);
    for (const auto& category : registry.modular) {
      const auto it = manifest->modular_rules.find(category.name);
      if (it == manifest->modular_rules.end()) continue;
      auto chosen = filter_known(rule_ids(category), it->second);
      if (!chosen.empty()) sel.modular_rules[category.name] = std::move(chosen);
    }
    const auto tooling = sel.tooling();
    sel.hooks = filter_known(hook_names(registry), manifest->hooks);
    sel.agents = filter_known(agents, manifest->agents);
    sel.skills = filter_known(registry.skills, manifest->skills);
    sel.learned_categories = filter_known(learned, manifest->learned_categories);
    sel.plugins = filter_known(plugin_names(plugin_catalog(registry, tooling)), manifest->plugins);
    sel.mcp_servers = filter_known(mcp_names, manifest->mcp_servers);
    return sel;
  }

  const auto detected = detect_project(project, registry);
  sel.base_rules = registry.base_rules;
  for (const auto& category : registry.modular) {
    std::vector<std::string> chosen;
    for (const auto& rule : category.rules) {
      if (detected.rules.count(rule.id) > 0) chosen.push_back(rule.id);
    }
    if (!chosen.empty()) sel.modular_rules[category.name] = std::move(chosen);
  }
  apply_derived_defaults(root, registry, sel);
  sel.learned_categories = learned;
  return sel;
}

bool resolve_selections(const fs::path& root,
                        const ToolConfig& config,
                        const Registry& registry,
                        const Selections& defaults,
                        const Manifest* manifest,
                        ISelectionResolver& resolver,
                        Selections& out) {
  out = defaults;
  const auto agents = list_agents(root);
  const auto learned = list_learned_categories(root);
  const auto mcp = list_mcp_servers(root / config.mcp_servers_file);

  const size_t modular_begin = 1;
  const size_t modular_end = modular_begin + registry.modular.size();
  const size_t hooks_step = modular_end;
  const size_t agents_step = hooks_step + 1;
  const size_t skills_step = agents_step + 1;
  const size_t learned_step = skills_step + 1;
  const size_t plugins_step = learned_step + 1;
  const size_t mcp_step = plugins_step + 1;
  const size_t step_count = mcp_step + 1;

  std::vector<size_t> visited;
  size_t step = 0;
  while (step < step_count) {
    MenuRequest request;
    std::vector<std::string> ids;
    std::vector<std::string>* target = nullptr;
    std::string modular_key;

    if (step == 0) {
      request.title = "Base Rules (all recommended)";
      ids = registry.base_rules;
      target = &out.base_rules;
    } else if (step < modular_end) {
      const auto& category = registry.modular[step - modular_begin];
      request.title = "Rules: " + category.name + "/" + (category.require_one ? " (select at least one)" : "");
      request.require_one = category.require_one;
      ids = rule_ids(category);
      modular_key = category.name;
      target = &out.modular_rules[category.name];
    } else if (step == hooks_step) {
      request.title = "Hooks (auto-selected by language)";
      ids = hook_names(registry);
      for (const auto& hook : registry.hooks) request.labels.push_back(hook.name + " - " + hook.description);
      target = &out.hooks;
    } else if (step == agents_step) {
      request.title = "Agents";
      ids = agents;
      target = &out.agents;
    } else if (step == skills_step) {
      request.title = "Skills";
      ids = registry.skills;
      target = &out.skills;
    } else if (step == learned_step) {
      request.title = "Learned Skills (categories)";
      ids = learned;
      target = &out.learned_categories;
    } else if (step == plugins_step) {
      request.title = "Plugins";
      const auto catalog = plugin_catalog(registry, out.tooling());
      for (const auto& choice : catalog) {
        ids.push_back(choice.name);
        request.labels.push_back(choice.label);
      }
      target = &out.plugins;
    } else {
      request.title = "MCP Servers (optional)";
      for (const auto& entry : mcp) {
        ids.push_back(entry.first);
        request.labels.push_back(entry.first + " - " + entry.second);
      }
      target = &out.mcp_servers;
    }

    if (ids.empty()) {
      if (!modular_key.empty()) out.modular_rules.erase(modular_key);
      ++step;
      continue;
    }
    if (request.labels.empty()) request.labels = ids;
    request.defaults = indices_of(ids, *target);

    const auto result = resolver.Select(request);
    if (result.kind == SelectionResult::Kind::Quit) {
      return false;
    }
    if (result.kind == SelectionResult::Kind::Back) {
      if (!visited.empty()) {
        step = visited.back();
        visited.pop_back();
      }
      continue;
    }

    *target = pick(ids, result.selected);
    if (!modular_key.empty()) {
      if (target->empty()) out.modular_rules.erase(modular_key);
      if (!manifest) apply_derived_defaults(root, registry, out);
    }
    visited.push_back(step);
    ++step;
  }
  return true;
}

DeploymentReport deploy_learned_skills(const fs::path& root,
                                       const fs::path& claude_dir,
                                       const std::vector<std::string>& categories) {
  DeploymentReport report;
  const auto dest_base = claude_dir / "skills" / "learned";
  const auto local_base = claude_dir / "skills" / "learned-local";
  for (const auto& cat : categories) {
    const auto src_dir = root / "skills" / "learned" / cat;
    std::error_code ec;
    if (!fs::is_directory(src_dir, ec)) {
      report.warnings.push_back({IssueKind::SkippedMissingSource, cat, "learned category not found"});
      continue;
    }
    std::vector<std::string> files;
    for (auto it = fs::directory_iterator(src_dir, ec); it != fs::directory_iterator(); it.increment(ec)) {
      if (ec) break;
      std::error_code type_ec;
      if (it->is_regular_file(type_ec) && it->path().extension() == ".md") {
        files.push_back(it->path().filename().string());
      }
    }
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
      const auto name = cat + "/" + file;
      if (fs::exists(local_base / cat / file, ec)) {
        report.warnings.push_back({IssueKind::Conflict, name, "also present in learned-local/" + cat});
      }
      ContentItem item;
      item.category = Category::Skills;
      item.identifier = name;
      item.source = src_dir / file;
      std::string error;
      switch (copy_item(item, dest_base / cat / file, error)) {
        case CopyOutcome::Copied:
          report.deployed.push_back(name);
          report.written.push_back(name);
          break;
        case CopyOutcome::Unchanged:
          report.deployed.push_back(name);
          break;
        case CopyOutcome::MissingSource:
          report.warnings.push_back({IssueKind::SkippedMissingSource, name, error});
          break;
        case CopyOutcome::Failed:
          report.errors.push_back({IssueKind::WriteError, name, error});
          break;
      }
    }
  }
  return report;
}

InitResult run_init(const fs::path& project_in,
                    const fs::path& root,
                    const ToolConfig& config,
                    const Registry& registry,
                    ISelectionResolver& resolver,
                    const InitOptions& options) {
  std::error_code ec;
  fs::path project = fs::weakly_canonical(fs::absolute(project_in, ec), ec);
  if (ec || project.empty()) project = project_in;
  if (!fs::is_directory(project, ec)) {
    return finish(InitStatus::Failed, kExitSkipped, "project directory not found: " + project.string());
  }
  const auto paths = project_paths(project, config);
  const auto version = read_tool_version(root);
  log::info("foundry setup v" + version + " for " + project.string());

  // Version pre-check.
  std::string existing_version;
  if (resolver.Interactive() && data::read_text_file(paths.version_file, existing_version)) {
    existing_version = trimmed(existing_version);
    const int cmp = compare_versions(existing_version, version);
    if (cmp == 0) {
      if (!resolver.Confirm("Already configured with current version. Reconfigure?", false)) {
        return finish(InitStatus::Aborted, kExitSkipped, "reconfigure declined");
      }
    } else if (cmp < 0) {
      if (!resolver.Confirm("Project configured with " + existing_version + ", repo is " + version + ". Update?",
                            true)) {
        return finish(InitStatus::Aborted, kExitSkipped, "update declined");
      }
    } else {
      return finish(InitStatus::Aborted, kExitSkipped,
                    "project version (" + existing_version + ") is newer than repo (" + version + ")");
    }
  }

  auto manifest = load_manifest(paths.manifest);
  if (manifest && needs_migration(*manifest, registry.migration)) {
    log::info("migrating manifest to schema " + std::to_string(registry.migration.revision));
    manifest = migrate_manifest(*manifest, registry.migration);
  }
  const Manifest* saved = manifest ? &*manifest : nullptr;

  const auto defaults = default_selections(project, root, config, registry, saved);
  Selections sel;
  if (!resolve_selections(root, config, registry, defaults, saved, resolver, sel)) {
    return finish(InitStatus::Aborted, kExitSkipped, "setup aborted");
  }

  // CLAUDE.md disposition is settled before anything is written.
  std::string existing_doc;
  const bool doc_exists = fs::exists(paths.doc, ec) && data::read_text_file(paths.doc, existing_doc);
  DocMode doc_mode = DocMode::Create;
  if (doc_exists) {
    if (has_block(existing_doc)) {
      doc_mode = DocMode::Update;
    } else if (resolver.Interactive()) {
      const auto lines = std::count(existing_doc.begin(), existing_doc.end(), '\n');
      log::info(config.doc_file + " exists (" + std::to_string(lines) + " lines, " +
                std::to_string(existing_doc.size()) + " chars) without a foundry header");
      const char choice = resolver.Choose("[R]eplace (original saved as .old), [M]erge (prepend header), [Q]uit",
                                          "R/M/Q", 'M');
      if (choice == 'Q') {
        return finish(InitStatus::Aborted, kExitSkipped, "aborted; no changes made to " + config.doc_file);
      }
      doc_mode = choice == 'R' ? DocMode::Replace : DocMode::Merge;
    } else if (options.force) {
      if (!resolver.Confirm(config.doc_file + " exists without the foundry marker. Proceed with force merge?",
                            false)) {
        return finish(InitStatus::Aborted, kExitSkipped, "force merge declined");
      }
      doc_mode = DocMode::Merge;
    } else {
      return finish(InitStatus::Skipped, kExitSkipped,
                    config.doc_file + " exists without the foundry marker; skipping " + project.string() +
                        " (run init interactively or pass --force)");
    }
  }

  InitResult result;
  result.selections = sel;
  auto& report = result.report;

  fs::create_directories(paths.claude_dir, ec);
  if (ec) {
    return finish(InitStatus::Failed, kExitWriteError, "cannot create " + paths.claude_dir.string() + ": " + ec.message());
  }
  write_if_changed(paths.version_file, version + "\n", "VERSION", report);

  const auto prefixes = manifest ? manifest->private_prefixes() : std::vector<std::string>{};
  const auto policy = make_ownership_policy(registry, prefixes);

  std::vector<ContentItem> rules;
  for (const auto& id : sel.base_rules) {
    rules.push_back(base_rule_item(root, id));
  }
  for (const auto& category : registry.modular) {
    const auto it = sel.modular_rules.find(category.name);
    if (it == sel.modular_rules.end()) continue;
    for (const auto& id : it->second) {
      rules.push_back(modular_rule_item(root, category.name, id));
    }
  }
  // The header names files as they land in .claude/rules/.
  const auto deployed_rules = destination_names(rules, "");
  auto rules_report = reconcile(Category::Rules, rules, policy, paths.claude_dir / "rules");
  log_report("rules", rules_report);
  report.merge(rules_report);

  const auto reconcile_catalog = [&](Category category, const std::vector<std::string>& ids) {
    std::vector<ContentItem> items;
    for (const auto& id : ids) items.push_back(catalog_item(root, category, id));
    auto part = reconcile(category, items, policy, paths.claude_dir / category_subdir(category));
    log_report(category_name(category), part);
    report.merge(part);
  };
  reconcile_catalog(Category::Agents, sel.agents);
  reconcile_catalog(Category::Commands, list_commands(root));
  reconcile_catalog(Category::Skills, sel.skills);
  reconcile_catalog(Category::Hooks, sel.hooks);

  if (!sel.learned_categories.empty()) {
    auto learned = deploy_learned_skills(root, paths.claude_dir, sel.learned_categories);
    log_report("learned", learned);
    report.merge(learned);
  }

  if (manifest && !manifest->private_sources.empty()) {
    for (const auto& [prefix, part] : redeploy_private_sources(paths.claude_dir, manifest->private_sources, registry)) {
      log_report("private:" + prefix, part);
      report.merge(part);
    }
  }

  const auto settings = generate_settings_json(registry, sel.hooks, sel.plugins);
  write_if_changed(paths.settings, settings.dump(2) + "\n", "settings.json", report);

  if (!sel.mcp_servers.empty()) {
    std::string error;
    if (!write_mcp_servers(paths.claude_json, root / config.mcp_servers_file, sel.mcp_servers, error)) {
      report.errors.push_back({IssueKind::WriteError, ".claude.json", error});
    }
  }

  Manifest next;
  next.schema_version = kManifestSchemaVersion;
  next.version = version;
  next.config_repo = root.string();
  next.repo_url = config.repo_url;
  next.base_rules = sel.base_rules;
  next.modular_rules = sel.modular_rules;
  next.hooks = sel.hooks;
  next.agents = sel.agents;
  next.skills = sel.skills;
  next.learned_categories = sel.learned_categories;
  next.plugins = sel.plugins;
  next.mcp_servers = sel.mcp_servers;
  if (manifest) next.private_sources = manifest->private_sources;
  // A first pass that failed leaves no manifest behind.
  if (manifest || report.ok()) {
    if (!write_if_changed(paths.manifest, manifest_to_json(next).dump(2) + "\n", config.manifest_file, report)) {
      log::error("failed to write manifest: " + paths.manifest.string());
    }
  }

  const auto block = render_header(registry, deployed_rules, sel.langs());
  auto project_name = project.filename().string();
  if (project_name.empty()) project_name = project.parent_path().filename().string();
  std::string doc;
  switch (doc_mode) {
    case DocMode::Create:
    case DocMode::Replace:
      doc = render_document(project_name, block);
      break;
    case DocMode::Update:
      doc = splice_update(existing_doc, block);
      break;
    case DocMode::Merge:
      doc = splice_prepend(existing_doc, block);
      break;
  }
  bool backup_ok = true;
  if (doc_mode == DocMode::Replace || doc_mode == DocMode::Merge) {
    backup_ok = data::write_text_file(paths.doc_backup, existing_doc);
    if (!backup_ok) {
      report.errors.push_back({IssueKind::WriteError, paths.doc_backup.filename().string(), "backup failed"});
    }
  }
  // Never overwrite user content that could not be backed up.
  if (backup_ok) {
    write_if_changed(paths.doc, doc, config.doc_file, report);
  }
  result.doc_action = doc_mode_name(doc_mode);

  size_t modular_count = 0;
  for (const auto& [category, ids] : sel.modular_rules) modular_count += ids.size();
  log::info("rules: " + std::to_string(sel.base_rules.size()) + " base + " + std::to_string(modular_count) +
            " modular, hooks: " + std::to_string(sel.hooks.size()) + ", agents: " +
            std::to_string(sel.agents.size()) + ", skills: " + std::to_string(sel.skills.size()) +
            ", plugins: " + std::to_string(sel.plugins.size()) + ", mcp servers: " +
            std::to_string(sel.mcp_servers.size()));

  if (!report.ok()) {
    result.status = InitStatus::Failed;
    result.exit_code = kExitWriteError;
    result.message = std::to_string(report.errors.size()) + " write error(s) configuring " + project.string();
    log::error(result.message);
    return result;
  }
  result.status = InitStatus::Configured;
  result.exit_code = kExitOk;
  result.message = "project configured with foundry v" + version + " (" + config.doc_file + " " +
                   result.doc_action + ")";
  log::info(result.message);
  return result;
}

} // namespace foundry

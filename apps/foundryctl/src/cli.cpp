#include "foundryctl/cli_api.h"

#include "foundry/config.h"
#include "foundry/log.h"
#include "foundry/manifest.h"
#include "foundry/migration.h"
#include "foundry/paths.h"
#include "foundry/private_sources.h"
#include "foundry/projects.h"
#include "foundry/registry.h"
#include "foundry/selection.h"
#include "foundry/setup.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
struct CliEnv {
  foundry::ResolvedPaths paths;
  foundry::ToolConfig config;
  foundry::ProjectPaths project;
};

CliEnv load_env(const char* argv0, const std::optional<fs::path>& project_override) {
  CliEnv env;
  env.paths = foundry::resolve_paths(argv0, project_override);
  env.config = foundry::load_tool_config(env.paths.config_file);
  env.project = foundry::project_paths(env.paths.project, env.config);
  return env;
}

std::unique_ptr<foundry::ISelectionResolver> make_resolver(bool interactive, bool force) {
  if (interactive) {
    return std::make_unique<foundry::ConsoleResolver>(std::cin, std::cout);
  }
  if (force) {
    return std::make_unique<foundry::ConfirmingDefaultsResolver>(std::cin, std::cout);
  }
  return std::make_unique<foundry::DefaultsResolver>();
}

// Loaded and migrated manifest, or nullopt with a message printed.
std::optional<foundry::Manifest> require_manifest(const CliEnv& env) {
  auto manifest = foundry::load_manifest(env.project.manifest);
  if (!manifest) {
    std::cerr << "No manifest at " << env.project.manifest.string() << "; run `foundryctl init` first.\n";
    return std::nullopt;
  }
  const auto& registry = foundry::default_registry();
  if (foundry::needs_migration(*manifest, registry.migration)) {
    manifest = foundry::migrate_manifest(*manifest, registry.migration);
  }
  return manifest;
}

std::vector<std::string> select_items(foundry::ISelectionResolver& resolver,
                                      const std::string& title,
                                      const std::vector<std::string>& items,
                                      bool& quit) {
  if (items.empty()) return {};
  foundry::MenuRequest request;
  request.title = title;
  request.labels = items;
  for (size_t i = 0; i < items.size(); ++i) request.defaults.insert(i);
  const auto result = resolver.Select(request);
  if (result.kind != foundry::SelectionResult::Kind::Accepted) {
    quit = true;
    return {};
  }
  std::vector<std::string> out;
  for (const auto idx : result.selected) out.push_back(items[idx]);
  return out;
}
} // namespace

int cmd_version(const char* argv0) {
  const auto env = load_env(argv0, std::nullopt);
  std::cout << "foundry version: " << foundry::read_tool_version(env.paths.root) << "\n";
  return 0;
}

int cmd_init(const char* argv0, const std::optional<fs::path>& project_override, const InitCliOptions& opts) {
  const auto env = load_env(argv0, project_override);
  auto resolver = make_resolver(opts.interactive, opts.force);
  foundry::InitOptions init_opts;
  init_opts.force = opts.force;
  const auto result = foundry::run_init(env.paths.project, env.paths.root, env.config, foundry::default_registry(),
                                        *resolver, init_opts);
  return result.exit_code;
}

int cmd_update_all(const char* argv0, bool force) {
  const auto env = load_env(argv0, std::nullopt);
  const auto projects_dir = foundry::projects_dir_for(env.config);
  const auto projects = foundry::discover_projects(projects_dir, env.config);
  if (projects.empty()) {
    std::cout << "No projects found in " << projects_dir.string() << "\n";
    return 0;
  }

  foundry::MenuRequest request;
  request.title = "Select projects to update";
  for (size_t i = 0; i < projects.size(); ++i) {
    const auto& p = projects[i];
    const std::string status = p.version.empty() ? "not configured" : "v" + p.version;
    request.labels.push_back(p.path.string() + "  (" + status + (p.has_manifest ? " +manifest" : "") + ")");
    if (p.has_setup) request.defaults.insert(i);
  }
  foundry::ConsoleResolver console(std::cin, std::cout);
  const auto picked = console.Select(request);
  if (picked.kind != foundry::SelectionResult::Kind::Accepted || picked.selected.empty()) {
    std::cout << "No projects selected.\n";
    return 0;
  }

  std::vector<std::string> updated, configured, skipped, failed;
  bool write_error = false;
  for (const auto idx : picked.selected) {
    const auto& p = projects[idx];
    std::cout << "\n" << std::string(60, '=') << "\nProject: " << p.path.string() << "\n"
              << std::string(60, '=') << "\n";
    // Projects with a manifest replay their saved choices.
    auto resolver = make_resolver(!p.has_manifest, force);
    foundry::InitOptions init_opts;
    init_opts.force = force;
    const auto result = foundry::run_init(p.path, env.paths.root, env.config, foundry::default_registry(),
                                          *resolver, init_opts);
    switch (result.status) {
      case foundry::InitStatus::Configured:
        (p.has_manifest ? updated : configured).push_back(p.path.string());
        break;
      case foundry::InitStatus::Skipped:
      case foundry::InitStatus::Aborted:
        skipped.push_back(p.path.string());
        break;
      case foundry::InitStatus::Failed:
        failed.push_back(p.path.string());
        write_error = write_error || result.exit_code == foundry::kExitWriteError;
        break;
    }
  }

  std::cout << "\n" << std::string(60, '=') << "\nUpdate All - Summary\n" << std::string(60, '=') << "\n";
  const auto print_group = [](const char* label, const char* mark, const std::vector<std::string>& list) {
    if (list.empty()) return;
    std::cout << "\n  " << label << ": " << list.size() << "\n";
    for (const auto& path : list) std::cout << "    " << mark << " " << path << "\n";
  };
  print_group("Updated (non-interactive)", "+", updated);
  print_group("Configured (interactive)", "+", configured);
  print_group("Skipped", "-", skipped);
  print_group("Failed", "x", failed);
  if (write_error) return foundry::kExitWriteError;
  return failed.empty() ? 0 : 1;
}

int cmd_migrate(const char* argv0, const std::optional<fs::path>& project_override, bool dry_run) {
  const auto env = load_env(argv0, project_override);
  const auto manifest = foundry::load_manifest(env.project.manifest);
  if (!manifest) {
    std::cerr << "No readable manifest at " << env.project.manifest.string() << "\n";
    return 1;
  }
  const auto& table = foundry::default_registry().migration;
  const auto migrated = foundry::migrate_manifest(*manifest, table);
  const auto before = foundry::manifest_to_json(*manifest)["modular_rules"];
  const auto after = foundry::manifest_to_json(migrated)["modular_rules"];
  if (before == after && manifest->schema_version == migrated.schema_version) {
    std::cout << "Manifest already current (schema " << migrated.schema_version << ").\n";
    return 0;
  }
  std::cout << "modular_rules before: " << before.dump() << "\n";
  std::cout << "modular_rules after:  " << after.dump() << "\n";
  if (dry_run) {
    std::cout << "Dry run; manifest not written.\n";
    return 0;
  }
  if (!foundry::save_manifest(env.project.manifest, migrated)) {
    return foundry::kExitWriteError;
  }
  std::cout << "Manifest migrated to schema " << migrated.schema_version << ".\n";
  return 0;
}

int cmd_private_add(const char* argv0, const std::optional<fs::path>& project_override, const PrivateAddOptions& opts) {
  const auto env = load_env(argv0, project_override);
  const auto& registry = foundry::default_registry();
  auto manifest = require_manifest(env);
  if (!manifest) return 1;

  const auto prefixes = manifest->private_prefixes();
  auto catalog_names = foundry::list_agents(env.paths.root);
  for (const auto& name : foundry::list_commands(env.paths.root)) catalog_names.push_back(name);
  if (const auto error = foundry::validate_prefix(opts.prefix, prefixes, registry, catalog_names)) {
    std::cerr << "Invalid prefix: " << *error << "\n";
    return 1;
  }
  std::error_code ec;
  const auto source = fs::absolute(opts.source_dir, ec).lexically_normal();
  if (ec || !fs::is_directory(source, ec)) {
    std::cerr << "Private source directory not found: " << opts.source_dir.string() << "\n";
    return 1;
  }
  const auto content = foundry::discover_private_content(source);
  if (content.empty()) {
    std::cerr << "No deployable content found in " << source.string() << "\n";
    return 1;
  }

  auto resolver = make_resolver(opts.interactive, false);
  foundry::PrivateSourceRef ref;
  ref.path = source.string();
  ref.prefix = opts.prefix;
  bool quit = false;
  for (const auto category : foundry::all_categories()) {
    const auto title = "Private " + foundry::category_name(category) + " (" + opts.prefix + ")";
    ref.selections(category) = select_items(*resolver, title, content.list(category), quit);
    if (quit) {
      std::cout << "Aborted; nothing registered.\n";
      return 1;
    }
  }

  auto all_prefixes = prefixes;
  all_prefixes.push_back(ref.prefix);
  const auto report = foundry::deploy_private_source(env.project.claude_dir, ref, registry, all_prefixes);
  foundry::log_report("private:" + ref.prefix, report);

  std::string error;
  if (!foundry::register_private_source(*manifest, ref, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (!foundry::save_manifest(env.project.manifest, *manifest)) {
    return foundry::kExitWriteError;
  }
  std::cout << "Registered private source '" << ref.prefix << "' (" << report.deployed.size()
            << " item(s) deployed).\n";
  return report.ok() ? 0 : foundry::kExitWriteError;
}

int cmd_private_list(const char* argv0, const std::optional<fs::path>& project_override) {
  const auto env = load_env(argv0, project_override);
  auto manifest = require_manifest(env);
  if (!manifest) return 1;
  if (manifest->private_sources.empty()) {
    std::cout << "No private sources registered.\n";
    return 0;
  }
  const auto prefixes = manifest->private_prefixes();
  for (const auto& ref : manifest->private_sources) {
    std::error_code ec;
    const bool reachable = fs::is_directory(ref.path, ec);
    std::cout << ref.prefix << "  " << ref.path << (reachable ? "" : "  [missing]") << "\n";
    const auto files = foundry::list_private_files(env.project.claude_dir, ref.prefix, foundry::default_registry(),
                                                   prefixes);
    for (const auto& [category, names] : files) {
      std::cout << "  " << foundry::category_name(category) << ":";
      for (const auto& name : names) std::cout << " " << name;
      std::cout << "\n";
    }
  }
  return 0;
}

int cmd_private_remove(const char* argv0, const std::optional<fs::path>& project_override, const std::string& prefix) {
  const auto env = load_env(argv0, project_override);
  auto manifest = require_manifest(env);
  if (!manifest) return 1;
  if (!manifest->find_private(prefix)) {
    std::cerr << "No private source registered with prefix '" << prefix << "'\n";
    return 1;
  }
  const auto report = foundry::clean_private_files(env.project.claude_dir, prefix, foundry::default_registry(),
                                                   manifest->private_prefixes());
  foundry::log_report("private:" + prefix, report);
  foundry::unregister_private_source(*manifest, prefix);
  if (!foundry::save_manifest(env.project.manifest, *manifest)) {
    return foundry::kExitWriteError;
  }
  std::cout << "Removed private source '" << prefix << "' (" << report.removed.size() << " entries deleted).\n";
  return report.ok() ? 0 : foundry::kExitWriteError;
}

#pragma once

#include "foundry/config.h"
#include "foundry/manifest.h"
#include "foundry/reconcile.h"
#include "foundry/registry.h"
#include "foundry/selection.h"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace foundry {

static constexpr int kExitOk = 0;
static constexpr int kExitSkipped = 1;
static constexpr int kExitWriteError = 2;

struct InitOptions {
  // Merge the header into a CLAUDE.md without markers (after confirmation)
  // instead of skipping the project in non-interactive runs.
  bool force = false;
};

enum class InitStatus {
  Configured,
  Skipped,
  Aborted,
  Failed
};

struct Selections {
  std::vector<std::string> base_rules;
  ModularSelection modular_rules;
  std::vector<std::string> hooks;
  std::vector<std::string> agents;
  std::vector<std::string> skills;
  std::vector<std::string> learned_categories;
  std::vector<std::string> plugins;
  std::vector<std::string> mcp_servers;

  std::set<std::string> langs() const;
  // Rule ids that drive tool defaults: languages and templates.
  std::set<std::string> tooling() const;
};

struct InitResult {
  InitStatus status = InitStatus::Failed;
  int exit_code = kExitSkipped;
  std::string message;
  std::string doc_action;
  Selections selections;
  DeploymentReport report;
};

// <0 when a is older than b, 0 when equal, >0 when newer. Dotted numeric
// components compare numerically; a leading 'v' is ignored.
int compare_versions(const std::string& a, const std::string& b);

// Defaults for the menus: the manifest's choices when present, else detection.
Selections default_selections(const std::filesystem::path& project,
                              const std::filesystem::path& root,
                              const ToolConfig& config,
                              const Registry& registry,
                              const Manifest* manifest);

// Walks the menus with back/quit navigation. Returns false on quit.
bool resolve_selections(const std::filesystem::path& root,
                        const ToolConfig& config,
                        const Registry& registry,
                        const Selections& defaults,
                        const Manifest* manifest,
                        ISelectionResolver& resolver,
                        Selections& out);

DeploymentReport deploy_learned_skills(const std::filesystem::path& root,
                                       const std::filesystem::path& claude_dir,
                                       const std::vector<std::string>& categories);

// One full init pass on a project: manifest load and migration, selection,
// reconciliation of every category, private sources, generated files and
// the CLAUDE.md header.
InitResult run_init(const std::filesystem::path& project,
                    const std::filesystem::path& root,
                    const ToolConfig& config,
                    const Registry& registry,
                    ISelectionResolver& resolver,
                    const InitOptions& options);

} // namespace foundry

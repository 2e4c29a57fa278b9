#pragma once

#include "foundry/manifest.h"
#include "foundry/reconcile.h"
#include "foundry/registry.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace foundry {

struct DiscoveredContent {
  std::vector<std::string> rules;
  std::vector<std::string> commands;
  std::vector<std::string> skills;
  std::vector<std::string> agents;
  std::vector<std::string> hooks;

  bool empty() const;
  const std::vector<std::string>& list(Category category) const;
};

// Returns an error message when the candidate prefix cannot be registered.
// catalog_names are content-root entries (agents, commands) that live on
// disk rather than in the registry.
std::optional<std::string> validate_prefix(const std::string& candidate,
                                           const std::vector<std::string>& existing,
                                           const Registry& registry,
                                           const std::vector<std::string>& catalog_names = {});

DiscoveredContent discover_private_content(const std::filesystem::path& source_dir);

ContentItem private_item(const std::filesystem::path& source_dir, Category category, const std::string& id);

// Copies the ref's selections into claude_dir under "<prefix>-<basename>".
// Missing items are reported as warnings and left out of deployed.
DeploymentReport deploy_private_source(const std::filesystem::path& claude_dir,
                                       const PrivateSourceRef& ref,
                                       const Registry& registry,
                                       const std::vector<std::string>& all_prefixes);

// Removes every "<prefix>-*" entry the prefix owns across category dirs.
DeploymentReport clean_private_files(const std::filesystem::path& claude_dir,
                                     const std::string& prefix,
                                     const Registry& registry,
                                     const std::vector<std::string>& all_prefixes);

// Clean then deploy per source. An unreachable source path yields an empty
// report for that prefix.
std::map<std::string, DeploymentReport> redeploy_private_sources(const std::filesystem::path& claude_dir,
                                                                 const std::vector<PrivateSourceRef>& sources,
                                                                 const Registry& registry);

// Deployed entry names per category for the prefix, read from disk.
std::map<Category, std::vector<std::string>> list_private_files(const std::filesystem::path& claude_dir,
                                                                const std::string& prefix,
                                                                const Registry& registry,
                                                                const std::vector<std::string>& all_prefixes);

bool register_private_source(Manifest& manifest, const PrivateSourceRef& ref, std::string& error);
bool unregister_private_source(Manifest& manifest, const std::string& prefix);

} // namespace foundry

#pragma once

#include "foundry/registry.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace foundry {

// modular category -> selected rule ids
using ModularSelection = std::map<std::string, std::vector<std::string>>;

struct PrivateSourceRef {
  std::string path;
  std::string prefix;
  std::vector<std::string> rules;
  std::vector<std::string> commands;
  std::vector<std::string> skills;
  std::vector<std::string> agents;
  std::vector<std::string> hooks;

  const std::vector<std::string>& selections(Category category) const;
  std::vector<std::string>& selections(Category category);
};

struct Manifest {
  int schema_version = 0;
  std::string version;
  std::string config_repo;
  std::string repo_url;
  std::vector<std::string> base_rules;
  ModularSelection modular_rules;
  std::vector<std::string> hooks;
  std::vector<std::string> agents;
  std::vector<std::string> skills;
  std::vector<std::string> learned_categories;
  std::vector<std::string> plugins;
  std::vector<std::string> mcp_servers;
  std::vector<PrivateSourceRef> private_sources;

  const PrivateSourceRef* find_private(const std::string& prefix) const;
  std::vector<std::string> private_prefixes() const;
};

nlohmann::json manifest_to_json(const Manifest& manifest);
// Wrong-typed fields make the whole document invalid; error names the cause.
std::optional<Manifest> manifest_from_json(const nlohmann::json& node, std::string& error);

// Missing or malformed files yield nullopt; malformed ones are logged.
std::optional<Manifest> load_manifest(const std::filesystem::path& path);
bool save_manifest(const std::filesystem::path& path, const Manifest& manifest);

} // namespace foundry

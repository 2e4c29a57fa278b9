#include "foundry/manifest.h"

#include "foundry/log.h"
#include "foundry/serialization.h"

namespace foundry {

namespace {
void read_list(const nlohmann::json& node, const char* key, std::vector<std::string>& out) {
  if (!node.contains(key) || node[key].is_null()) return;
  out = node.at(key).get<std::vector<std::string>>();
}

nlohmann::json private_to_json(const PrivateSourceRef& ref) {
  nlohmann::json j;
  j["path"] = ref.path;
  j["prefix"] = ref.prefix;
  j["rules"] = ref.rules;
  j["commands"] = ref.commands;
  j["skills"] = ref.skills;
  j["agents"] = ref.agents;
  j["hooks"] = ref.hooks;
  return j;
}

PrivateSourceRef private_from_json(const nlohmann::json& node) {
  PrivateSourceRef ref;
  ref.path = node.at("path").get<std::string>();
  ref.prefix = node.at("prefix").get<std::string>();
  read_list(node, "rules", ref.rules);
  read_list(node, "commands", ref.commands);
  read_list(node, "skills", ref.skills);
  read_list(node, "agents", ref.agents);
  read_list(node, "hooks", ref.hooks);
  return ref;
}
} // namespace

const std::vector<std::string>& PrivateSourceRef::selections(Category category) const {
  switch (category) {
    case Category::Rules: return rules;
    case Category::Agents: return agents;
    case Category::Commands: return commands;
    case Category::Skills: return skills;
    case Category::Hooks: return hooks;
  }
  return rules;
}

std::vector<std::string>& PrivateSourceRef::selections(Category category) {
  const auto& self = *this;
  return const_cast<std::vector<std::string>&>(self.selections(category));
}

const PrivateSourceRef* Manifest::find_private(const std::string& prefix) const {
  for (const auto& ref : private_sources) {
    if (ref.prefix == prefix) return &ref;
  }
  return nullptr;
}

std::vector<std::string> Manifest::private_prefixes() const {
  std::vector<std::string> out;
  out.reserve(private_sources.size());
  for (const auto& ref : private_sources) out.push_back(ref.prefix);
  return out;
}

nlohmann::json manifest_to_json(const Manifest& manifest) {
  nlohmann::json j;
  j["schema_version"] = manifest.schema_version;
  j["version"] = manifest.version;
  j["config_repo"] = manifest.config_repo;
  j["repo_url"] = manifest.repo_url;
  j["base_rules"] = manifest.base_rules;
  j["modular_rules"] = nlohmann::json::object();
  for (const auto& [category, ids] : manifest.modular_rules) {
    j["modular_rules"][category] = ids;
  }
  j["hooks"] = manifest.hooks;
  j["agents"] = manifest.agents;
  j["skills"] = manifest.skills;
  j["learned_categories"] = manifest.learned_categories;
  j["plugins"] = manifest.plugins;
  j["mcp_servers"] = manifest.mcp_servers;
  j["private_sources"] = nlohmann::json::array();
  for (const auto& ref : manifest.private_sources) {
    j["private_sources"].push_back(private_to_json(ref));
  }
  return j;
}

std::optional<Manifest> manifest_from_json(const nlohmann::json& node, std::string& error) {
  if (!node.is_object()) {
    error = "manifest root is not an object";
    return std::nullopt;
  }
  Manifest manifest;
  try {
    // Files written before schema versioning carry no field.
    manifest.schema_version = node.value("schema_version", 1);
    manifest.version = node.value("version", "");
    manifest.config_repo = node.value("config_repo", "");
    manifest.repo_url = node.value("repo_url", "");
    read_list(node, "base_rules", manifest.base_rules);
    if (node.contains("modular_rules") && !node["modular_rules"].is_null()) {
      const auto& modular = node.at("modular_rules");
      if (!modular.is_object()) {
        error = "modular_rules is not an object";
        return std::nullopt;
      }
      for (auto it = modular.begin(); it != modular.end(); ++it) {
        manifest.modular_rules[it.key()] = it.value().get<std::vector<std::string>>();
      }
    }
    read_list(node, "hooks", manifest.hooks);
    read_list(node, "agents", manifest.agents);
    read_list(node, "skills", manifest.skills);
    read_list(node, "learned_categories", manifest.learned_categories);
    read_list(node, "plugins", manifest.plugins);
    read_list(node, "mcp_servers", manifest.mcp_servers);
    if (node.contains("private_sources") && !node["private_sources"].is_null()) {
      for (const auto& entry : node.at("private_sources")) {
        manifest.private_sources.push_back(private_from_json(entry));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    error = e.what();
    return std::nullopt;
  }
  return manifest;
}

std::optional<Manifest> load_manifest(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  nlohmann::json node;
  if (!data::load_json_file(path, node)) {
    log::warn(std::string("manifest unreadable, ignoring: ") + path.string());
    return std::nullopt;
  }
  std::string error;
  auto manifest = manifest_from_json(node, error);
  if (!manifest) {
    log::warn(std::string("manifest malformed, ignoring: ") + path.string() + ": " + error);
  }
  return manifest;
}

bool save_manifest(const std::filesystem::path& path, const Manifest& manifest) {
  if (!data::save_json_file(path, manifest_to_json(manifest))) {
    log::error(std::string("failed to write manifest: ") + path.string());
    return false;
  }
  return true;
}

} // namespace foundry

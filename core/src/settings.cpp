#include "foundry/settings.h"

#include "foundry/log.h"
#include "foundry/serialization.h"

#include <algorithm>

namespace foundry {

namespace {
bool load_catalog(const std::filesystem::path& servers_file, nlohmann::json& servers) {
  nlohmann::json doc;
  if (!data::load_json_file(servers_file, doc)) return false;
  if (!doc.is_object() || !doc.contains("mcpServers") || !doc["mcpServers"].is_object()) {
    log::warn("MCP catalog has no mcpServers object: " + servers_file.string());
    return false;
  }
  servers = doc["mcpServers"];
  return true;
}
} // namespace

nlohmann::json generate_settings_json(const Registry& registry,
                                      const std::vector<std::string>& hooks,
                                      const std::vector<std::string>& plugins) {
  nlohmann::json settings = nlohmann::json::object();
  if (!plugins.empty()) {
    auto& enabled = settings["enabledPlugins"];
    enabled = nlohmann::json::object();
    for (const auto& plugin : plugins) {
      enabled[plugin + "@claude-plugins-official"] = true;
    }
  }

  nlohmann::json post = nlohmann::json::array();
  for (const auto& script : hooks) {
    const auto* meta = registry.find_hook(script);
    nlohmann::json entry;
    entry["matcher"] = meta ? meta->matcher : "";
    entry["hooks"] = nlohmann::json::array();
    entry["hooks"].push_back({{"type", "command"}, {"command", ".claude/hooks/library/" + script}});
    entry["description"] = meta ? meta->description : script;
    post.push_back(entry);
  }
  if (!post.empty()) {
    settings["hooks"]["PostToolUse"] = post;
  }
  return settings;
}

std::vector<std::pair<std::string, std::string>> list_mcp_servers(const std::filesystem::path& servers_file) {
  std::vector<std::pair<std::string, std::string>> out;
  std::error_code ec;
  if (!std::filesystem::exists(servers_file, ec)) return out;
  nlohmann::json servers;
  if (!load_catalog(servers_file, servers)) return out;
  for (auto it = servers.begin(); it != servers.end(); ++it) {
    std::string desc;
    if (it.value().is_object() && it.value().contains("description") && it.value()["description"].is_string()) {
      desc = it.value()["description"].get<std::string>();
    }
    out.emplace_back(it.key(), desc);
  }
  return out;
}

bool write_mcp_servers(const std::filesystem::path& claude_json,
                       const std::filesystem::path& servers_file,
                       const std::vector<std::string>& selected,
                       std::string& error) {
  if (selected.empty()) return true;
  nlohmann::json servers;
  if (!load_catalog(servers_file, servers)) {
    error = "MCP catalog unreadable: " + servers_file.string();
    return false;
  }

  nlohmann::json doc = nlohmann::json::object();
  std::error_code ec;
  if (std::filesystem::exists(claude_json, ec)) {
    nlohmann::json existing;
    if (data::load_json_file(claude_json, existing) && existing.is_object()) {
      doc = existing;
    } else {
      log::warn("existing .claude.json unreadable, starting fresh: " + claude_json.string());
    }
  }
  if (!doc.contains("mcpServers") || !doc["mcpServers"].is_object()) {
    doc["mcpServers"] = nlohmann::json::object();
  }

  for (const auto& name : selected) {
    if (!servers.contains(name)) {
      log::warn("MCP server not in catalog: " + name);
      continue;
    }
    auto server = servers[name];
    if (server.is_object()) server.erase("description");
    doc["mcpServers"][name] = server;
  }

  if (!data::save_json_file(claude_json, doc)) {
    error = "failed to write " + claude_json.string();
    return false;
  }
  return true;
}

} // namespace foundry

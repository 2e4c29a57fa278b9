#pragma once

#include "foundry/registry.h"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace foundry {

nlohmann::json generate_settings_json(const Registry& registry,
                                      const std::vector<std::string>& hooks,
                                      const std::vector<std::string>& plugins);

// (name, description) pairs from the catalog's mcpServers object.
std::vector<std::pair<std::string, std::string>> list_mcp_servers(const std::filesystem::path& servers_file);

// Merges the selected servers into claude_json's mcpServers, dropping their
// description fields. Other keys of claude_json are preserved.
bool write_mcp_servers(const std::filesystem::path& claude_json,
                       const std::filesystem::path& servers_file,
                       const std::vector<std::string>& selected,
                       std::string& error);

} // namespace foundry

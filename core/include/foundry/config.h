#pragma once

#include <filesystem>
#include <string>

namespace foundry {

struct ToolConfig {
  std::string claude_dir = ".claude";
  std::string doc_file = "CLAUDE.md";
  std::string manifest_file = "setup-manifest.json";
  std::string repo_url = "poelsen/claude-foundry";
  std::string mcp_servers_file = "mcp-configs/mcp-servers.json";
  // Empty means ~/.claude/projects.
  std::string projects_dir;
};

ToolConfig load_tool_config(const std::filesystem::path& path);

} // namespace foundry

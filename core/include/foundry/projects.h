#pragma once

#include "foundry/config.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace foundry {

struct KnownProject {
  std::filesystem::path path;
  bool has_setup = false;
  bool has_manifest = false;
  std::string version;
};

// Session dirs are named after the project path with '/' and '_' both
// turned into '-'. Rebuilds the path by probing which joins exist under
// fs_root.
std::optional<std::filesystem::path> resolve_project_dir_name(const std::string& encoded,
                                                              const std::filesystem::path& fs_root = "/");

std::filesystem::path projects_dir_for(const ToolConfig& config);

std::vector<KnownProject> discover_projects(const std::filesystem::path& projects_dir,
                                            const ToolConfig& config,
                                            const std::filesystem::path& fs_root = "/");

} // namespace foundry

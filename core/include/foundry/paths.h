#pragma once

#include "foundry/config.h"

#include <filesystem>
#include <optional>
#include <string>

namespace foundry {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path project;
  std::filesystem::path config_file;
  std::filesystem::path logs_dir;
};

// Per-project destination paths, named by the tool config.
struct ProjectPaths {
  std::filesystem::path project;
  std::filesystem::path claude_dir;
  std::filesystem::path manifest;
  std::filesystem::path doc;
  std::filesystem::path doc_backup;
  std::filesystem::path version_file;
  std::filesystem::path settings;
  std::filesystem::path claude_json;
};

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& project_override);

ProjectPaths project_paths(const std::filesystem::path& project, const ToolConfig& config);

std::filesystem::path home_dir();

} // namespace foundry

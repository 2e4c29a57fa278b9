#pragma once

#include "foundry/registry.h"

#include <filesystem>
#include <set>
#include <string>

namespace foundry {

struct DetectedProject {
  std::set<std::string> extensions;
  // Modular rule ids proposed as defaults.
  std::set<std::string> rules;
};

// File extensions in the top three directory levels, skipping dot dirs and node_modules.
std::set<std::string> scan_extensions(const std::filesystem::path& project);

// Proposes modular rules whose detection metadata matches the project.
DetectedProject detect_project(const std::filesystem::path& project, const Registry& registry);

} // namespace foundry

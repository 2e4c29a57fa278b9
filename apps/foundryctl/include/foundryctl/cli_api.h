#pragma once

#include <filesystem>
#include <optional>
#include <string>

struct InitCliOptions {
  bool interactive = true;
  bool force = false;
};

struct PrivateAddOptions {
  std::filesystem::path source_dir;
  std::string prefix;
  bool interactive = true;
};

int cmd_version(const char* argv0);
int cmd_init(const char* argv0,
             const std::optional<std::filesystem::path>& project_override,
             const InitCliOptions& opts);
int cmd_update_all(const char* argv0, bool force);
int cmd_migrate(const char* argv0, const std::optional<std::filesystem::path>& project_override, bool dry_run);

int cmd_private_add(const char* argv0,
                    const std::optional<std::filesystem::path>& project_override,
                    const PrivateAddOptions& opts);
int cmd_private_list(const char* argv0, const std::optional<std::filesystem::path>& project_override);
int cmd_private_remove(const char* argv0,
                       const std::optional<std::filesystem::path>& project_override,
                       const std::string& prefix);

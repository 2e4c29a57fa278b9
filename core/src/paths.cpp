#include "foundry/paths.h"

#include "foundry/log.h"

#include <cstdlib>

#if defined(__linux__)
#include <unistd.h>
#endif

namespace foundry {

namespace {
std::filesystem::path executable_dir(const char* argv0) {
#if defined(__linux__)
  char buffer[4096];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len > 0) {
    buffer[len] = '\0';
    return std::filesystem::path(buffer).parent_path();
  }
#endif
  if (argv0) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(argv0, ec);
    if (!ec) return abs.parent_path();
  }
  return std::filesystem::current_path();
}

bool looks_like_content_root(const std::filesystem::path& dir) {
  std::error_code ec;
  return std::filesystem::is_directory(dir / "rules", ec) &&
         std::filesystem::is_directory(dir / "rule-library", ec);
}

std::filesystem::path find_root_from(const std::filesystem::path& start) {
  std::filesystem::path cur = start;
  for (int i = 0; i < 6; ++i) {
    if (looks_like_content_root(cur)) {
      return cur;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return start;
}

std::filesystem::path resolve_project_path(const std::optional<std::filesystem::path>& override) {
  if (override.has_value()) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(override.value(), ec);
    return ec ? override.value() : abs.lexically_normal();
  }
  if (const char* env = std::getenv("FOUNDRY_PROJECT")) {
    return std::filesystem::path(env);
  }
  return std::filesystem::current_path();
}
} // namespace

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& project_override) {
  ResolvedPaths out;
  if (const char* env_root = std::getenv("FOUNDRY_ROOT")) {
    out.root = std::filesystem::path(env_root);
  } else {
    out.root = find_root_from(executable_dir(argv0));
  }

  out.project = resolve_project_path(project_override);
  out.logs_dir = out.root / "build" / "logs";
  out.config_file = out.root / "config" / "foundry.yaml";
  std::error_code ec;
  if (!std::filesystem::exists(out.config_file, ec)) {
    const auto json_config = out.root / "config" / "foundry.json";
    if (std::filesystem::exists(json_config, ec)) {
      out.config_file = json_config;
    }
  }

  if (!looks_like_content_root(out.root)) {
    log::warn(std::string("content root not found, using: ") + out.root.string());
  }
  return out;
}

ProjectPaths project_paths(const std::filesystem::path& project, const ToolConfig& config) {
  ProjectPaths out;
  out.project = project;
  out.claude_dir = project / config.claude_dir;
  out.manifest = out.claude_dir / config.manifest_file;
  out.doc = project / config.doc_file;
  out.doc_backup = project / (config.doc_file + ".old");
  out.version_file = out.claude_dir / "VERSION";
  out.settings = out.claude_dir / "settings.json";
  out.claude_json = project / ".claude.json";
  return out;
}

std::filesystem::path home_dir() {
  if (const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home);
  }
  return std::filesystem::current_path();
}

} // namespace foundry

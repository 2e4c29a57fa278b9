#include "foundry/projects.h"

#include "foundry/manifest.h"
#include "foundry/paths.h"
#include "foundry/serialization.h"

#include <algorithm>
#include <sstream>
#include <system_error>

namespace foundry {
namespace fs = std::filesystem;

namespace {
bool is_dir(const fs::path& path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

std::string join(const std::vector<std::string>& parts, size_t begin, size_t end, char sep) {
  std::string out;
  for (size_t i = begin; i < end; ++i) {
    if (i > begin) out += sep;
    out += parts[i];
  }
  return out;
}

std::optional<fs::path> find_path(const fs::path& base, const std::vector<std::string>& parts, size_t pos) {
  if (pos == parts.size()) {
    return is_dir(base) ? std::optional<fs::path>(base) : std::nullopt;
  }
  for (size_t take = 1; pos + take <= parts.size(); ++take) {
    const auto underscored = base / join(parts, pos, pos + take, '_');
    if (is_dir(underscored)) {
      if (auto found = find_path(underscored, parts, pos + take)) return found;
    }
    if (take > 1) {
      const auto hyphenated = base / join(parts, pos, pos + take, '-');
      if (is_dir(hyphenated)) {
        if (auto found = find_path(hyphenated, parts, pos + take)) return found;
      }
    }
  }
  return std::nullopt;
}

std::string trimmed(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}
} // namespace

std::optional<fs::path> resolve_project_dir_name(const std::string& encoded, const fs::path& fs_root) {
  const auto start = encoded.find_first_not_of('-');
  if (start == std::string::npos) return std::nullopt;
  std::vector<std::string> parts;
  std::stringstream ss(encoded.substr(start));
  std::string part;
  while (std::getline(ss, part, '-')) parts.push_back(part);
  if (parts.size() < 2) return std::nullopt;
  // The first two components (e.g. home/<user>) are taken literally.
  const auto base = fs_root / parts[0] / parts[1];
  return find_path(base, parts, 2);
}

fs::path projects_dir_for(const ToolConfig& config) {
  if (!config.projects_dir.empty()) return fs::path(config.projects_dir);
  return home_dir() / ".claude" / "projects";
}

std::vector<KnownProject> discover_projects(const fs::path& projects_dir,
                                            const ToolConfig& config,
                                            const fs::path& fs_root) {
  std::vector<KnownProject> out;
  if (!is_dir(projects_dir)) return out;

  std::vector<std::string> names;
  std::error_code ec;
  for (auto it = fs::directory_iterator(projects_dir, ec); it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (it->is_directory(type_ec)) names.push_back(it->path().filename().string());
  }
  std::sort(names.begin(), names.end());

  for (const auto& name : names) {
    const auto resolved = resolve_project_dir_name(name, fs_root);
    if (!resolved) continue;
    if (std::any_of(out.begin(), out.end(), [&](const KnownProject& p) { return p.path == *resolved; })) continue;
    const auto paths = project_paths(*resolved, config);
    KnownProject project;
    project.path = *resolved;
    std::string version;
    project.has_setup = data::read_text_file(paths.version_file, version);
    project.version = trimmed(version);
    project.has_manifest = load_manifest(paths.manifest).has_value();
    out.push_back(project);
  }
  return out;
}

} // namespace foundry

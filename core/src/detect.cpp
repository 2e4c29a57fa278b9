#include "foundry/detect.h"

#include "foundry/serialization.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace foundry {
namespace fs = std::filesystem;

namespace {
constexpr int kScanDepth = 3;

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string read_dep_files(const fs::path& project) {
  std::string text;
  for (const char* name : {"package.json", "pyproject.toml", "requirements.txt"}) {
    std::string contents;
    if (data::read_text_file(project / name, contents)) {
      text += contents;
    }
  }
  return to_lower(text);
}
} // namespace

std::set<std::string> scan_extensions(const fs::path& project) {
  std::set<std::string> exts;
  std::error_code ec;
  auto it = fs::recursive_directory_iterator(project, fs::directory_options::skip_permission_denied, ec);
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const auto name = it->path().filename().string();
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      if (name.empty() || name[0] == '.' || name == "node_modules" || it.depth() + 1 >= kScanDepth) {
        it.disable_recursion_pending();
      }
      continue;
    }
    const auto ext = it->path().extension().string();
    if (!ext.empty()) exts.insert(ext);
  }
  return exts;
}

DetectedProject detect_project(const fs::path& project, const Registry& registry) {
  DetectedProject out;
  out.extensions = scan_extensions(project);
  const auto dep_text = read_dep_files(project);

  for (const auto& category : registry.modular) {
    for (const auto& rule : category.rules) {
      const auto& meta = rule.detect;
      if (meta.manual) continue;
      bool hit = false;
      for (const auto& ext : meta.extensions) {
        if (out.extensions.count(ext) > 0) hit = true;
      }
      std::error_code ec;
      for (const auto& cfg : meta.config_files) {
        if (fs::exists(project / cfg, ec)) hit = true;
      }
      for (const auto& dir : meta.detect_dirs) {
        if (fs::is_directory(project / dir, ec)) hit = true;
      }
      for (const auto& kw : meta.dep_keywords) {
        if (dep_text.find(to_lower(kw)) != std::string::npos) hit = true;
      }
      if (hit) out.rules.insert(rule.id);
    }
  }
  return out;
}

} // namespace foundry

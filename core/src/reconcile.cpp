#include "foundry/reconcile.h"

#include "foundry/log.h"
#include "foundry/serialization.h"

#include <algorithm>
#include <map>
#include <set>
#include <system_error>

namespace foundry {
namespace fs = std::filesystem;

namespace {
constexpr fs::perms kExecBits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

bool files_identical(const fs::path& a, const fs::path& b) {
  std::error_code ec;
  if (!fs::is_regular_file(a, ec) || !fs::is_regular_file(b, ec)) return false;
  const auto size_a = fs::file_size(a, ec);
  if (ec) return false;
  const auto size_b = fs::file_size(b, ec);
  if (ec || size_a != size_b) return false;
  std::string text_a;
  std::string text_b;
  if (!data::read_text_file(a, text_a) || !data::read_text_file(b, text_b)) return false;
  return text_a == text_b;
}

bool list_tree(const fs::path& root, std::set<std::string>& files, std::set<std::string>& dirs) {
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(root, ec); it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    if (ec) return false;
    const auto rel = it->path().lexically_relative(root).generic_string();
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      dirs.insert(rel);
    } else {
      files.insert(rel);
    }
  }
  return !ec;
}

bool trees_identical(const fs::path& src, const fs::path& dst) {
  std::error_code ec;
  if (!fs::is_directory(dst, ec)) return false;
  std::set<std::string> src_files, src_dirs, dst_files, dst_dirs;
  if (!list_tree(src, src_files, src_dirs) || !list_tree(dst, dst_files, dst_dirs)) return false;
  if (src_files != dst_files || src_dirs != dst_dirs) return false;
  for (const auto& rel : src_files) {
    if (!files_identical(src / rel, dst / rel)) return false;
  }
  return true;
}

bool copy_tree(const fs::path& src, const fs::path& dst, std::string& error) {
  std::error_code ec;
  fs::create_directories(dst, ec);
  if (ec) {
    error = "create " + dst.string() + ": " + ec.message();
    return false;
  }
  for (auto it = fs::recursive_directory_iterator(src, ec); it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    if (ec) break;
    const auto out = dst / it->path().lexically_relative(src);
    std::error_code item_ec;
    if (it->is_directory(item_ec)) {
      fs::create_directories(out, item_ec);
    } else if (it->is_regular_file(item_ec)) {
      fs::copy_file(it->path(), out, fs::copy_options::overwrite_existing, item_ec);
    }
    if (item_ec) {
      error = "copy " + it->path().string() + ": " + item_ec.message();
      return false;
    }
  }
  if (ec) {
    error = "walk " + src.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool has_exec_bits(const fs::path& path) {
  std::error_code ec;
  const auto st = fs::status(path, ec);
  if (ec) return false;
  return (st.permissions() & kExecBits) == kExecBits;
}

fs::path temp_sibling(const fs::path& dest) {
  return dest.parent_path() / ("." + dest.filename().string() + ".foundry-tmp");
}

bool move_into_place(const fs::path& tmp, const fs::path& dest, std::string& error) {
  std::error_code ec;
  const bool dest_is_dir = fs::is_directory(dest, ec);
  if (dest_is_dir || fs::is_directory(tmp, ec)) {
    // rename() cannot replace a non-empty directory.
    fs::remove_all(dest, ec);
    if (ec) {
      error = "remove " + dest.string() + ": " + ec.message();
      fs::remove_all(tmp, ec);
      return false;
    }
  }
  fs::rename(tmp, dest, ec);
  if (ec) {
    error = "rename " + tmp.string() + " -> " + dest.string() + ": " + ec.message();
    std::error_code cleanup_ec;
    fs::remove_all(tmp, cleanup_ec);
    return false;
  }
  return true;
}

std::string basename_of(const std::string& id) {
  return fs::path(id).filename().string();
}
} // namespace

void DeploymentReport::merge(const DeploymentReport& other) {
  deployed.insert(deployed.end(), other.deployed.begin(), other.deployed.end());
  written.insert(written.end(), other.written.begin(), other.written.end());
  removed.insert(removed.end(), other.removed.begin(), other.removed.end());
  warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
  errors.insert(errors.end(), other.errors.begin(), other.errors.end());
}

size_t DeploymentReport::skipped_protected() const {
  return static_cast<size_t>(std::count_if(warnings.begin(), warnings.end(), [](const DeploymentIssue& issue) {
    return issue.kind == IssueKind::SkippedProtected;
  }));
}

CopyOutcome copy_item(const ContentItem& item, const fs::path& dest, std::string& error) {
  std::error_code ec;
  const bool want_dir = item.shape == ItemShape::Directory;
  const bool source_ok = want_dir ? fs::is_directory(item.source, ec) : fs::is_regular_file(item.source, ec);
  if (!source_ok) {
    error = "source not found: " + item.source.string();
    return CopyOutcome::MissingSource;
  }

  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    error = "create " + dest.parent_path().string() + ": " + ec.message();
    return CopyOutcome::Failed;
  }

  if (want_dir) {
    if (trees_identical(item.source, dest)) {
      return CopyOutcome::Unchanged;
    }
  } else if (files_identical(item.source, dest)) {
    if (!item.executable || has_exec_bits(dest)) {
      return CopyOutcome::Unchanged;
    }
    fs::permissions(dest, kExecBits, fs::perm_options::add, ec);
    if (ec) {
      error = "chmod " + dest.string() + ": " + ec.message();
      return CopyOutcome::Failed;
    }
    return CopyOutcome::Copied;
  }

  const auto tmp = temp_sibling(dest);
  fs::remove_all(tmp, ec);
  if (want_dir) {
    if (!copy_tree(item.source, tmp, error)) {
      std::error_code cleanup_ec;
      fs::remove_all(tmp, cleanup_ec);
      return CopyOutcome::Failed;
    }
  } else {
    fs::copy_file(item.source, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      error = "copy " + item.source.string() + ": " + ec.message();
      std::error_code cleanup_ec;
      fs::remove(tmp, cleanup_ec);
      return CopyOutcome::Failed;
    }
    if (item.executable) {
      fs::permissions(tmp, kExecBits, fs::perm_options::add, ec);
      if (ec) {
        error = "chmod " + tmp.string() + ": " + ec.message();
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        return CopyOutcome::Failed;
      }
    }
  }
  if (!move_into_place(tmp, dest, error)) {
    return CopyOutcome::Failed;
  }
  return CopyOutcome::Copied;
}

std::vector<std::string> destination_names(const std::vector<ContentItem>& items, const std::string& prefix) {
  std::vector<std::string> names(items.size());
  if (!prefix.empty()) {
    for (size_t i = 0; i < items.size(); ++i) {
      names[i] = prefix + "-" + basename_of(items[i].identifier);
    }
    return names;
  }

  // Base (ungrouped) items claim their bare names before any group does.
  std::map<std::string, std::string> claimed;
  for (size_t i = 0; i < items.size(); ++i) {
    if (items[i].group.empty()) {
      names[i] = items[i].identifier;
      claimed.emplace(items[i].identifier, std::string());
    }
  }
  for (size_t i = 0; i < items.size(); ++i) {
    const auto& item = items[i];
    if (item.group.empty()) continue;
    const auto it = claimed.find(item.identifier);
    if (it != claimed.end() && it->second != item.group) {
      names[i] = item.group + "-" + item.identifier;
    } else {
      names[i] = item.identifier;
      claimed.emplace(item.identifier, item.group);
    }
  }
  return names;
}

DeploymentReport reconcile(Category category,
                           const std::vector<ContentItem>& desired,
                           const OwnershipPolicy& policy,
                           const fs::path& category_dir,
                           const std::string& prefix) {
  DeploymentReport report;
  const auto names = destination_names(desired, prefix);
  std::set<std::string> wanted(names.begin(), names.end());

  std::error_code ec;
  if (!desired.empty()) {
    fs::create_directories(category_dir, ec);
    if (ec) {
      report.errors.push_back({IssueKind::WriteError, category_dir.string(), ec.message()});
      return report;
    }
  }

  std::set<std::string> placed;
  for (size_t i = 0; i < desired.size(); ++i) {
    const auto& name = names[i];
    if (!placed.insert(name).second) {
      report.warnings.push_back({IssueKind::Conflict, name, desired[i].identifier + " maps to an already deployed name"});
      continue;
    }
    std::string error;
    switch (copy_item(desired[i], category_dir / name, error)) {
      case CopyOutcome::Copied:
        report.deployed.push_back(name);
        report.written.push_back(name);
        break;
      case CopyOutcome::Unchanged:
        report.deployed.push_back(name);
        break;
      case CopyOutcome::MissingSource:
        report.warnings.push_back({IssueKind::SkippedMissingSource, name, error});
        break;
      case CopyOutcome::Failed:
        report.errors.push_back({IssueKind::WriteError, name, error});
        break;
    }
  }

  if (!fs::is_directory(category_dir, ec)) {
    return report;
  }

  std::vector<std::pair<std::string, bool>> existing;
  for (auto it = fs::directory_iterator(category_dir, ec); it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    existing.emplace_back(it->path().filename().string(), it->is_directory(type_ec));
  }
  if (ec) {
    report.errors.push_back({IssueKind::WriteError, category_dir.string(), "list: " + ec.message()});
    return report;
  }
  std::sort(existing.begin(), existing.end());

  for (const auto& [name, is_dir] : existing) {
    if (wanted.count(name) > 0) continue;
    const auto cls = classify_entry(category, name, is_dir, policy);
    const bool eligible = prefix.empty() ? cls.kind == Ownership::ManagedUnowned
                                         : (cls.kind == Ownership::PrivateOwned && cls.prefix == prefix);
    if (!eligible) {
      // Entries outside a private pass's namespace are not its concern.
      if (prefix.empty()) {
        report.warnings.push_back({IssueKind::SkippedProtected, name, ownership_name(cls.kind)});
      }
      continue;
    }
    std::error_code rm_ec;
    fs::remove_all(category_dir / name, rm_ec);
    if (rm_ec) {
      report.errors.push_back({IssueKind::WriteError, name, "remove: " + rm_ec.message()});
    } else {
      report.removed.push_back(name);
    }
  }
  return report;
}

void log_report(const std::string& label, const DeploymentReport& report) {
  log::info(label + ": " + std::to_string(report.deployed.size()) + " deployed, " +
            std::to_string(report.written.size()) + " written, " + std::to_string(report.removed.size()) +
            " removed");
  for (const auto& issue : report.warnings) {
    if (issue.kind == IssueKind::SkippedMissingSource) {
      log::warn(label + ": skipped " + issue.name + " (" + issue.message + ")");
    } else if (issue.kind == IssueKind::Conflict) {
      log::warn(label + ": conflict " + issue.name + " (" + issue.message + ")");
    }
  }
  for (const auto& issue : report.errors) {
    log::error(label + ": " + issue.name + ": " + issue.message);
  }
}

} // namespace foundry

#pragma once

#include "foundry/ownership.h"
#include "foundry/registry.h"

#include <filesystem>
#include <string>
#include <vector>

namespace foundry {

enum class IssueKind {
  SkippedMissingSource,
  SkippedProtected,
  Conflict,
  WriteError
};

struct DeploymentIssue {
  IssueKind kind = IssueKind::WriteError;
  std::string name;
  std::string message;
};

struct DeploymentReport {
  // Destination names present for the selection after the pass.
  std::vector<std::string> deployed;
  // Subset of deployed that was actually (re)written.
  std::vector<std::string> written;
  std::vector<std::string> removed;
  std::vector<DeploymentIssue> warnings;
  std::vector<DeploymentIssue> errors;

  bool ok() const { return errors.empty(); }
  void merge(const DeploymentReport& other);
  size_t skipped_protected() const;
};

enum class CopyOutcome {
  Copied,
  Unchanged,
  MissingSource,
  Failed
};

// Copies one item to dest via a sibling temp name and rename. Identical
// content is left untouched.
CopyOutcome copy_item(const ContentItem& item, const std::filesystem::path& dest, std::string& error);

// Destination names for items in order. Private items (prefix set) become
// "<prefix>-<basename>"; a modular rule whose bare name is already claimed
// by another group in the same pass becomes "<group>-<id>".
std::vector<std::string> destination_names(const std::vector<ContentItem>& items, const std::string& prefix);

// Brings category_dir to exactly the desired items, removing stale entries
// the policy allows. With a prefix, only that prefix's entries are eligible
// for removal; without one, only ManagedUnowned entries are.
DeploymentReport reconcile(Category category,
                           const std::vector<ContentItem>& desired,
                           const OwnershipPolicy& policy,
                           const std::filesystem::path& category_dir,
                           const std::string& prefix = std::string());

void log_report(const std::string& label, const DeploymentReport& report);

} // namespace foundry

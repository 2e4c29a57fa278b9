#pragma once

#include "foundry/registry.h"

#include <set>
#include <string>
#include <vector>

namespace foundry {

enum class Ownership {
  Protected,
  PrivateOwned,
  ManagedUnowned
};

struct EntryClass {
  Ownership kind = Ownership::Protected;
  // Owning prefix for PrivateOwned entries.
  std::string prefix;
};

struct OwnershipPolicy {
  std::set<std::string> protected_names;
  std::vector<std::string> private_prefixes;
};

OwnershipPolicy make_ownership_policy(const Registry& registry, const std::vector<std::string>& prefixes);

// True when an entry of this name/shape belongs to the managed namespace of
// the category (*.md files, *.sh hooks, skill directories).
bool is_managed_shape(Category category, const std::string& name, bool is_directory);

// Longest registered prefix p with name starting "p-", or empty.
std::string owning_prefix(const std::string& name, const std::vector<std::string>& prefixes);

EntryClass classify_entry(Category category,
                          const std::string& name,
                          bool is_directory,
                          const OwnershipPolicy& policy);

const char* ownership_name(Ownership kind);

} // namespace foundry

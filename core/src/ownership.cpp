#include "foundry/ownership.h"

namespace foundry {

namespace {
bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

OwnershipPolicy make_ownership_policy(const Registry& registry, const std::vector<std::string>& prefixes) {
  OwnershipPolicy policy;
  policy.protected_names.insert(registry.protected_skill_dirs.begin(), registry.protected_skill_dirs.end());
  policy.private_prefixes = prefixes;
  return policy;
}

bool is_managed_shape(Category category, const std::string& name, bool is_directory) {
  switch (category) {
    case Category::Skills:
      return is_directory;
    case Category::Hooks:
      return !is_directory && ends_with(name, ".sh");
    case Category::Rules:
    case Category::Agents:
    case Category::Commands:
      return !is_directory && ends_with(name, ".md");
  }
  return false;
}

std::string owning_prefix(const std::string& name, const std::vector<std::string>& prefixes) {
  std::string best;
  for (const auto& prefix : prefixes) {
    if (prefix.empty() || prefix.size() <= best.size()) continue;
    if (name.size() > prefix.size() + 1 && name.compare(0, prefix.size(), prefix) == 0 &&
        name[prefix.size()] == '-') {
      best = prefix;
    }
  }
  return best;
}

EntryClass classify_entry(Category category,
                          const std::string& name,
                          bool is_directory,
                          const OwnershipPolicy& policy) {
  EntryClass out;
  if (name.empty() || name[0] == '.' || policy.protected_names.count(name) > 0) {
    out.kind = Ownership::Protected;
    return out;
  }
  auto prefix = owning_prefix(name, policy.private_prefixes);
  if (!prefix.empty()) {
    out.kind = Ownership::PrivateOwned;
    out.prefix = std::move(prefix);
    return out;
  }
  out.kind = is_managed_shape(category, name, is_directory) ? Ownership::ManagedUnowned : Ownership::Protected;
  return out;
}

const char* ownership_name(Ownership kind) {
  switch (kind) {
    case Ownership::Protected: return "protected";
    case Ownership::PrivateOwned: return "private";
    case Ownership::ManagedUnowned: return "managed";
  }
  return "protected";
}

} // namespace foundry

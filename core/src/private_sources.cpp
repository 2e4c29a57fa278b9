#include "foundry/private_sources.h"

#include "foundry/log.h"

#include <algorithm>
#include <system_error>

namespace foundry {
namespace fs = std::filesystem;

namespace {
bool is_valid_prefix_syntax(const std::string& candidate) {
  if (candidate.empty()) return false;
  if (candidate[0] < 'a' || candidate[0] > 'z') return false;
  for (const char c : candidate) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!ok) return false;
  }
  return true;
}

std::vector<fs::directory_entry> sorted_entries(const fs::path& dir) {
  std::vector<fs::directory_entry> out;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;
  for (auto it = fs::directory_iterator(dir, ec); it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const auto name = it->path().filename().string();
    if (name.empty() || name[0] == '.') continue;
    out.push_back(*it);
  }
  std::sort(out.begin(), out.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
    return a.path().filename() < b.path().filename();
  });
  return out;
}

std::vector<std::string> md_files(const fs::path& dir) {
  std::vector<std::string> out;
  for (const auto& entry : sorted_entries(dir)) {
    std::error_code ec;
    if (entry.is_regular_file(ec) && entry.path().extension() == ".md") {
      out.push_back(entry.path().filename().string());
    }
  }
  return out;
}

std::vector<std::string> with_prefix(std::vector<std::string> prefixes, const std::string& prefix) {
  if (std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end()) {
    prefixes.push_back(prefix);
  }
  return prefixes;
}
} // namespace

bool DiscoveredContent::empty() const {
  return rules.empty() && commands.empty() && skills.empty() && agents.empty() && hooks.empty();
}

const std::vector<std::string>& DiscoveredContent::list(Category category) const {
  switch (category) {
    case Category::Rules: return rules;
    case Category::Agents: return agents;
    case Category::Commands: return commands;
    case Category::Skills: return skills;
    case Category::Hooks: return hooks;
  }
  return rules;
}

std::optional<std::string> validate_prefix(const std::string& candidate,
                                           const std::vector<std::string>& existing,
                                           const Registry& registry,
                                           const std::vector<std::string>& catalog_names) {
  if (!is_valid_prefix_syntax(candidate)) {
    return "prefix '" + candidate +
           "' must start with a lowercase letter and contain only lowercase letters, digits and hyphens";
  }
  if (registry.reserved_words().count(candidate) > 0) {
    return "prefix '" + candidate + "' conflicts with reserved name";
  }
  const auto head = candidate + "-";
  const bool claimed_on_disk = std::any_of(catalog_names.begin(), catalog_names.end(), [&](const std::string& name) {
    return name.rfind(head, 0) == 0;
  });
  if (registry.claims_prefix(candidate) || claimed_on_disk) {
    return "prefix '" + candidate + "' conflicts with catalog entries named '" + head + "*'";
  }
  if (std::find(existing.begin(), existing.end(), candidate) != existing.end()) {
    return "prefix '" + candidate + "' is already registered";
  }
  return std::nullopt;
}

DiscoveredContent discover_private_content(const fs::path& source_dir) {
  DiscoveredContent out;

  for (const auto& topic : sorted_entries(source_dir / "rule-library")) {
    std::error_code ec;
    if (!topic.is_directory(ec)) continue;
    const auto topic_name = topic.path().filename().string();
    for (const auto& file : md_files(topic.path())) {
      out.rules.push_back(topic_name + "/" + file);
    }
  }

  out.commands = md_files(source_dir / "commands");
  out.agents = md_files(source_dir / "agents");

  for (const auto& skill : sorted_entries(source_dir / "skills")) {
    std::error_code ec;
    if (skill.is_directory(ec) && fs::is_regular_file(skill.path() / "SKILL.md", ec)) {
      out.skills.push_back(skill.path().filename().string());
    }
  }

  for (const auto& hook : sorted_entries(source_dir / "hooks" / "library")) {
    std::error_code ec;
    if (hook.is_regular_file(ec)) {
      out.hooks.push_back(hook.path().filename().string());
    }
  }
  return out;
}

ContentItem private_item(const fs::path& source_dir, Category category, const std::string& id) {
  ContentItem item;
  item.category = category;
  item.identifier = id;
  item.shape = category_shape(category);
  switch (category) {
    case Category::Rules:
      item.source = source_dir / "rule-library" / id;
      break;
    case Category::Agents:
      item.source = source_dir / "agents" / id;
      break;
    case Category::Commands:
      item.source = source_dir / "commands" / id;
      break;
    case Category::Skills:
      item.source = source_dir / "skills" / id;
      break;
    case Category::Hooks:
      item.source = source_dir / "hooks" / "library" / id;
      item.executable = true;
      break;
  }
  return item;
}

DeploymentReport deploy_private_source(const fs::path& claude_dir,
                                       const PrivateSourceRef& ref,
                                       const Registry& registry,
                                       const std::vector<std::string>& all_prefixes) {
  DeploymentReport report;
  const auto policy = make_ownership_policy(registry, with_prefix(all_prefixes, ref.prefix));
  const fs::path source_dir(ref.path);
  for (const auto category : all_categories()) {
    std::vector<ContentItem> items;
    for (const auto& id : ref.selections(category)) {
      items.push_back(private_item(source_dir, category, id));
    }
    report.merge(reconcile(category, items, policy, claude_dir / category_subdir(category), ref.prefix));
  }
  return report;
}

DeploymentReport clean_private_files(const fs::path& claude_dir,
                                     const std::string& prefix,
                                     const Registry& registry,
                                     const std::vector<std::string>& all_prefixes) {
  const auto policy = make_ownership_policy(registry, with_prefix(all_prefixes, prefix));
  DeploymentReport report;
  for (const auto category : all_categories()) {
    const auto dir = claude_dir / category_subdir(category);
    for (const auto& entry : sorted_entries(dir)) {
      const auto name = entry.path().filename().string();
      std::error_code ec;
      const auto cls = classify_entry(category, name, entry.is_directory(ec), policy);
      if (cls.kind != Ownership::PrivateOwned || cls.prefix != prefix) continue;
      fs::remove_all(entry.path(), ec);
      if (ec) {
        report.errors.push_back({IssueKind::WriteError, name, "remove: " + ec.message()});
      } else {
        report.removed.push_back(name);
      }
    }
  }
  return report;
}

std::map<std::string, DeploymentReport> redeploy_private_sources(const fs::path& claude_dir,
                                                                 const std::vector<PrivateSourceRef>& sources,
                                                                 const Registry& registry) {
  std::map<std::string, DeploymentReport> out;
  std::vector<std::string> prefixes;
  for (const auto& ref : sources) prefixes.push_back(ref.prefix);

  for (const auto& ref : sources) {
    std::error_code ec;
    if (!fs::is_directory(ref.path, ec)) {
      log::warn("private source '" + ref.prefix + "' not reachable, keeping registration: " + ref.path);
      out[ref.prefix] = DeploymentReport{};
      continue;
    }
    auto report = clean_private_files(claude_dir, ref.prefix, registry, prefixes);
    report.merge(deploy_private_source(claude_dir, ref, registry, prefixes));
    out[ref.prefix] = std::move(report);
  }
  return out;
}

std::map<Category, std::vector<std::string>> list_private_files(const fs::path& claude_dir,
                                                                const std::string& prefix,
                                                                const Registry& registry,
                                                                const std::vector<std::string>& all_prefixes) {
  const auto policy = make_ownership_policy(registry, with_prefix(all_prefixes, prefix));
  std::map<Category, std::vector<std::string>> out;
  for (const auto category : all_categories()) {
    for (const auto& entry : sorted_entries(claude_dir / category_subdir(category))) {
      const auto name = entry.path().filename().string();
      std::error_code ec;
      const auto cls = classify_entry(category, name, entry.is_directory(ec), policy);
      if (cls.kind == Ownership::PrivateOwned && cls.prefix == prefix) {
        out[category].push_back(name);
      }
    }
  }
  return out;
}

bool register_private_source(Manifest& manifest, const PrivateSourceRef& ref, std::string& error) {
  if (manifest.find_private(ref.prefix)) {
    error = "prefix '" + ref.prefix + "' is already registered";
    return false;
  }
  manifest.private_sources.push_back(ref);
  return true;
}

bool unregister_private_source(Manifest& manifest, const std::string& prefix) {
  auto& sources = manifest.private_sources;
  const auto before = sources.size();
  sources.erase(std::remove_if(sources.begin(), sources.end(),
                               [&](const PrivateSourceRef& ref) { return ref.prefix == prefix; }),
                sources.end());
  return sources.size() != before;
}

} // namespace foundry

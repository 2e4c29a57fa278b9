#include "foundry/migration.h"

#include <algorithm>

namespace foundry {

namespace {
void insert_unique(std::vector<std::string>& list, const std::string& id) {
  if (std::find(list.begin(), list.end(), id) == list.end()) {
    list.push_back(id);
  }
}

bool category_touched(const std::string& category,
                      const std::vector<std::string>& ids,
                      const MigrationTable& table) {
  if (table.is_old_category(category)) return true;
  for (const auto& id : ids) {
    if (table.find(category, id)) return true;
  }
  return false;
}
} // namespace

ModularSelection migrate_modular_rules(const ModularSelection& modular, const MigrationTable& table) {
  ModularSelection out;

  // Untouched categories carry over verbatim first so that later unions
  // append after their existing order.
  for (const auto& [category, ids] : modular) {
    if (!category_touched(category, ids, table)) {
      out[category] = ids;
    }
  }

  for (const auto& [category, ids] : modular) {
    if (!category_touched(category, ids, table)) continue;
    const bool old_key = table.is_old_category(category);
    if (!old_key) {
      out[category];
    }
    for (const auto& id : ids) {
      if (const auto* entry = table.find(category, id)) {
        if (!entry->drop) {
          insert_unique(out[entry->new_category], entry->new_id);
        }
        continue;
      }
      if (!old_key) {
        insert_unique(out[category], id);
      }
    }
  }
  return out;
}

bool needs_migration(const Manifest& manifest, const MigrationTable& table) {
  if (manifest.schema_version < table.revision) return true;
  for (const auto& [category, ids] : manifest.modular_rules) {
    if (category_touched(category, ids, table)) return true;
  }
  return false;
}

Manifest migrate_manifest(const Manifest& manifest, const MigrationTable& table) {
  Manifest out = manifest;
  out.modular_rules = migrate_modular_rules(manifest.modular_rules, table);
  out.schema_version = std::max(manifest.schema_version, table.revision);
  return out;
}

} // namespace foundry

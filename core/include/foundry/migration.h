#pragma once

#include "foundry/manifest.h"
#include "foundry/registry.h"

namespace foundry {

// Rewrites old-schema modular selections through the table. Pure and
// idempotent; old-schema category keys never survive.
ModularSelection migrate_modular_rules(const ModularSelection& modular, const MigrationTable& table);

bool needs_migration(const Manifest& manifest, const MigrationTable& table);

Manifest migrate_manifest(const Manifest& manifest, const MigrationTable& table);

} // namespace foundry

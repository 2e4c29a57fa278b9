#pragma once

#include "foundry/registry.h"

#include <set>
#include <string>
#include <vector>

namespace foundry {

static constexpr const char* kMarkerStart = "<!-- claude-foundry -->";
static constexpr const char* kMarkerEnd = "<!-- /claude-foundry -->";

bool has_block(const std::string& text);

// Generated block, markers included, ending in a newline. Output depends
// only on the sets of rules and languages, not their order.
std::string render_header(const Registry& registry,
                          const std::vector<std::string>& deployed_rules,
                          const std::set<std::string>& selected_langs);

// Replaces the first marker span. Returns existing unchanged when either
// marker is missing.
std::string splice_update(const std::string& existing, const std::string& block);
std::string splice_prepend(const std::string& existing, const std::string& block);
std::string render_document(const std::string& project_name, const std::string& block);

// "data-pipeline.md" -> "Data Pipeline"
std::string title_from_id(const std::string& id);

} // namespace foundry

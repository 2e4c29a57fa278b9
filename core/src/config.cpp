#include "foundry/config.h"

#include "foundry/log.h"
#include "foundry/serialization.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>

namespace foundry {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::string claude_dir;
  std::string doc_file;
  std::string manifest_file;
  std::string repo_url;
  std::string mcp_servers_file;
  std::string projects_dir;
};

void apply_fields(ToolConfig& cfg, const ConfigFields& f) {
  if (!f.claude_dir.empty()) cfg.claude_dir = f.claude_dir;
  if (!f.doc_file.empty()) cfg.doc_file = f.doc_file;
  if (!f.manifest_file.empty()) cfg.manifest_file = f.manifest_file;
  if (!f.repo_url.empty()) cfg.repo_url = f.repo_url;
  if (!f.mcp_servers_file.empty()) cfg.mcp_servers_file = f.mcp_servers_file;
  if (!f.projects_dir.empty()) cfg.projects_dir = f.projects_dir;
}

bool read_json_fields(const std::filesystem::path& path, ConfigFields& f) {
  std::ifstream in(path);
  if (!in) return false;
  const auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;
  const auto& root = (j.contains("foundry") && j["foundry"].is_object()) ? j["foundry"] : j;

  try {
    f.claude_dir = root.value("claude_dir", "");
    f.doc_file = root.value("doc_file", "");
    f.manifest_file = root.value("manifest_file", "");
    f.repo_url = root.value("repo_url", "");
    f.mcp_servers_file = root.value("mcp_servers_file", "");
    f.projects_dir = root.value("projects_dir", "");
  } catch (const nlohmann::json::exception& e) {
    log::warn(std::string("JSON config field has wrong type: ") + e.what());
    return false;
  }
  return true;
}

bool read_yaml_fields(const std::filesystem::path& path, ConfigFields& f) {
  YAML::Node doc;
  if (!data::load_yaml_file(path, doc)) return false;
  try {
    YAML::Node root = doc["foundry"] ? doc["foundry"] : doc;

    if (root["claude_dir"]) f.claude_dir = root["claude_dir"].as<std::string>();
    if (root["doc_file"]) f.doc_file = root["doc_file"].as<std::string>();
    if (root["manifest_file"]) f.manifest_file = root["manifest_file"].as<std::string>();
    if (root["repo_url"]) f.repo_url = root["repo_url"].as<std::string>();
    if (root["mcp_servers_file"]) f.mcp_servers_file = root["mcp_servers_file"].as<std::string>();
    if (root["projects_dir"]) f.projects_dir = root["projects_dir"].as<std::string>();
  } catch (const YAML::Exception& e) {
    log::warn(std::string("YAML config parse failed: ") + e.what());
    return false;
  }
  return true;
}
} // namespace

ToolConfig load_tool_config(const std::filesystem::path& path) {
  ToolConfig cfg;

  if (path.empty() || !file_exists(path)) {
    log::warn(std::string("config not found, using defaults: ") + path.string());
    return cfg;
  }

  ConfigFields fields;
  const auto ext = path.extension().string();
  if (ext == ".json") {
    if (!read_json_fields(path, fields)) {
      log::warn("JSON config invalid; using defaults.");
      return cfg;
    }
    apply_fields(cfg, fields);
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    if (!read_yaml_fields(path, fields)) {
      log::warn("YAML config invalid; using defaults.");
      return cfg;
    }
    apply_fields(cfg, fields);
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace foundry

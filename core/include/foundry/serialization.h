#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace foundry::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out);
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node);

bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out);

// Byte-exact text I/O (binary mode, no newline translation).
bool read_text_file(const std::filesystem::path& path, std::string& out);
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace foundry::data

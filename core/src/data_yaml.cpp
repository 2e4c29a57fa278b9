#include "foundry/serialization.h"

#include "foundry/log.h"

#include <yaml-cpp/yaml.h>

namespace foundry::data {

bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out) {
  try {
    out = YAML::LoadFile(path.string());
    return true;
  } catch (const YAML::Exception& e) {
    log::warn(std::string("YAML load failed: ") + path.string() + ": " + e.what());
    return false;
  }
}

} // namespace foundry::data

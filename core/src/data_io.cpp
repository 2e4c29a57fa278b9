#include "foundry/serialization.h"

#include "foundry/log.h"

#include <fstream>
#include <sstream>

namespace foundry::data {

bool read_text_file(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return !in.bad();
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  out.flush();
  return static_cast<bool>(out);
}

} // namespace foundry::data

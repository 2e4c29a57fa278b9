#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace foundry::log {

void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();

// Mirror log lines to stdout (default on).
void set_console(bool enabled);

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace foundry::log

#include "foundryctl/cli_api.h"

#include "foundry/log.h"
#include "foundry/paths.h"

#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {
void print_usage() {
  std::cout << "Usage:\n"
            << "  foundryctl init [project_dir] [--non-interactive] [--force]\n"
            << "  foundryctl update-all [--force]\n"
            << "  foundryctl version\n"
            << "  foundryctl migrate [project_dir] [--dry-run]\n"
            << "  foundryctl private add <source_dir> --prefix <p> [--project <dir>] [--non-interactive]\n"
            << "  foundryctl private list [--project <dir>]\n"
            << "  foundryctl private remove <prefix> [--project <dir>]\n";
}
} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const char* argv0 = argc > 0 ? argv[0] : nullptr;
  const auto paths = foundry::resolve_paths(argv0, std::nullopt);
  foundry::log::init("foundryctl", paths.logs_dir);

  const std::string command = argv[1];
  int rc = 1;

  if (command == "version") {
    rc = cmd_version(argv0);
  } else if (command == "init") {
    InitCliOptions opts;
    std::optional<fs::path> project;
    bool bad = false;
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--non-interactive") {
        opts.interactive = false;
      } else if (arg == "--force") {
        opts.force = true;
      } else if (!arg.empty() && arg[0] != '-' && !project) {
        project = fs::path(arg);
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        bad = true;
      }
    }
    if (bad) {
      print_usage();
    } else {
      rc = cmd_init(argv0, project, opts);
    }
  } else if (command == "update-all") {
    bool force = false;
    for (int i = 2; i < argc; ++i) {
      if (std::string(argv[i]) == "--force") force = true;
    }
    rc = cmd_update_all(argv0, force);
  } else if (command == "migrate") {
    std::optional<fs::path> project;
    bool dry_run = false;
    for (int i = 2; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--dry-run") {
        dry_run = true;
      } else if (!arg.empty() && arg[0] != '-' && !project) {
        project = fs::path(arg);
      }
    }
    rc = cmd_migrate(argv0, project, dry_run);
  } else if (command == "private" && argc >= 3) {
    const std::string sub = argv[2];
    std::optional<fs::path> project;
    PrivateAddOptions add_opts;
    std::string positional;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--project" && i + 1 < argc) {
        project = fs::path(argv[++i]);
      } else if (arg == "--prefix" && i + 1 < argc) {
        add_opts.prefix = argv[++i];
      } else if (arg == "--non-interactive") {
        add_opts.interactive = false;
      } else if (positional.empty()) {
        positional = arg;
      }
    }
    if (sub == "add" && !positional.empty() && !add_opts.prefix.empty()) {
      add_opts.source_dir = fs::path(positional);
      rc = cmd_private_add(argv0, project, add_opts);
    } else if (sub == "list") {
      rc = cmd_private_list(argv0, project);
    } else if (sub == "remove" && !positional.empty()) {
      rc = cmd_private_remove(argv0, project, positional);
    } else {
      print_usage();
    }
  } else {
    std::cout << "Unknown command: " << command << "\n";
    print_usage();
  }

  foundry::log::shutdown();
  return rc;
}

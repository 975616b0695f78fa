#include "cli/registry.hpp"
#include "rnoecfg/consts.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

// $XDG_CONFIG_HOME/read-no-evil-mcp/config.yaml, falling back to ~/.config
std::filesystem::path default_config_path() {
  namespace consts = rnoecfg::consts;
  std::filesystem::path base;
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    base = xdg;
  } else if (const char *home = std::getenv("HOME"); home && *home) {
    base = std::filesystem::path(home) / ".config";
  } else {
    base = std::filesystem::current_path() / ".config";
  }
  return base / consts::kAppDirName / consts::kConfigName;
}

} // namespace

int main(int argc, char **argv) {
  rnoecfg::cli::register_all_commands(); // defined in register_commands.cpp

  rnoecfg::cli::CommandContext ctx{.config_path = default_config_path()};
  int i = 1;
  while (i < argc) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      ctx.config_path = argv[i + 1];
      i += 2;
    } else if (a.rfind("--config=", 0) == 0) {
      ctx.config_path = a.substr(9);
      ++i;
    } else {
      break;
    }
  }

  if (i >= argc) {
    rnoecfg::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[i];

  const auto fn = rnoecfg::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    rnoecfg::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(ctx, argc - i, argv + i);
}

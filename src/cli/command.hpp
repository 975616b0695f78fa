#pragma once
#include <filesystem>

namespace rnoecfg::cli {

// Resolved once in main() and handed to every command.
struct CommandContext {
  std::filesystem::path config_path;
};

using command_fn = int (*)(const CommandContext &ctx, int argc, char **argv);

} // namespace rnoecfg::cli

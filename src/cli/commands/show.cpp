#include "cli/command.hpp"
#include "rnoecfg/fs.hpp"

#include <iostream>

int cmd_show(const rnoecfg::cli::CommandContext &ctx, int /*argc*/, char ** /*argv*/) {
  try {
    std::cout << rnoecfg::fs::read_file(ctx.config_path);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "show: " << e.what() << "\n";
    return 1;
  }
}

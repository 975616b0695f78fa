#include "cli/args.hpp"
#include "cli/command.hpp"
#include "rnoecfg/accounts.hpp"
#include "rnoecfg/store.hpp"

#include <iostream>
#include <string>

int cmd_create(const rnoecfg::cli::CommandContext &ctx, int argc, char **argv) {
  double threshold = rnoecfg::consts::kDefaultThreshold;
  bool force = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--force") {
      force = true;
    } else if (a == "--threshold" && i + 1 < argc) {
      const auto t = rnoecfg::cli::parse_float_arg(argv[++i]);
      if (!t) {
        std::cerr << "create: --threshold expects a number, got '" << argv[i] << "'\n";
        return 2;
      }
      threshold = *t;
    } else {
      std::cerr << "usage: rnoe-config create [--threshold F] [--force]\n";
      return 2;
    }
  }

  try {
    const rnoecfg::ConfigStore store{ctx.config_path};
    if (store.exists() && !force) {
      std::cerr << "create: config file already exists: " << store.path().string() << "\n";
      std::cerr << "Use --force to overwrite.\n";
      return 1;
    }
    store.save(rnoecfg::new_document(threshold));
    std::cout << "Config created: " << store.path().string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "create: " << e.what() << "\n";
    return 1;
  }
}

#include "cli/command.hpp"
#include "rnoecfg/accounts.hpp"
#include "rnoecfg/store.hpp"

#include <iostream>
#include <string>

int cmd_remove(const rnoecfg::cli::CommandContext &ctx, int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: rnoe-config remove <account_id>\n";
    return 2;
  }
  const std::string id = argv[1];

  try {
    const rnoecfg::ConfigStore store{ctx.config_path};
    auto snap = store.load_snapshot();
    if (!rnoecfg::remove_account(snap.document, id)) {
      std::cerr << "remove: no account with ID '" << id << "'\n";
      return 1;
    }
    store.save_if_unchanged(snap.document, snap.digest);
    std::cout << "Account '" << id << "' removed from config.\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "remove: " << e.what() << "\n";
    return 1;
  }
}

#include "cli/registry.hpp"

using rnoecfg::cli::CommandContext;

int cmd_create(const CommandContext &ctx, int argc, char **argv);
int cmd_add(const CommandContext &ctx, int argc, char **argv);
int cmd_remove(const CommandContext &ctx, int argc, char **argv);
int cmd_list(const CommandContext &ctx, int argc, char **argv);
int cmd_show(const CommandContext &ctx, int argc, char **argv);

namespace rnoecfg::cli {

void register_all_commands() {
  register_command("create", ::cmd_create,
                   "Create config skeleton: rnoe-config create [--threshold F] [--force]");
  register_command("add", ::cmd_add,
                   "Add an account: rnoe-config add --email E --host H --smtp-host S [...]");
  register_command("remove", ::cmd_remove, "Remove an account: rnoe-config remove <account_id>");
  register_command("list", ::cmd_list, "List configured accounts");
  register_command("show", ::cmd_show, "Print the config file");
}

} // namespace rnoecfg::cli

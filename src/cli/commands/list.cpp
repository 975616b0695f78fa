#include "cli/command.hpp"
#include "rnoecfg/accounts.hpp"
#include "rnoecfg/scalar.hpp"
#include "rnoecfg/store.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

namespace {

// Field as display text; "?" when absent.
std::string field_text(const rnoecfg::Value &account, std::string_view key) {
  if (account.kind() != rnoecfg::Value::Kind::Mapping)
    return "?";
  const rnoecfg::Value *v = account.as_mapping().find(key);
  if (!v || !v->is_scalar())
    return "?";
  return v->kind() == rnoecfg::Value::Kind::String ? v->as_string() : rnoecfg::format_scalar(*v);
}

} // namespace

int cmd_list(const rnoecfg::cli::CommandContext &ctx, int /*argc*/, char ** /*argv*/) {
  namespace consts = rnoecfg::consts;
  try {
    const rnoecfg::ConfigStore store{ctx.config_path};
    const auto accounts = rnoecfg::account_list(store.load());
    if (accounts.empty()) {
      std::cout << "No accounts configured.\n";
      return 0;
    }
    std::cout << "Accounts in " << store.path().string() << ":\n";
    for (const auto &a : accounts) {
      std::cout << "  " << std::left << std::setw(12) << field_text(a, consts::kKeyId) << ' '
                << std::setw(30) << field_text(a, consts::kKeyUsername) << ' '
                << field_text(a, consts::kKeyHost) << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "list: " << e.what() << "\n";
    return 1;
  }
}

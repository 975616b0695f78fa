#include "cli/args.hpp"
#include "cli/command.hpp"
#include "rnoecfg/accounts.hpp"
#include "rnoecfg/error.hpp"
#include "rnoecfg/secrets.hpp"
#include "rnoecfg/store.hpp"

#include <iostream>
#include <string>

namespace {

int usage() {
  std::cerr << "usage: rnoe-config add --email E --host H --smtp-host S [--id ID]\n"
               "         [--port N] [--smtp-port N] [--no-ssl] [--smtp-ssl]\n"
               "         [--send] [--delete] [--move] [--threshold F] [--create-env]\n";
  return 2;
}

} // namespace

int cmd_add(const rnoecfg::cli::CommandContext &ctx, int argc, char **argv) {
  rnoecfg::AccountRequest req;
  bool create_env = false;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    const bool has_value = i + 1 < argc;
    if (a == "--no-ssl") {
      req.ssl = false;
    } else if (a == "--smtp-ssl") {
      req.smtp_ssl = true;
    } else if (a == "--send") {
      req.allow_send = true;
    } else if (a == "--delete") {
      req.allow_delete = true;
    } else if (a == "--move") {
      req.allow_move = true;
    } else if (a == "--create-env") {
      create_env = true;
    } else if (a == "--email" && has_value) {
      req.email = argv[++i];
    } else if (a == "--id" && has_value) {
      req.id = argv[++i];
    } else if (a == "--host" && has_value) {
      req.host = argv[++i];
    } else if (a == "--smtp-host" && has_value) {
      req.smtp_host = argv[++i];
    } else if ((a == "--port" || a == "--smtp-port") && has_value) {
      const auto n = rnoecfg::cli::parse_int_arg(argv[++i]);
      if (!n) {
        std::cerr << "add: " << a << " expects an integer, got '" << argv[i] << "'\n";
        return 2;
      }
      (a == "--port" ? req.port : req.smtp_port) = *n;
    } else if (a == "--threshold" && has_value) {
      const auto t = rnoecfg::cli::parse_float_arg(argv[++i]);
      if (!t) {
        std::cerr << "add: --threshold expects a number, got '" << argv[i] << "'\n";
        return 2;
      }
      req.threshold = *t;
    } else {
      return usage();
    }
  }
  if (req.email.empty() || req.host.empty() || req.smtp_host.empty()) {
    return usage();
  }

  try {
    const rnoecfg::ConfigStore store{ctx.config_path};
    auto snap = store.load_snapshot();

    rnoecfg::Mapping account = rnoecfg::build_account(req, rnoecfg::account_ids(snap.document));
    const std::string id = account.find(rnoecfg::consts::kKeyId)->as_string();
    rnoecfg::append_account(snap.document, std::move(account));
    store.save_if_unchanged(snap.document, snap.digest);

    std::cout << "Account '" << id << "' added to: " << store.path().string() << "\n";
    std::cout << "Set password env var: " << rnoecfg::password_env_var(id) << "\n";

    if (create_env) {
      const auto env_path =
          rnoecfg::write_env_file(store.path(), rnoecfg::ordered_account_ids(snap.document));
      std::cout << "Created .env: " << env_path.string() << "\n";
    }
    return 0;
  } catch (const rnoecfg::ConfigError &e) {
    std::cerr << "add: " << e.what() << "\n";
    if (e.kind() == rnoecfg::ErrorKind::NotFound)
      std::cerr << "Run 'rnoe-config create' to create one.\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}

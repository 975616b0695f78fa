#pragma once
#include "rnoecfg/consts.hpp"
#include "rnoecfg/value.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rnoecfg {

// Flags collected by `rnoe-config add`.
struct AccountRequest {
  std::string email;
  std::optional<std::string> id; // suggested from the e-mail when unset
  std::string host;
  std::int64_t port = consts::kDefaultImapPort;
  bool ssl = true;
  std::string smtp_host;
  std::int64_t smtp_port = consts::kDefaultSmtpPort;
  bool smtp_ssl = false;
  bool allow_send = false;
  bool allow_delete = false;
  bool allow_move = false;
  std::optional<double> threshold; // per-account protection override
};

// Fresh document: protection.threshold and an empty account list.
Mapping new_document(double threshold = consts::kDefaultThreshold);

// `accounts` of the document; Null or absent reads as empty.
// Throws ConfigError(Malformed) if it is some other kind.
Sequence account_list(const Mapping &doc);
std::set<std::string> account_ids(const Mapping &doc);
// Ids in list order; entries without a string id give "".
std::vector<std::string> ordered_account_ids(const Mapping &doc);

void append_account(Mapping &doc, Mapping account);
// Returns false when no account has that id.
bool remove_account(Mapping &doc, std::string_view id);

auto is_valid_email(std::string_view email) -> bool;
auto is_valid_account_id(std::string_view id) -> bool;
auto suggest_account_id(std::string_view email, const std::set<std::string> &existing)
    -> std::string;

// Validate the request and produce the account mapping.
// Throws std::invalid_argument on a bad e-mail, a bad id or a duplicate id.
Mapping build_account(const AccountRequest &req, const std::set<std::string> &existing);

// RNOE_ACCOUNT_<ID>_PASSWORD
std::string password_env_var(std::string_view account_id);

} // namespace rnoecfg

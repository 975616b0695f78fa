#include "rnoecfg/accounts.hpp"

#include "rnoecfg/error.hpp"
#include "rnoecfg/util.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace rnoecfg {

namespace {

bool id_char(char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-'; }

std::string id_of(const Value &account) {
  if (account.kind() != Value::Kind::Mapping)
    return {};
  const Value *id = account.as_mapping().find(consts::kKeyId);
  return id && id->kind() == Value::Kind::String ? id->as_string() : std::string{};
}

} // namespace

Mapping new_document(double threshold) {
  Mapping doc;
  doc.set(std::string(consts::kKeyProtection),
          Mapping{{std::string(consts::kKeyThreshold), Value(threshold)}});
  doc.set(std::string(consts::kKeyAccounts), Sequence{});
  return doc;
}

Sequence account_list(const Mapping &doc) {
  const Value *accounts = doc.find(consts::kKeyAccounts);
  // An empty list is written as a bare "accounts:" and comes back as null.
  if (!accounts || accounts->is_null())
    return {};
  if (accounts->kind() != Value::Kind::Sequence) {
    throw ConfigError(ErrorKind::Malformed, "'accounts' is a " +
                                                std::string(kind_name(accounts->kind())) +
                                                ", expected a list");
  }
  return accounts->as_sequence();
}

std::vector<std::string> ordered_account_ids(const Mapping &doc) {
  std::vector<std::string> ids;
  for (const Value &a : account_list(doc)) {
    ids.push_back(id_of(a));
  }
  return ids;
}

std::set<std::string> account_ids(const Mapping &doc) {
  const auto ids = ordered_account_ids(doc);
  return {ids.begin(), ids.end()};
}

void append_account(Mapping &doc, Mapping account) {
  Sequence accounts = account_list(doc);
  accounts.emplace_back(std::move(account));
  doc.set(std::string(consts::kKeyAccounts), std::move(accounts));
}

bool remove_account(Mapping &doc, std::string_view id) {
  Sequence accounts = account_list(doc);
  const auto removed = std::erase_if(accounts, [&](const Value &a) { return id_of(a) == id; });
  if (removed == 0)
    return false;
  doc.set(std::string(consts::kKeyAccounts), std::move(accounts));
  return true;
}

bool is_valid_email(std::string_view email) {
  const auto at = email.find('@');
  if (at == std::string_view::npos)
    return false;
  const std::string_view domain = email.substr(email.rfind('@') + 1);
  return domain.find('.') != std::string_view::npos;
}

bool is_valid_account_id(std::string_view id) {
  if (id.empty() || id.front() == '-')
    return false;
  return std::ranges::all_of(id, id_char);
}

std::string suggest_account_id(std::string_view email, const std::set<std::string> &existing) {
  const std::string local = strutil::to_lower(email.substr(0, email.find('@')));
  std::string candidate;
  std::ranges::copy_if(local, std::back_inserter(candidate), id_char);
  if (candidate.empty())
    candidate = consts::kDefaultAccountId;
  if (!existing.contains(candidate))
    return candidate;
  for (int i = 2; i < consts::kMaxIdSuffix; ++i) {
    std::string next = candidate + std::to_string(i);
    if (!existing.contains(next))
      return next;
  }
  return candidate;
}

Mapping build_account(const AccountRequest &req, const std::set<std::string> &existing) {
  if (!is_valid_email(req.email)) {
    throw std::invalid_argument("Invalid email address: " + req.email);
  }
  const std::string id =
      strutil::to_lower(req.id ? *req.id : suggest_account_id(req.email, existing));
  if (existing.contains(id)) {
    throw std::invalid_argument("Account '" + id + "' already exists.");
  }
  if (!is_valid_account_id(id)) {
    throw std::invalid_argument("Account ID must be lowercase alphanumeric with hyphens only.");
  }

  Mapping account;
  account.set(std::string(consts::kKeyId), id);
  account.set(std::string(consts::kKeyType), consts::kAccountTypeImap);
  account.set(std::string(consts::kKeyHost), req.host);
  account.set(std::string(consts::kKeyPort), req.port);
  account.set(std::string(consts::kKeySsl), req.ssl);
  account.set(std::string(consts::kKeyUsername), req.email);
  account.set(std::string(consts::kKeySmtpHost), req.smtp_host);
  account.set(std::string(consts::kKeySmtpPort), req.smtp_port);
  account.set(std::string(consts::kKeySmtpSsl), req.smtp_ssl);

  // read is always granted
  Mapping permissions;
  permissions.set(std::string(consts::kKeyRead), true);
  permissions.set(std::string(consts::kKeySend), req.allow_send);
  permissions.set(std::string(consts::kKeyDelete), req.allow_delete);
  permissions.set(std::string(consts::kKeyMove), req.allow_move);
  account.set(std::string(consts::kKeyPermissions), std::move(permissions));

  if (req.threshold) {
    account.set(std::string(consts::kKeyProtection),
                Mapping{{std::string(consts::kKeyThreshold), Value(*req.threshold)}});
  }
  return account;
}

std::string password_env_var(std::string_view account_id) {
  return std::string(consts::kEnvVarPrefix) + strutil::to_upper(account_id) +
         std::string(consts::kEnvVarSuffix);
}

} // namespace rnoecfg

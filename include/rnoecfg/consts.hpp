#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rnoecfg::consts {

// ——— Layout of the block format ———
inline constexpr std::size_t kIndentWidth = 2; // spaces per nesting level
inline constexpr std::string_view kSeqMarker = "- ";
inline constexpr std::string_view kFieldPad  = "  "; // item fields sit under the first key
inline constexpr char kComment = '#';
inline constexpr char kColon   = ':';
inline constexpr char kDQuote  = '"';
inline constexpr char kSQuote  = '\'';
inline constexpr char kEscape  = '\\';
inline constexpr char kLF      = '\n';
inline constexpr char kTab     = '\t';

// ——— Scalar spellings ———
inline constexpr std::string_view kTrue  = "true";
inline constexpr std::string_view kFalse = "false";
inline constexpr std::string_view kNull  = "null";

// Words a reader of the wider format would take for a bool/null.
inline constexpr std::array<std::string_view, 7> kReservedWords = {
    "true", "false", "null", "yes", "no", "on", "off"};

// Any of these inside a string forces quoting.
inline constexpr std::string_view kQuoteTriggers = ":#{}[]!&*?,|>'\"@`";

// ——— Config document keys ———
inline constexpr std::string_view kKeyProtection  = "protection";
inline constexpr std::string_view kKeyThreshold   = "threshold";
inline constexpr std::string_view kKeyAccounts    = "accounts";
inline constexpr std::string_view kKeyId          = "id";
inline constexpr std::string_view kKeyType        = "type";
inline constexpr std::string_view kKeyHost        = "host";
inline constexpr std::string_view kKeyPort        = "port";
inline constexpr std::string_view kKeySsl         = "ssl";
inline constexpr std::string_view kKeyUsername    = "username";
inline constexpr std::string_view kKeySmtpHost    = "smtp_host";
inline constexpr std::string_view kKeySmtpPort    = "smtp_port";
inline constexpr std::string_view kKeySmtpSsl     = "smtp_ssl";
inline constexpr std::string_view kKeyPermissions = "permissions";
inline constexpr std::string_view kKeyRead        = "read";
inline constexpr std::string_view kKeySend        = "send";
inline constexpr std::string_view kKeyDelete      = "delete";
inline constexpr std::string_view kKeyMove        = "move";
inline constexpr std::string_view kAccountTypeImap = "imap";

// ——— Defaults ———
inline constexpr std::int64_t kDefaultImapPort = 993;
inline constexpr std::int64_t kDefaultSmtpPort = 587;
inline constexpr double kDefaultThreshold = 0.5;
inline constexpr std::string_view kDefaultAccountId = "default";
inline constexpr int kMaxIdSuffix = 100; // suggestions try 2..99

// ——— Files ———
inline constexpr std::string_view kAppDirName    = "read-no-evil-mcp";
inline constexpr std::string_view kConfigName    = "config.yaml";
inline constexpr std::string_view kEnvFileName   = ".env";
inline constexpr std::string_view kTempSuffix    = ".tmp.XXXXXX"; // mkstemp template tail

// ——— Secrets file ———
inline constexpr std::string_view kEnvVarPrefix = "RNOE_ACCOUNT_";
inline constexpr std::string_view kEnvVarSuffix = "_PASSWORD";
inline constexpr std::string_view kPasswordPlaceholder = "your-app-password-here";

// ——— Digest sizes (SHA-1) ———
inline constexpr std::size_t kDigestRawLen = 20;
inline constexpr std::size_t kDigestHexLen = 40;

} // namespace rnoecfg::consts

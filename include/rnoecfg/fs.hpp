#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace rnoecfg::fs {

inline constexpr std::filesystem::perms kOwnerReadWrite =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

// Throws ConfigError(NotFound) if `p` is absent, ConfigError(IoFailure) otherwise.
std::string read_file(const std::filesystem::path& p);

// Write `data` to a fresh temp file beside `p`, fsync it, apply `mode` and
// rename it over `p`. The temp file is removed on every failure path, so `p`
// is either untouched or fully replaced.
void write_file_atomic(const std::filesystem::path& p, std::string_view data,
                       std::filesystem::perms mode = kOwnerReadWrite);

} // namespace rnoecfg::fs

#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace rnoecfg {

// KEY=value pairs of a secrets file; blanks and '#' lines are skipped.
// A missing file reads as empty.
std::map<std::string, std::string> read_env_file(const std::filesystem::path &path);

// Write <config dir>/.env (mode 0600) with one password line per account id,
// keeping values already present. Returns the path written.
std::filesystem::path write_env_file(const std::filesystem::path &config_path,
                                     const std::vector<std::string> &account_ids);

} // namespace rnoecfg

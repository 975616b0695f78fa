#include "rnoecfg/secrets.hpp"

#include "rnoecfg/accounts.hpp"
#include "rnoecfg/consts.hpp"
#include "rnoecfg/error.hpp"
#include "rnoecfg/fs.hpp"
#include "rnoecfg/util.hpp"

#include <sstream>
#include <string>

namespace rnoecfg {

std::map<std::string, std::string> read_env_file(const std::filesystem::path &path) {
  std::map<std::string, std::string> vars;
  std::string text;
  try {
    text = fs::read_file(path);
  } catch (const ConfigError &e) {
    if (e.kind() == ErrorKind::NotFound)
      return vars;
    throw;
  }

  std::istringstream iss(text);
  std::string raw;
  while (std::getline(iss, raw)) {
    const std::string_view line = strutil::trim(raw);
    if (line.empty() || line.front() == consts::kComment)
      continue;
    const auto eq = line.find('=');
    if (eq == std::string_view::npos)
      continue;
    vars[std::string(strutil::trim(line.substr(0, eq)))] =
        std::string(strutil::trim(line.substr(eq + 1)));
  }
  return vars;
}

std::filesystem::path write_env_file(const std::filesystem::path &config_path,
                                     const std::vector<std::string> &account_ids) {
  const auto env_path = config_path.parent_path() / consts::kEnvFileName;
  const auto existing = read_env_file(env_path);

  std::ostringstream os;
  os << "# read-no-evil-mcp credentials\n"
     << "# !! Keep this file secret, do not commit to version control !!\n";
  for (const auto &id : account_ids) {
    if (id.empty())
      continue;
    const std::string var = password_env_var(id);
    const auto it = existing.find(var);
    const std::string_view value =
        it != existing.end() ? std::string_view(it->second) : consts::kPasswordPlaceholder;
    os << var << '=' << value << '\n';
  }
  fs::write_file_atomic(env_path, os.str(), fs::kOwnerReadWrite);
  return env_path;
}

} // namespace rnoecfg

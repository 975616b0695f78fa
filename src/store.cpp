#include "rnoecfg/store.hpp"

#include "rnoecfg/error.hpp"
#include "rnoecfg/fs.hpp"
#include "rnoecfg/hash.hpp"
#include "rnoecfg/reader.hpp"
#include "rnoecfg/writer.hpp"

#include <string>
#include <utility>

namespace rnoecfg {

Mapping parse_config_text(std::string_view text) {
  Value root = parse_document(text);
  if (root.kind() != Value::Kind::Mapping) {
    throw ConfigError(ErrorKind::Malformed,
                      "document root is a " + std::string(kind_name(root.kind())) +
                          ", expected a mapping");
  }
  return std::move(root.as_mapping());
}

ConfigStore::ConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

auto ConfigStore::exists() const -> bool { return fs::exists(path_); }

auto ConfigStore::load() const -> Mapping { return load_snapshot().document; }

auto ConfigStore::load_snapshot() const -> Snapshot {
  const std::string text = fs::read_file(path_);
  try {
    return Snapshot{.document = parse_config_text(text), .digest = to_hex(sha1(text))};
  } catch (const ConfigError &e) {
    if (e.kind() != ErrorKind::Malformed)
      throw;
    throw ConfigError(ErrorKind::Malformed, path_.string() + ": " + e.what());
  }
}

void ConfigStore::save(const Mapping &document) const {
  fs::write_file_atomic(path_, dump(document));
}

void ConfigStore::save_if_unchanged(const Mapping &document,
                                    std::string_view expected_digest) const {
  // Serialize first: an unrepresentable tree must not look like a conflict.
  const std::string text = dump(document);
  if (current_digest() != expected_digest) {
    throw ConfigError(ErrorKind::Conflict,
                      "config file changed since it was read: " + path_.string());
  }
  fs::write_file_atomic(path_, text);
}

auto ConfigStore::current_digest() const -> std::string {
  try {
    return to_hex(sha1(fs::read_file(path_)));
  } catch (const ConfigError &e) {
    if (e.kind() == ErrorKind::NotFound)
      return {};
    throw;
  }
}

Mapping load(const std::filesystem::path &path) { return ConfigStore{path}.load(); }

void save(const std::filesystem::path &path, const Mapping &document) {
  ConfigStore{path}.save(document);
}

} // namespace rnoecfg

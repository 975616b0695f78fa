#pragma once
#include "rnoecfg/value.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rnoecfg {

// A loaded document together with the SHA-1 hex of the bytes it came from.
struct Snapshot {
  Mapping document;
  std::string digest; // empty when the file did not exist
};

// File-level persistence for one config document. The path is supplied by
// the caller; nothing here looks at the environment.
class ConfigStore {
public:
  explicit ConfigStore(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] auto exists() const -> bool;

  // Throws ConfigError: NotFound, IoFailure or Malformed.
  [[nodiscard]] auto load() const -> Mapping;
  [[nodiscard]] auto load_snapshot() const -> Snapshot;

  // Serialize and atomically replace the file (parent dirs are created).
  void save(const Mapping &document) const;

  // Like save(), but throws ConfigError(Conflict) if the file no longer
  // hashes to `expected_digest`. An empty digest expects no file.
  // The check and the rename are not one atomic step; a writer racing in
  // between still wins.
  void save_if_unchanged(const Mapping &document, std::string_view expected_digest) const;

private:
  [[nodiscard]] auto current_digest() const -> std::string;

  std::filesystem::path path_;
};

Mapping load(const std::filesystem::path &path);
void save(const std::filesystem::path &path, const Mapping &document);

// Parse text that must hold a Mapping root (empty text is an empty Mapping).
Mapping parse_config_text(std::string_view text);

} // namespace rnoecfg

#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace rnoecfg {

enum class ErrorKind {
  NotFound,        // path absent on load
  IoFailure,       // read, mkdir, temp file, write, rename
  Malformed,       // reader could not classify a line
  Unrepresentable, // writer got a tree outside the supported shapes
  Conflict,        // file changed between load_snapshot() and save
};

std::string_view to_string(ErrorKind kind);

class ConfigError : public std::runtime_error {
public:
  ConfigError(ErrorKind kind, const std::string &what);

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace rnoecfg

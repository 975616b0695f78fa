#include "rnoecfg/error.hpp"

namespace rnoecfg {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "not found";
  case ErrorKind::IoFailure:
    return "i/o failure";
  case ErrorKind::Malformed:
    return "malformed";
  case ErrorKind::Unrepresentable:
    return "unrepresentable";
  case ErrorKind::Conflict:
    return "conflict";
  }
  return "unknown";
}

ConfigError::ConfigError(ErrorKind kind, const std::string &what)
    : std::runtime_error(what), kind_(kind) {}

} // namespace rnoecfg

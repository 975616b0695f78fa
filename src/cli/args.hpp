#pragma once
#include "rnoecfg/scalar.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace rnoecfg::cli {

// Numeric flag values go through the scalar codec so "0.7" and "1" read the
// same way they would from the config file.
inline std::optional<double> parse_float_arg(std::string_view text) {
  const Value v = parse_scalar(text);
  if (v.kind() == Value::Kind::Float)
    return v.as_float();
  if (v.kind() == Value::Kind::Int)
    return static_cast<double>(v.as_int());
  return std::nullopt;
}

inline std::optional<std::int64_t> parse_int_arg(std::string_view text) {
  const Value v = parse_scalar(text);
  if (v.kind() == Value::Kind::Int)
    return v.as_int();
  return std::nullopt;
}

} // namespace rnoecfg::cli

#pragma once
#include "rnoecfg/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rnoecfg {

// One surviving source line: blank and full-line '#' comments are dropped.
struct SourceLine {
  std::size_t number; // 1-based, for diagnostics
  std::size_t indent; // leading spaces
  std::string content; // trimmed text
};

// Split text into SourceLines. Throws ConfigError(Malformed) on a tab in the
// indentation.
std::vector<SourceLine> prepare_lines(std::string_view text);

struct KeyValue {
  std::string key;
  std::optional<std::string> value; // absent for a bare "key:"
};

// Split "key: value" / "key:" / "\"quoted key\": value".
// Only a ':' followed by a space or the end of the line separates; a colon
// inside a token ("http://x") does not. Returns nullopt when there is no key.
std::optional<KeyValue> split_key_value(std::string_view content);

// Parse block text into its root value (Mapping or Sequence). Empty input
// yields an empty Mapping. Throws ConfigError(Malformed), with the line
// number, on any line that fits no block rule instead of dropping it.
Value parse_document(std::string_view text);

} // namespace rnoecfg

#pragma once
#include "rnoecfg/value.hpp"

#include <string>
#include <string_view>

namespace rnoecfg {

// Render a scalar Value as it appears after "key: " or "- ".
// Bool -> true/false, Null -> null, Int/Float -> decimal text,
// String -> quote_if_needed(). Collections are not scalars and throw
// ConfigError(Unrepresentable).
std::string format_scalar(const Value &v);

// Return `s` bare, or double-quoted with `\` and `"` escaped when the bare
// text would read back as something other than this exact string.
std::string quote_if_needed(std::string_view s);

// Always double-quote `s`, escaping `\` and `"`.
std::string quote(std::string_view s);

// Total: never fails. Quoted text -> String (escapes reversed);
// true/false/null (any case) -> Bool/Null; then Int, then Float;
// anything else is the trimmed text as a String.
Value parse_scalar(std::string_view s);

// Reverse the two escapes quote_if_needed() applies.
std::string unescape_quoted(std::string_view inner);

} // namespace rnoecfg

#include "rnoecfg/scalar.hpp"

#include "rnoecfg/consts.hpp"
#include "rnoecfg/error.hpp"
#include "rnoecfg/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace {

using namespace rnoecfg;

// from_chars takes '-' but not '+'; drop a single leading '+' that is not
// followed by another sign.
std::string_view strip_plus(std::string_view s) {
  if (s.size() > 1 && s.front() == '+' && s[1] != '+' && s[1] != '-') {
    s.remove_prefix(1);
  }
  return s;
}

std::optional<std::int64_t> parse_int(std::string_view s) {
  s = strip_plus(s);
  std::int64_t out = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<double> parse_float(std::string_view s) {
  s = strip_plus(s);
  double out = 0.0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return out;
}

std::string format_float(double d) {
  std::array<char, 64> buf{};
  const auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
  if (ec != std::errc{}) {
    throw ConfigError(ErrorKind::Unrepresentable, "cannot format float");
  }
  std::string text(buf.data(), ptr);
  // "1" would read back as Int
  if (std::ranges::all_of(text, [](char c) { return c == '-' || (c >= '0' && c <= '9'); })) {
    text += ".0";
  }
  return text;
}

bool has_edge_space(std::string_view s) {
  auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  return space(s.front()) || space(s.back());
}

bool is_reserved_word(std::string_view s) {
  const std::string low = strutil::to_lower(s);
  const auto &words = consts::kReservedWords;
  return std::ranges::find(words, std::string_view(low)) != words.end();
}

bool has_quote_trigger(std::string_view s) {
  return s.find_first_of(consts::kQuoteTriggers) != std::string_view::npos;
}

} // namespace

namespace rnoecfg {

std::string quote_if_needed(std::string_view s) {
  const bool needs_quote = s.empty() || has_edge_space(s) || is_reserved_word(s) ||
                           has_quote_trigger(s) || parse_float(s).has_value();
  if (!needs_quote) {
    return std::string(s);
  }
  return quote(s);
}

std::string quote(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back(consts::kDQuote);
  for (char c : s) {
    if (c == consts::kEscape || c == consts::kDQuote) {
      out.push_back(consts::kEscape);
    }
    out.push_back(c);
  }
  out.push_back(consts::kDQuote);
  return out;
}

std::string format_scalar(const Value &v) {
  return std::visit(
      [](const auto &x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return std::string(consts::kNull);
        } else if constexpr (std::is_same_v<T, bool>) {
          return std::string(x ? consts::kTrue : consts::kFalse);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          return format_float(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return quote_if_needed(x);
        } else {
          throw ConfigError(ErrorKind::Unrepresentable, "collection is not a scalar");
        }
      },
      v.data());
}

std::string unescape_quoted(std::string_view inner) {
  std::string out;
  out.reserve(inner.size());
  for (std::size_t i = 0; i < inner.size(); ++i) {
    const char c = inner[i];
    if (c == consts::kEscape && i + 1 < inner.size() &&
        (inner[i + 1] == consts::kEscape || inner[i + 1] == consts::kDQuote)) {
      out.push_back(inner[++i]);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

Value parse_scalar(std::string_view s) {
  const std::string_view t = strutil::trim(s);
  if (t.empty()) {
    return Value(std::string{});
  }

  const bool dq = t.front() == consts::kDQuote && t.back() == consts::kDQuote;
  const bool sq = t.front() == consts::kSQuote && t.back() == consts::kSQuote;
  if (t.size() >= 2 && (dq || sq)) {
    return Value(unescape_quoted(t.substr(1, t.size() - 2)));
  }

  const std::string low = strutil::to_lower(t);
  if (low == consts::kTrue) {
    return Value(true);
  }
  if (low == consts::kFalse) {
    return Value(false);
  }
  if (low == consts::kNull) {
    return Value{};
  }

  if (auto i = parse_int(t)) {
    return Value(*i);
  }
  if (auto d = parse_float(t)) {
    return Value(*d);
  }
  return Value(t);
}

} // namespace rnoecfg

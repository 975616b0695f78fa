// Small string helpers shared by the codec and the CLI
#include "rnoecfg/util.hpp"

#include <algorithm>
#include <cctype>

namespace rnoecfg {

namespace strutil {

namespace {
bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
} // namespace

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && is_blank(sv.front()))
    sv.remove_prefix(1);
  return rtrim(sv);
}

std::string_view rtrim(std::string_view sv) {
  while (!sv.empty() && is_blank(sv.back()))
    sv.remove_suffix(1);
  return sv;
}

std::string to_lower(std::string_view str) {
  std::string out(str);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string to_upper(std::string_view str) {
  std::string out(str);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

bool starts_with(std::string_view str, std::string_view prefix) {
  return str.substr(0, prefix.size()) == prefix;
}

} // namespace strutil

} // namespace rnoecfg

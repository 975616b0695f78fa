#pragma once
#include <string>
#include <string_view>

namespace rnoecfg {

// String helpers
namespace strutil {
  // Strip spaces, tabs, CR and LF from both ends
  auto trim(std::string_view str) -> std::string_view;
  auto rtrim(std::string_view str) -> std::string_view;
  // ASCII lowercase/uppercase copies
  auto to_lower(std::string_view str) -> std::string;
  auto to_upper(std::string_view str) -> std::string;
  auto starts_with(std::string_view str, std::string_view prefix) -> bool;
}

}

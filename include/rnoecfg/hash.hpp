#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace rnoecfg {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * Used to fingerprint the exact bytes of a config file so a later save can
 * detect that somebody else replaced it in between.
 */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &d);

} // namespace rnoecfg

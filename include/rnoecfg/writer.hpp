#pragma once
#include "rnoecfg/value.hpp"

#include <string>

namespace rnoecfg {

// Serialize a document root to block text (2 spaces per level, trailing
// newline). Output is byte-identical for equal trees.
//
// Sequence items that are Mappings are written as one dash followed by the
// first field, with the remaining fields aligned two spaces past the dash:
//
//   accounts:
//     - id: work
//       host: imap.example.com
//
// Empty collections are written as a bare "key:" and read back as Null.
// Throws ConfigError(Unrepresentable) for a Sequence nested directly in a
// Sequence, an empty Mapping used as a Sequence item, or text containing a
// line break.
std::string dump(const Mapping &root);

} // namespace rnoecfg

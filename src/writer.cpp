#include "rnoecfg/writer.hpp"

#include "rnoecfg/consts.hpp"
#include "rnoecfg/error.hpp"
#include "rnoecfg/scalar.hpp"

#include <string>
#include <string_view>

namespace {

using namespace rnoecfg;

std::string pad(std::size_t level) { return std::string(level * consts::kIndentWidth, ' '); }

void reject_line_breaks(std::string_view text, std::string_view what) {
  if (text.find_first_of("\r\n") != std::string_view::npos) {
    throw ConfigError(ErrorKind::Unrepresentable,
                      std::string(what) + " contains a line break: " + std::string(text));
  }
}

// A bare key starting with "- " would read back as a sequence item.
std::string format_key(std::string_view key) {
  std::string text = quote_if_needed(key);
  if (text == key && key.starts_with(consts::kSeqMarker)) {
    return quote(key);
  }
  return text;
}

class Emitter {
public:
  void mapping(const Mapping &m, std::size_t level) {
    const std::string prefix = pad(level);
    for (const auto &[key, value] : m.entries()) {
      field(prefix, key, value, level + 1);
    }
  }

  // Item fields go two levels deeper than the dash so that the nested block
  // lands past the "  " alignment of the sibling fields.
  void sequence(const Sequence &seq, std::size_t level) {
    const std::string prefix = pad(level);
    for (const Value &item : seq) {
      switch (item.kind()) {
      case Value::Kind::Mapping: {
        const Mapping &m = item.as_mapping();
        if (m.empty()) {
          throw ConfigError(ErrorKind::Unrepresentable, "empty mapping as sequence item");
        }
        bool first = true;
        for (const auto &[key, value] : m.entries()) {
          const std::string lead =
              prefix + std::string(first ? consts::kSeqMarker : consts::kFieldPad);
          field(lead, key, value, level + 2);
          first = false;
        }
        break;
      }
      case Value::Kind::Sequence:
        throw ConfigError(ErrorKind::Unrepresentable, "sequence nested directly in a sequence");
      default:
        out_ += prefix;
        out_ += consts::kSeqMarker;
        out_ += scalar(item);
        out_ += consts::kLF;
        break;
      }
    }
  }

  std::string take() { return std::move(out_); }

private:
  // "<lead>key: scalar" or "<lead>key:" followed by a block at child_level.
  void field(const std::string &lead, const std::string &key, const Value &value,
             std::size_t child_level) {
    reject_line_breaks(key, "key");
    out_ += lead;
    out_ += format_key(key);
    out_ += consts::kColon;
    switch (value.kind()) {
    case Value::Kind::Mapping:
      out_ += consts::kLF;
      mapping(value.as_mapping(), child_level);
      break;
    case Value::Kind::Sequence:
      out_ += consts::kLF;
      sequence(value.as_sequence(), child_level);
      break;
    default:
      out_ += ' ';
      out_ += scalar(value);
      out_ += consts::kLF;
      break;
    }
  }

  static std::string scalar(const Value &v) {
    if (v.kind() == Value::Kind::String) {
      reject_line_breaks(v.as_string(), "string");
    }
    return format_scalar(v);
  }

  std::string out_;
};

} // namespace

namespace rnoecfg {

std::string dump(const Mapping &root) {
  Emitter e;
  e.mapping(root, 0);
  std::string text = e.take();
  // An empty root still ends with a newline.
  if (text.empty()) {
    text += consts::kLF;
  }
  return text;
}

} // namespace rnoecfg

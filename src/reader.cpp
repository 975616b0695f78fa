#include "rnoecfg/reader.hpp"

#include "rnoecfg/consts.hpp"
#include "rnoecfg/error.hpp"
#include "rnoecfg/scalar.hpp"
#include "rnoecfg/util.hpp"

#include <string>
#include <utility>

namespace {

using namespace rnoecfg;

bool is_seq_marker(std::string_view content) {
  return strutil::starts_with(content, consts::kSeqMarker);
}

// Position just past the closing quote matching content[0], honouring the
// backslash escapes. npos when unterminated.
std::size_t closing_quote(std::string_view content) {
  const char q = content.front();
  for (std::size_t i = 1; i < content.size(); ++i) {
    if (content[i] == consts::kEscape) {
      ++i;
    } else if (content[i] == q) {
      return i + 1;
    }
  }
  return std::string_view::npos;
}

// Recursive descent over the prepared lines. A block is every consecutive
// line at one indent; deeper lines belong to the key above them.
class BlockReader {
public:
  explicit BlockReader(std::vector<SourceLine> lines) : lines_(std::move(lines)) {}

  Value parse_root() {
    if (lines_.empty()) {
      return Value(Mapping{});
    }
    Value root = parse_block(0);
    if (pos_ < lines_.size()) {
      const SourceLine &l = lines_[pos_];
      malformed(l, "unexpected content at indent " + std::to_string(l.indent) +
                       " (belongs to no open block)");
    }
    return root;
  }

private:
  Value parse_block(std::size_t base) {
    if (pos_ >= lines_.size()) {
      return Value(Mapping{});
    }
    if (is_seq_marker(lines_[pos_].content)) {
      return Value(parse_sequence(base));
    }
    return Value(parse_mapping(base));
  }

  Mapping parse_mapping(std::size_t base) {
    Mapping out;
    while (pos_ < lines_.size()) {
      const SourceLine &l = lines_[pos_];
      if (l.indent != base || is_seq_marker(l.content)) {
        break;
      }
      parse_field(out, base);
    }
    return out;
  }

  Sequence parse_sequence(std::size_t base) {
    Sequence out;
    const std::size_t child = base + consts::kIndentWidth;
    while (pos_ < lines_.size()) {
      const SourceLine &l = lines_[pos_];
      if (l.indent != base || !is_seq_marker(l.content)) {
        break;
      }
      const std::string rest(strutil::trim(std::string_view(l.content).substr(2)));
      ++pos_;

      auto kv = split_key_value(rest);
      if (!kv) {
        out.push_back(parse_scalar(rest));
        continue;
      }

      Mapping item;
      if (kv->value) {
        item.set(std::move(kv->key), parse_scalar(*kv->value));
      } else {
        Value nested;
        if (pos_ < lines_.size()) {
          const SourceLine &next = lines_[pos_];
          // Deeper than the sibling fields, or a dash list right under the key.
          if (next.indent > child || (next.indent == child && is_seq_marker(next.content))) {
            nested = parse_block(next.indent);
          }
        }
        item.set(std::move(kv->key), std::move(nested));
      }
      while (pos_ < lines_.size()) {
        const SourceLine &f = lines_[pos_];
        if (f.indent != child || is_seq_marker(f.content)) {
          break;
        }
        parse_field(item, child);
      }
      out.push_back(Value(std::move(item)));
    }
    return out;
  }

  // One "key: value" or "key:" line at `indent`, plus its nested block.
  void parse_field(Mapping &into, std::size_t indent) {
    const SourceLine &l = lines_[pos_];
    auto kv = split_key_value(l.content);
    if (!kv) {
      malformed(l, "expected 'key: value' or 'key:'");
    }
    if (into.contains(kv->key)) {
      malformed(l, "duplicate key '" + kv->key + "'");
    }
    ++pos_;
    if (kv->value) {
      into.set(std::move(kv->key), parse_scalar(*kv->value));
      return;
    }
    Value child;
    if (pos_ < lines_.size() && lines_[pos_].indent > indent) {
      child = parse_block(lines_[pos_].indent);
    }
    into.set(std::move(kv->key), std::move(child));
  }

  [[noreturn]] static void malformed(const SourceLine &l, const std::string &why) {
    throw ConfigError(ErrorKind::Malformed,
                      "line " + std::to_string(l.number) + ": " + why + ": " + l.content);
  }

  std::vector<SourceLine> lines_;
  std::size_t pos_ = 0;
};

} // namespace

namespace rnoecfg {

std::vector<SourceLine> prepare_lines(std::string_view text) {
  std::vector<SourceLine> out;
  std::size_t number = 0;
  while (!text.empty()) {
    const std::size_t nl = text.find(consts::kLF);
    std::string_view raw = text.substr(0, nl);
    text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
    ++number;

    const std::string_view content = strutil::trim(raw);
    if (content.empty() || content.front() == consts::kComment) {
      continue;
    }
    const std::size_t lead = raw.find_first_not_of(" \t");
    const std::string_view indent_chars = raw.substr(0, lead);
    if (indent_chars.find(consts::kTab) != std::string_view::npos) {
      throw ConfigError(ErrorKind::Malformed,
                        "line " + std::to_string(number) + ": tab in indentation");
    }
    out.push_back(SourceLine{.number = number, .indent = lead, .content = std::string(content)});
  }
  return out;
}

std::optional<KeyValue> split_key_value(std::string_view content) {
  if (content.empty()) {
    return std::nullopt;
  }

  // "quoted key": value
  if (content.front() == consts::kDQuote || content.front() == consts::kSQuote) {
    const std::size_t end = closing_quote(content);
    if (end == std::string_view::npos) {
      return std::nullopt;
    }
    const std::string_view rest = content.substr(end);
    if (rest.empty() || rest.front() != consts::kColon) {
      return std::nullopt;
    }
    KeyValue kv{.key = unescape_quoted(content.substr(1, end - 2)), .value = std::nullopt};
    if (const auto val = strutil::trim(rest.substr(1)); !val.empty()) {
      kv.value = std::string(val);
    }
    return kv;
  }

  for (std::size_t i = 0; i < content.size(); ++i) {
    if (content[i] != consts::kColon) {
      continue;
    }
    const bool at_end = i + 1 == content.size();
    if (!at_end && content[i + 1] != ' ') {
      continue; // "http://x" is one token
    }
    const std::string_view key = strutil::rtrim(content.substr(0, i));
    if (key.empty()) {
      return std::nullopt;
    }
    KeyValue kv{.key = std::string(key), .value = std::nullopt};
    if (!at_end) {
      if (const auto val = strutil::trim(content.substr(i + 1)); !val.empty()) {
        kv.value = std::string(val);
      }
    }
    return kv;
  }
  return std::nullopt;
}

Value parse_document(std::string_view text) {
  BlockReader reader{prepare_lines(text)};
  return reader.parse_root();
}

} // namespace rnoecfg

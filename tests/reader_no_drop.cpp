// Damaged documents either fail as Malformed or keep every key.
#include "random_tree.hpp"

#include "rnoecfg/error.hpp"
#include "rnoecfg/reader.hpp"
#include "rnoecfg/writer.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

static std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t nl = text.find('\n', start);
    out.push_back(text.substr(start, nl - start));
    if (nl == std::string::npos)
      break;
    start = nl + 1;
  }
  return out;
}

static std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (const auto &l : lines)
    out += l + "\n";
  return out;
}

// Apply one of: dedent a line, insert a junk line, turn a line into a
// list item.
static std::string damage(const std::string &text, std::mt19937 &rng) {
  std::vector<std::string> lines = split_lines(text);
  const std::size_t at = std::uniform_int_distribution<std::size_t>(0, lines.size() - 1)(rng);
  std::string &line = lines[at];
  const std::size_t lead = line.find_first_not_of(' ');
  const bool is_item = line.compare(lead, 2, "- ") == 0;
  switch (std::uniform_int_distribution<int>(0, 2)(rng)) {
  case 0:
    if (lead > 0) {
      const std::size_t most = std::min<std::size_t>(lead, 2);
      const std::size_t cut = std::uniform_int_distribution<std::size_t>(1, most)(rng);
      line.erase(0, cut);
      break;
    }
    [[fallthrough]];
  case 1:
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at),
                 std::string(lead, ' ') + "stray words");
    break;
  default:
    // "- - k: v" would rename the key rather than drop it
    if (!is_item)
      line.insert(lead, "- ");
    else
      lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at), std::string(lead, ' ') + "-");
    break;
  }
  return join_lines(lines);
}

int main() {
  testgen::RandomTree gen(7u);
  std::mt19937 rng(99u);
  int rejected = 0;
  for (int i = 0; i < 3000; ++i) {
    const rnoecfg::Mapping doc = gen.document();
    const std::string text = damage(rnoecfg::dump(doc), rng);

    std::set<std::string> want;
    testgen::collect_keys(rnoecfg::Value(doc), want);

    rnoecfg::Value back;
    try {
      back = rnoecfg::parse_document(text);
    } catch (const rnoecfg::ConfigError &e) {
      if (e.kind() != rnoecfg::ErrorKind::Malformed) {
        std::cerr << "case " << i << ": wrong error kind: " << e.what() << "\n";
        return 1;
      }
      ++rejected;
      continue;
    }

    std::set<std::string> got;
    testgen::collect_keys(back, got);
    for (const auto &key : want) {
      if (!got.contains(key)) {
        std::cerr << "case " << i << ": key '" << key << "' dropped without an error\n" << text;
        return 1;
      }
    }
  }
  if (rejected == 0) {
    std::cerr << "no damaged document was rejected\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}

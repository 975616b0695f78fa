#include "rnoecfg/reader.hpp"
#include "rnoecfg/writer.hpp"

#include <iostream>
#include <string>

using rnoecfg::Mapping;
using rnoecfg::Sequence;
using rnoecfg::Value;

static Mapping make_account(const std::string &id, const std::string &user, bool with_threshold) {
  Mapping a{{"id", id},
            {"type", "imap"},
            {"host", "imap." + id + ".example"},
            {"port", 993},
            {"ssl", true},
            {"username", user},
            {"smtp_host", "smtp." + id + ".example"},
            {"smtp_port", 587},
            {"smtp_ssl", false},
            {"permissions",
             Mapping{{"read", true}, {"send", id == "work"}, {"delete", false}, {"move", true}}}};
  if (with_threshold)
    a.set("protection", Mapping{{"threshold", 0.75}});
  return a;
}

static bool round_trips(const Mapping &doc, const char *what) {
  const std::string text = rnoecfg::dump(doc);
  const Value back = rnoecfg::parse_document(text);
  if (!(back == Value(doc))) {
    std::cerr << what << ": load(dump(v)) != v\n" << text;
    return false;
  }
  if (rnoecfg::dump(back.as_mapping()) != text) {
    std::cerr << what << ": dump(load(dump(v))) != dump(v)\n";
    return false;
  }
  return true;
}

int main() {
  // Config document with two accounts, order preserved
  const Mapping doc{{"protection", Mapping{{"threshold", 0.5}}},
                    {"accounts", Sequence{make_account("work", "me@work.example", false),
                                          make_account("home", "me@home.example", true)}}};
  if (!round_trips(doc, "config document")) return 1;
  {
    const Value back = rnoecfg::parse_document(rnoecfg::dump(doc));
    const auto &accounts = back.as_mapping().find("accounts")->as_sequence();
    if (accounts.size() != 2 || accounts[0].as_mapping().find("id")->as_string() != "work" ||
        accounts[1].as_mapping().find("id")->as_string() != "home") {
      std::cerr << "account order changed\n";
      return 1;
    }
  }

  // Strings that look like other kinds, and awkward characters
  const Mapping strings{{"bool_word", "true"},
                        {"null_word", "null"},
                        {"yes_word", "yes"},
                        {"number", "587"},
                        {"float", "0.5"},
                        {"empty", ""},
                        {"padded", "  x  "},
                        {"colon", "a: b"},
                        {"quote", "say \"hi\""},
                        {"backslash", "C:\\dir\\"},
                        {"hash", "#tag"},
                        {"dash", "- item"},
                        {"url", "https://example.com/x"},
                        {"unicode", "caf\xc3\xa9"}};
  if (!round_trips(strings, "strings")) return 1;

  // Numbers keep their kind
  const Mapping numbers{{"int", 42}, {"neg", -7}, {"zero", 0}, {"one", 1.0},
                        {"half", 0.5}, {"big", 1e20}, {"tiny", 1.5e-9}};
  if (!round_trips(numbers, "numbers")) return 1;

  // Sequences in the shapes the tool writes
  const Mapping lists{
      {"scalars", Sequence{"a", 1, 2.5, false, Value{}, "true"}},
      {"items", Sequence{Mapping{{"a", 1}, {"b", "x"}, {"c", true}},
                         Mapping{{"a", 2}, {"b", "y"}, {"c", false}}}},
      {"first_block", Sequence{Mapping{{"permissions", Mapping{{"read", true}}}, {"id", "x"}},
                               Mapping{{"tags", Sequence{"p", "q"}}, {"id", "y"}}}},
      {"deep", Mapping{{"l", Sequence{Mapping{{"m", Mapping{{"n", Sequence{1, 2}}}}}}}}}};
  if (!round_trips(lists, "lists")) return 1;

  // Keys needing quotes
  if (!round_trips(Mapping{{"true", 1}, {"a: b", 2}, {"587", "x"}}, "quoted keys")) return 1;

  // Keys that begin like a list item
  if (!round_trips(Mapping{{"- x", 1}}, "dash key at root")) return 1;
  if (!round_trips(Mapping{{"a", 1}, {"- b", 2}}, "dash key after a field")) return 1;
  if (!round_trips(Mapping{{"s", Sequence{Mapping{{"k", 1}, {"- y", 2}}}}}, "dash key in an item"))
    return 1;
  if (!round_trips(Mapping{{"s", Sequence{Mapping{{"- z", Mapping{{"n", 1}}}}}}},
                   "dash key leading an item"))
    return 1;
  if (rnoecfg::dump(Mapping{{"- x", 1}}) != "\"- x\": 1\n") {
    std::cerr << "dash key written bare\n";
    return 1;
  }
  if (!round_trips(Mapping{{"-", 1}, {"-x", 2}}, "plain dash keys")) return 1;

  // Known limitation: an empty collection comes back as null
  {
    const Value back = rnoecfg::parse_document(rnoecfg::dump(Mapping{{"accounts", Sequence{}}}));
    if (!(back == Value(Mapping{{"accounts", Value{}}}))) {
      std::cerr << "empty list no longer reads back as null\n";
      return 1;
    }
    const Value back2 = rnoecfg::parse_document(rnoecfg::dump(Mapping{{"protection", Mapping{}}}));
    if (!(back2 == Value(Mapping{{"protection", Value{}}}))) {
      std::cerr << "empty mapping no longer reads back as null\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}

#include "rnoecfg/error.hpp"
#include "rnoecfg/scalar.hpp"

#include <iostream>
#include <string>

using rnoecfg::Value;

static bool expect_format(const Value &v, const std::string &want) {
  const std::string got = rnoecfg::format_scalar(v);
  if (got != want) {
    std::cerr << "format_scalar: got [" << got << "] want [" << want << "]\n";
    return false;
  }
  return true;
}

static bool expect_parse(const std::string &text, const Value &want) {
  const Value got = rnoecfg::parse_scalar(text);
  if (!(got == want)) {
    std::cerr << "parse_scalar(" << text << "): got kind " << rnoecfg::kind_name(got.kind())
              << " [" << (got.is_scalar() ? rnoecfg::format_scalar(got) : "?") << "]\n";
    return false;
  }
  return true;
}

int main() {
  // typed values
  if (!expect_format(Value(true), "true")) return 1;
  if (!expect_format(Value(false), "false")) return 1;
  if (!expect_format(Value{}, "null")) return 1;
  if (!expect_format(Value(587), "587")) return 1;
  if (!expect_format(Value(-12), "-12")) return 1;
  if (!expect_format(Value(0.5), "0.5")) return 1;
  if (!expect_format(Value(1.0), "1.0")) return 1;

  // strings: bare when unambiguous, quoted otherwise
  if (!expect_format(Value("hello"), "hello")) return 1;
  if (!expect_format(Value("imap.example.com"), "imap.example.com")) return 1;
  if (!expect_format(Value(""), "\"\"")) return 1;
  if (!expect_format(Value(" padded"), "\" padded\"")) return 1;
  if (!expect_format(Value("true"), "\"true\"")) return 1;
  if (!expect_format(Value("Yes"), "\"Yes\"")) return 1;
  if (!expect_format(Value("off"), "\"off\"")) return 1;
  if (!expect_format(Value("587"), "\"587\"")) return 1;
  if (!expect_format(Value("1e5"), "\"1e5\"")) return 1;
  if (!expect_format(Value("me@example.com"), "\"me@example.com\"")) return 1;
  if (!expect_format(Value("a: b"), "\"a: b\"")) return 1;
  if (!expect_format(Value("say \"hi\""), "\"say \\\"hi\\\"\"")) return 1;
  if (!expect_format(Value("C:\\dir"), "\"C:\\\\dir\"")) return 1;

  // parsing
  if (!expect_parse("587", Value(587))) return 1;
  if (!expect_parse("+7", Value(7))) return 1;
  if (!expect_parse("-3", Value(-3))) return 1;
  if (!expect_parse("0.5", Value(0.5))) return 1;
  if (!expect_parse("1e3", Value(1000.0))) return 1;
  if (!expect_parse("99999999999999999999", Value(1e20))) return 1;
  if (!expect_parse("true", Value(true))) return 1;
  if (!expect_parse("FALSE", Value(false))) return 1;
  if (!expect_parse("Null", Value{})) return 1;
  if (!expect_parse("yes", Value("yes"))) return 1;
  if (!expect_parse("off", Value("off"))) return 1;
  if (!expect_parse("  spaced out  ", Value("spaced out"))) return 1;
  if (!expect_parse("\"true\"", Value("true"))) return 1;
  if (!expect_parse("'587'", Value("587"))) return 1;
  if (!expect_parse("\"a \\\"b\\\" \\\\c\"", Value("a \"b\" \\c"))) return 1;
  if (!expect_parse("\"", Value("\""))) return 1;
  if (!expect_parse("", Value(""))) return 1;
  if (!expect_parse("0x1A", Value("0x1A"))) return 1;
  if (!expect_parse("+-5", Value("+-5"))) return 1;

  // quoting protects strings that look like other kinds
  for (const char *s : {"true", "null", "587", "0.5", "no", "", " x ", "a#b", "back\\slash"}) {
    const Value back = rnoecfg::parse_scalar(rnoecfg::format_scalar(Value(s)));
    if (!(back == Value(s))) {
      std::cerr << "string did not survive quoting: [" << s << "]\n";
      return 1;
    }
  }
  // and floats keep their kind
  for (double d : {1.0, -0.25, 1e20, 123456.789}) {
    const Value back = rnoecfg::parse_scalar(rnoecfg::format_scalar(Value(d)));
    if (back.kind() != Value::Kind::Float || back.as_float() != d) {
      std::cerr << "float did not survive: " << d << "\n";
      return 1;
    }
  }

  // collections are not scalars
  bool threw = false;
  try {
    (void)rnoecfg::format_scalar(Value(rnoecfg::Sequence{}));
  } catch (const rnoecfg::ConfigError &e) {
    threw = e.kind() == rnoecfg::ErrorKind::Unrepresentable;
  }
  if (!threw) {
    std::cerr << "format_scalar accepted a sequence\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

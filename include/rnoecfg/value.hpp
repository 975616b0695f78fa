#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rnoecfg {

class Value;

using Sequence = std::vector<Value>;

// Ordered key/value list. Keys are unique; order is insertion order
// (the account list order is part of the persisted data).
class Mapping {
public:
  using entry = std::pair<std::string, Value>;

  Mapping();
  Mapping(std::initializer_list<entry> init);

  [[nodiscard]] bool empty() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const std::vector<entry> &entries() const;

  [[nodiscard]] bool contains(std::string_view key) const;
  [[nodiscard]] const Value *find(std::string_view key) const;
  Value *find(std::string_view key);

  // Overwrite in place if present, otherwise append.
  Value &set(std::string key, Value value);
  // Returns false when the key was absent.
  bool erase(std::string_view key);

  friend bool operator==(const Mapping &a, const Mapping &b);

private:
  std::vector<entry> entries_;
};

class Value {
public:
  enum class Kind { Null, Bool, Int, Float, String, Mapping, Sequence };

  using storage =
      std::variant<std::monostate, bool, std::int64_t, double, std::string, Mapping, Sequence>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : data_(b) {}
  Value(int i) : data_(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : data_(i) {}
  Value(double d) : data_(d) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(std::string_view s) : data_(std::string(s)) {}
  Value(const char *s) : data_(std::string(s)) {}
  Value(Mapping m) : data_(std::move(m)) {}
  Value(Sequence s) : data_(std::move(s)) {}

  [[nodiscard]] Kind kind() const { return static_cast<Kind>(data_.index()); }
  [[nodiscard]] bool is_null() const { return kind() == Kind::Null; }
  [[nodiscard]] bool is_scalar() const {
    return kind() != Kind::Mapping && kind() != Kind::Sequence;
  }

  // Typed access; throws std::runtime_error on a kind mismatch.
  [[nodiscard]] bool as_bool() const;
  [[nodiscard]] std::int64_t as_int() const;
  [[nodiscard]] double as_float() const;
  [[nodiscard]] const std::string &as_string() const;
  [[nodiscard]] const Mapping &as_mapping() const;
  Mapping &as_mapping();
  [[nodiscard]] const Sequence &as_sequence() const;
  Sequence &as_sequence();

  [[nodiscard]] const storage &data() const { return data_; }

  friend bool operator==(const Value &a, const Value &b);

private:
  storage data_;
};

std::string_view kind_name(Value::Kind kind);

} // namespace rnoecfg

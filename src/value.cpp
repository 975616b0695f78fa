#include "rnoecfg/value.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace rnoecfg {

namespace {

template <typename T>
auto typed(const Value::storage &data, Value::Kind want) -> const T & {
  const T *p = std::get_if<T>(&data);
  if (!p) {
    throw std::runtime_error("value is " +
                             std::string(kind_name(static_cast<Value::Kind>(data.index()))) +
                             ", expected " + std::string(kind_name(want)));
  }
  return *p;
}

} // namespace

// ——— Mapping ———

Mapping::Mapping() = default;

Mapping::Mapping(std::initializer_list<entry> init) {
  for (const auto &e : init) {
    set(e.first, e.second);
  }
}

bool Mapping::empty() const { return entries_.empty(); }

std::size_t Mapping::size() const { return entries_.size(); }

const std::vector<Mapping::entry> &Mapping::entries() const { return entries_; }

bool Mapping::contains(std::string_view key) const { return find(key) != nullptr; }

const Value *Mapping::find(std::string_view key) const {
  const auto it = std::ranges::find_if(entries_, [&](const entry &e) { return e.first == key; });
  return it == entries_.end() ? nullptr : &it->second;
}

Value *Mapping::find(std::string_view key) {
  const auto it = std::ranges::find_if(entries_, [&](const entry &e) { return e.first == key; });
  return it == entries_.end() ? nullptr : &it->second;
}

Value &Mapping::set(std::string key, Value value) {
  if (Value *existing = find(key)) {
    *existing = std::move(value);
    return *existing;
  }
  entries_.emplace_back(std::move(key), std::move(value));
  return entries_.back().second;
}

bool Mapping::erase(std::string_view key) {
  const auto it = std::ranges::find_if(entries_, [&](const entry &e) { return e.first == key; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

bool operator==(const Mapping &a, const Mapping &b) { return a.entries_ == b.entries_; }

// ——— Value ———

bool Value::as_bool() const { return typed<bool>(data_, Kind::Bool); }

std::int64_t Value::as_int() const { return typed<std::int64_t>(data_, Kind::Int); }

double Value::as_float() const { return typed<double>(data_, Kind::Float); }

const std::string &Value::as_string() const { return typed<std::string>(data_, Kind::String); }

const Mapping &Value::as_mapping() const { return typed<Mapping>(data_, Kind::Mapping); }

Mapping &Value::as_mapping() {
  return const_cast<Mapping &>(typed<Mapping>(data_, Kind::Mapping));
}

const Sequence &Value::as_sequence() const { return typed<Sequence>(data_, Kind::Sequence); }

Sequence &Value::as_sequence() {
  return const_cast<Sequence &>(typed<Sequence>(data_, Kind::Sequence));
}

bool operator==(const Value &a, const Value &b) { return a.data_ == b.data_; }

std::string_view kind_name(Value::Kind kind) {
  switch (kind) {
  case Value::Kind::Null:
    return "null";
  case Value::Kind::Bool:
    return "bool";
  case Value::Kind::Int:
    return "int";
  case Value::Kind::Float:
    return "float";
  case Value::Kind::String:
    return "string";
  case Value::Kind::Mapping:
    return "mapping";
  case Value::Kind::Sequence:
    return "sequence";
  }
  return "unknown";
}

} // namespace rnoecfg

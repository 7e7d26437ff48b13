#include "plist_value.hpp"

#include <cstddef>
#include <stdexcept>

#include "plist_error.hpp"

namespace plistkit {

const char *typeName(ValueType type) {
  switch (type) {
  case ValueType::Null:
    return "null";
  case ValueType::Boolean:
    return "boolean";
  case ValueType::Integer:
    return "integer";
  case ValueType::Real:
    return "real";
  case ValueType::String:
    return "string";
  case ValueType::Date:
    return "date";
  case ValueType::Data:
    return "data";
  case ValueType::Uid:
    return "uid";
  case ValueType::Array:
    return "array";
  case ValueType::Dict:
    return "dict";
  case ValueType::Set:
    return "set";
  }
  return "unknown";
}

// ============================================================================
// DICT
// ============================================================================

Dict::Dict() = default;

Dict::Dict(std::initializer_list<Entry> entries) {
  for (const auto &entry : entries) {
    set(entry.first, entry.second);
  }
}

Value *Dict::find(const std::string &key) {
  auto it = mIndex.find(key);
  return it == mIndex.end() ? nullptr : &mEntries[it->second].second;
}

const Value *Dict::find(const std::string &key) const {
  auto it = mIndex.find(key);
  return it == mIndex.end() ? nullptr : &mEntries[it->second].second;
}

bool Dict::contains(const std::string &key) const {
  return find(key) != nullptr;
}

Value &Dict::at(const std::string &key) {
  Value *value = find(key);
  if (value == nullptr) {
    throw std::out_of_range("Dict has no key '" + key + "'");
  }
  return *value;
}

const Value &Dict::at(const std::string &key) const {
  const Value *value = find(key);
  if (value == nullptr) {
    throw std::out_of_range("Dict has no key '" + key + "'");
  }
  return *value;
}

bool Dict::set(const std::string &key, Value value) {
  Value *existing = find(key);
  if (existing != nullptr) {
    *existing = std::move(value);
    return false;
  }
  mIndex.emplace(key, mEntries.size());
  mEntries.emplace_back(key, std::move(value));
  return true;
}

Value &Dict::operator[](const std::string &key) {
  Value *existing = find(key);
  if (existing != nullptr) {
    return *existing;
  }
  mIndex.emplace(key, mEntries.size());
  mEntries.emplace_back(key, Value());
  return mEntries.back().second;
}

bool Dict::erase(const std::string &key) {
  auto it = mIndex.find(key);
  if (it == mIndex.end()) {
    return false;
  }
  size_t pos = it->second;
  mIndex.erase(it);
  mEntries.erase(mEntries.begin() + static_cast<std::ptrdiff_t>(pos));
  for (size_t i = pos; i < mEntries.size(); ++i) {
    mIndex[mEntries[i].first] = i;
  }
  return true;
}

std::size_t Dict::size() const { return mEntries.size(); }

bool Dict::empty() const { return mEntries.empty(); }

Dict::const_iterator Dict::begin() const { return mEntries.begin(); }

Dict::const_iterator Dict::end() const { return mEntries.end(); }

bool Dict::operator==(const Dict &other) const {
  if (mEntries.size() != other.mEntries.size()) {
    return false;
  }
  for (const auto &entry : mEntries) {
    const Value *theirs = other.find(entry.first);
    if (theirs == nullptr || !(*theirs == entry.second)) {
      return false;
    }
  }
  return true;
}

// multiset comparison, sets are small and unhashable
bool Set::operator==(const Set &other) const {
  if (items.size() != other.items.size()) {
    return false;
  }
  std::vector<bool> used(other.items.size(), false);
  for (const auto &item : items) {
    bool matched = false;
    for (size_t i = 0; i < other.items.size(); ++i) {
      if (!used[i] && other.items[i] == item) {
        used[i] = true;
        matched = true;
        break;
      }
    }
    if (!matched) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// VALUE
// ============================================================================

namespace {

template <typename T, typename Storage>
auto &checkedGet(Storage &storage, ValueType expected) {
  auto *value = std::get_if<T>(&storage);
  if (value == nullptr) {
    throw ValueTypeError(
        std::string("Value is ") +
        typeName(static_cast<ValueType>(storage.index())) + ", not " +
        typeName(expected));
  }
  return *value;
}

} // anonymous namespace

bool Value::asBool() const {
  return checkedGet<bool>(mStorage, ValueType::Boolean);
}

int64_t Value::asInteger() const {
  return checkedGet<int64_t>(mStorage, ValueType::Integer);
}

double Value::asReal() const {
  return checkedGet<double>(mStorage, ValueType::Real);
}

const std::string &Value::asString() const {
  return checkedGet<std::string>(mStorage, ValueType::String);
}

Date Value::asDate() const {
  return checkedGet<Date>(mStorage, ValueType::Date);
}

const Data &Value::asData() const {
  return checkedGet<Data>(mStorage, ValueType::Data);
}

Uid Value::asUid() const {
  return checkedGet<Uid>(mStorage, ValueType::Uid);
}

const Array &Value::asArray() const {
  return checkedGet<Array>(mStorage, ValueType::Array);
}

Array &Value::asArray() { return checkedGet<Array>(mStorage, ValueType::Array); }

const Dict &Value::asDict() const {
  return checkedGet<Dict>(mStorage, ValueType::Dict);
}

Dict &Value::asDict() { return checkedGet<Dict>(mStorage, ValueType::Dict); }

const Set &Value::asSet() const {
  return checkedGet<Set>(mStorage, ValueType::Set);
}

Set &Value::asSet() { return checkedGet<Set>(mStorage, ValueType::Set); }

bool Value::empty() const {
  switch (type()) {
  case ValueType::Null:
    return true;
  case ValueType::String:
    return asString().empty();
  case ValueType::Data:
    return asData().empty();
  case ValueType::Array:
    return asArray().empty();
  case ValueType::Dict:
    return asDict().empty();
  case ValueType::Set:
    return asSet().items.empty();
  default:
    return false;
  }
}

bool Value::operator==(const Value &other) const {
  return mStorage == other.mStorage;
}

// ============================================================================
// CONTAINER UPDATE
// ============================================================================

namespace {

void applyUpdate(Value &slot, std::optional<Value> &value, const MergeOp &op) {
  if (op) {
    std::optional<Value> merged = op(slot, value ? &*value : nullptr);
    value = std::move(merged);
  }
  if (value) {
    slot = std::move(*value);
  }
}

} // anonymous namespace

void updateAt(Dict &dict, const std::string &key, std::optional<Value> value,
              std::optional<Value> defaultValue, const MergeOp &op) {
  if (defaultValue && !dict.contains(key)) {
    dict.set(key, std::move(*defaultValue));
  }
  Value *slot = dict.find(key);
  if (slot == nullptr) {
    if (op) {
      throw std::out_of_range("updateAt: no key '" + key + "'");
    }
    if (value) {
      dict.set(key, std::move(*value));
    }
    return;
  }
  applyUpdate(*slot, value, op);
}

void updateAt(Array &array, std::size_t index, std::optional<Value> value,
              std::optional<Value> defaultValue, const MergeOp &op) {
  if (defaultValue && index == array.size()) {
    array.push_back(std::move(*defaultValue));
  }
  if (index >= array.size()) {
    throw std::out_of_range("updateAt: index " + std::to_string(index) +
                            " out of range");
  }
  applyUpdate(array[index], value, op);
}

} // namespace plistkit

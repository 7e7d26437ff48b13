#ifndef PLISTKIT_VALUE_HPP
#define PLISTKIT_VALUE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace plistkit {

class Value;

/**
 * @enum ValueType
 * @brief Variant tag of a Value. The order matches Value's storage.
 */
enum class ValueType {
    Null,
    Boolean,
    Integer,
    Real,
    String,
    Date,
    Data,
    Uid,
    Array,
    Dict,
    Set,
};

/// Name used in error messages, e.g. "array".
const char* typeName(ValueType type);

/// UTC timestamp with one-second resolution.
using Date = std::chrono::sys_seconds;

/// Opaque byte blob.
using Data = std::vector<uint8_t>;

using Array = std::vector<Value>;

/// Plist object reference, written to XML as {"CF$UID": n}.
struct Uid {
    uint64_t value = 0;

    bool operator==(const Uid& other) const { return value == other.value; }
};

/**
 * @class Dict
 * @brief String-keyed map that keeps insertion order.
 *
 * Order is kept so that re-encoding a decoded document is stable; it does
 * not take part in equality. Lookups go through a hash index over the keys,
 * so iteration is read-only; values are changed through at(), find(),
 * set() or operator[].
 */
class Dict {
   public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Dict();
    Dict(std::initializer_list<Entry> entries);

    Value* find(const std::string& key);
    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const;

    /**
     * @brief Access an existing entry.
     * @throws std::out_of_range if the key is absent
     */
    Value& at(const std::string& key);
    const Value& at(const std::string& key) const;

    /**
     * @brief Insert or replace.
     *
     * A replaced entry keeps its position.
     *
     * @return true if the key was new
     */
    bool set(const std::string& key, Value value);

    /// Returns the entry for @p key, inserting Null if absent.
    Value& operator[](const std::string& key);

    /// Removes @p key; later entries keep their relative order.
    bool erase(const std::string& key);

    std::size_t size() const;
    bool empty() const;

    const_iterator begin() const;
    const_iterator end() const;

    bool operator==(const Dict& other) const;

   private:
    std::vector<Entry> mEntries;
    std::unordered_map<std::string, std::size_t> mIndex;
};

/**
 * @struct Set
 * @brief Unordered collection; only binary plists can produce one.
 */
struct Set {
    std::vector<Value> items;

    bool operator==(const Set& other) const;
};

/**
 * @class Value
 * @brief Recursive tagged value holding one node of a plist tree.
 *
 * @code
 * plistkit::Dict d;
 * d.set("catalogs", plistkit::Array{plistkit::Value("production")});
 * plistkit::Value root(std::move(d));
 * root.asDict().at("catalogs").asArray().size();  // 1
 * @endcode
 */
class Value {
   public:
    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : mStorage(v) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T v) : mStorage(static_cast<int64_t>(v)) {}

    Value(double v) : mStorage(v) {}
    Value(const char* v) : mStorage(std::string(v)) {}
    Value(std::string v) : mStorage(std::move(v)) {}
    Value(Date v) : mStorage(v) {}
    Value(Data v) : mStorage(std::move(v)) {}
    Value(Uid v) : mStorage(v) {}
    Value(Array v) : mStorage(std::move(v)) {}
    Value(Dict v) : mStorage(std::move(v)) {}
    Value(Set v) : mStorage(std::move(v)) {}

    ValueType type() const { return static_cast<ValueType>(mStorage.index()); }

    bool isNull() const { return type() == ValueType::Null; }
    bool isBool() const { return type() == ValueType::Boolean; }
    bool isInteger() const { return type() == ValueType::Integer; }
    bool isReal() const { return type() == ValueType::Real; }
    bool isString() const { return type() == ValueType::String; }
    bool isDate() const { return type() == ValueType::Date; }
    bool isData() const { return type() == ValueType::Data; }
    bool isUid() const { return type() == ValueType::Uid; }
    bool isArray() const { return type() == ValueType::Array; }
    bool isDict() const { return type() == ValueType::Dict; }
    bool isSet() const { return type() == ValueType::Set; }

    /**
     * @name Typed accessors
     * @throws ValueTypeError if the value holds another type
     * @{
     */
    bool asBool() const;
    int64_t asInteger() const;
    double asReal() const;
    const std::string& asString() const;
    Date asDate() const;
    const Data& asData() const;
    Uid asUid() const;
    const Array& asArray() const;
    Array& asArray();
    const Dict& asDict() const;
    Dict& asDict();
    const Set& asSet() const;
    Set& asSet();
    /** @} */

    /// True for Null and for empty strings, data and containers.
    bool empty() const;

    bool operator==(const Value& other) const;

   private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Date, Data, Uid, Array, Dict,
                 Set>
        mStorage;
};

/**
 * @brief Merge operation for updateAt().
 *
 * Receives the current slot and the incoming value (nullptr when none was
 * given). A returned value is stored in the slot; std::nullopt means the
 * operation already dealt with the slot.
 */
using MergeOp = std::function<std::optional<Value>(Value& current, const Value* value)>;

/**
 * @brief Update a dictionary entry with an optional default and merge op.
 *
 * @param dict Dictionary to modify
 * @param key Entry to update
 * @param value Value to store, if any
 * @param defaultValue Stored first when @p key is absent
 * @param op Merge operation applied to the current entry
 * @throws std::out_of_range if @p op is given, @p key is absent and there is no default
 *
 * @code
 * // append to an array entry, creating it on first use
 * updateAt(dict, "catalogs", Value("testing"), Value(Array{}),
 *          [](Value& cur, const Value* v) -> std::optional<Value> {
 *              cur.asArray().push_back(*v);
 *              return std::nullopt;
 *          });
 * @endcode
 */
void updateAt(Dict& dict, const std::string& key, std::optional<Value> value,
              std::optional<Value> defaultValue = std::nullopt, const MergeOp& op = nullptr);

/**
 * @brief Array counterpart of the dictionary overload.
 *
 * An index equal to size() counts as absent; the default is appended there.
 *
 * @throws std::out_of_range if the index is past the end, or absent without a default
 */
void updateAt(Array& array, std::size_t index, std::optional<Value> value,
              std::optional<Value> defaultValue = std::nullopt, const MergeOp& op = nullptr);

}  // namespace plistkit

#endif  // PLISTKIT_VALUE_HPP

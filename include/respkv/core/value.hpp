#ifndef RESPKV_CORE_VALUE_HPP
#define RESPKV_CORE_VALUE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace respkv::core {

/*
    the single data shape that crosses the wire in either direction.
    one alternative per protocol tag, plus Null for the null bulk string ($-1).
    SimpleString and BulkString both carry raw bytes; they only differ in framing.
*/
struct Null {};

struct SimpleString {
    std::string data;
};

struct Error {
    std::string message;
};

struct BulkString {
    std::string data;
};

class Value;

using Array = std::vector<Value>;
// insertion ordered, keys unique. build through Value::map() to get last-write-wins
using Map = std::vector<std::pair<Value, Value>>;

enum class ValueType : uint8_t {
    Null,
    SimpleString,
    Error,
    Integer,
    BulkString,
    Array,
    Map,
};

class Value {
   public:
    // alternative order must match ValueType
    using Storage = std::variant<Null, SimpleString, Error, int64_t, BulkString, Array, Map>;

    Value() = default;
    explicit Value(Storage storage) : storage_(std::move(storage)) {}

    static Value null();
    static Value simple_string(std::string data);
    static Value error(std::string message);
    static Value integer(int64_t value);
    static Value bulk_string(std::string data);
    static Value array(Array items);
    // duplicate keys collapse into the first slot, holding the last value seen
    static Value map(Map pairs);

    [[nodiscard]] ValueType type() const noexcept;

    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] bool is_integer() const noexcept;
    [[nodiscard]] bool is_array() const noexcept;
    [[nodiscard]] bool is_map() const noexcept;
    // SimpleString or BulkString
    [[nodiscard]] bool is_string() const noexcept;

    // accessors throw std::bad_variant_access on a type mismatch
    [[nodiscard]] std::string_view as_string() const;
    [[nodiscard]] const std::string& as_error() const;
    [[nodiscard]] int64_t as_integer() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] const Map& as_map() const;

    [[nodiscard]] const Storage& storage() const noexcept {
        return storage_;
    }

    // structural equality. both string kinds compare by bytes, maps ignore order
    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) {
        return !(lhs == rhs);
    }

   private:
    Storage storage_;
};

// human readable rendering, used in log lines and test failure output
std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace respkv::core

#endif

#include "respkv/core/value.hpp"

#include <functional>
#include <optional>
#include <unordered_map>

namespace respkv::core {

namespace {

struct Printer {
    std::ostream& os;

    void operator()(const Null&) const {
        os << "(nil)";
    }
    void operator()(const SimpleString& s) const {
        os << '"' << s.data << '"';
    }
    void operator()(const Error& e) const {
        os << "(error) " << e.message;
    }
    void operator()(int64_t i) const {
        os << "(integer) " << i;
    }
    void operator()(const BulkString& s) const {
        os << '"' << s.data << '"';
    }
    void operator()(const Array& items) const {
        os << '[';
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) os << ", ";
            os << items[i];
        }
        os << ']';
    }
    void operator()(const Map& pairs) const {
        os << '{';
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            if (i > 0) os << ", ";
            os << pairs[i].first << ": " << pairs[i].second;
        }
        os << '}';
    }
};

std::size_t hash_value(const Value& value);

std::size_t hash_combine(std::size_t seed, std::size_t hash) {
    return seed ^ (hash + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

// must agree with operator==: both string kinds hash by bytes, maps ignore order
struct Hasher {
    std::size_t operator()(const Null&) const {
        return 0x6e756c6cULL;
    }
    std::size_t operator()(const SimpleString& s) const {
        return std::hash<std::string_view>{}(s.data);
    }
    std::size_t operator()(const Error& e) const {
        return hash_combine('-', std::hash<std::string_view>{}(e.message));
    }
    std::size_t operator()(int64_t i) const {
        return hash_combine(':', std::hash<int64_t>{}(i));
    }
    std::size_t operator()(const BulkString& s) const {
        return std::hash<std::string_view>{}(s.data);
    }
    std::size_t operator()(const Array& items) const {
        std::size_t seed = hash_combine('*', items.size());
        for (const auto& item : items) {
            seed = hash_combine(seed, hash_value(item));
        }
        return seed;
    }
    std::size_t operator()(const Map& pairs) const {
        std::size_t sum = 0;
        for (const auto& [key, value] : pairs) {
            sum += hash_combine(hash_value(key), hash_value(value));
        }
        return hash_combine('%', sum);
    }
};

std::size_t hash_value(const Value& value) {
    if (value.storage().valueless_by_exception()) {
        return 0;
    }
    return std::visit(Hasher{}, value.storage());
}

// hash index over the keys of a Map, by slot. the map may grow while indexed
class KeySlots {
   public:
    explicit KeySlots(const Map& pairs) : pairs_(pairs) {}

    std::optional<std::size_t> find(const Value& key, std::size_t hash) const {
        auto [first, last] = slots_.equal_range(hash);
        for (; first != last; ++first) {
            if (pairs_[first->second].first == key) {
                return first->second;
            }
        }
        return std::nullopt;
    }

    void add(std::size_t hash, std::size_t slot) {
        slots_.emplace(hash, slot);
    }

   private:
    const Map& pairs_;
    std::unordered_multimap<std::size_t, std::size_t> slots_;
};

bool maps_equal(const Map& lhs, const Map& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    KeySlots index(rhs);
    for (std::size_t slot = 0; slot < rhs.size(); ++slot) {
        index.add(hash_value(rhs[slot].first), slot);
    }
    for (const auto& [key, value] : lhs) {
        auto slot = index.find(key, hash_value(key));
        if (!slot || !(rhs[*slot].second == value)) {
            return false;
        }
    }
    return true;
}

}  // namespace

Value Value::null() {
    return Value(Null{});
}

Value Value::simple_string(std::string data) {
    return Value(SimpleString{std::move(data)});
}

Value Value::error(std::string message) {
    return Value(Error{std::move(message)});
}

Value Value::integer(int64_t value) {
    return Value(Storage(std::in_place_type<int64_t>, value));
}

Value Value::bulk_string(std::string data) {
    return Value(BulkString{std::move(data)});
}

Value Value::array(Array items) {
    return Value(Storage(std::in_place_type<Array>, std::move(items)));
}

Value Value::map(Map pairs) {
    Map unique;
    unique.reserve(pairs.size());
    KeySlots index(unique);
    for (auto& [key, value] : pairs) {
        std::size_t hash = hash_value(key);
        if (auto slot = index.find(key, hash)) {
            unique[*slot].second = std::move(value);
        } else {
            index.add(hash, unique.size());
            unique.emplace_back(std::move(key), std::move(value));
        }
    }
    return Value(Storage(std::in_place_type<Map>, std::move(unique)));
}

ValueType Value::type() const noexcept {
    return static_cast<ValueType>(storage_.index());
}

bool Value::is_null() const noexcept {
    return std::holds_alternative<Null>(storage_);
}

bool Value::is_error() const noexcept {
    return std::holds_alternative<Error>(storage_);
}

bool Value::is_integer() const noexcept {
    return std::holds_alternative<int64_t>(storage_);
}

bool Value::is_array() const noexcept {
    return std::holds_alternative<Array>(storage_);
}

bool Value::is_map() const noexcept {
    return std::holds_alternative<Map>(storage_);
}

bool Value::is_string() const noexcept {
    return std::holds_alternative<SimpleString>(storage_) ||
           std::holds_alternative<BulkString>(storage_);
}

std::string_view Value::as_string() const {
    if (const auto* simple = std::get_if<SimpleString>(&storage_)) {
        return simple->data;
    }
    return std::get<BulkString>(storage_).data;
}

const std::string& Value::as_error() const {
    return std::get<Error>(storage_).message;
}

int64_t Value::as_integer() const {
    return std::get<int64_t>(storage_);
}

const Array& Value::as_array() const {
    return std::get<Array>(storage_);
}

const Map& Value::as_map() const {
    return std::get<Map>(storage_);
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.is_string() && rhs.is_string()) {
        return lhs.as_string() == rhs.as_string();
    }
    if (lhs.type() != rhs.type()) {
        return false;
    }
    switch (lhs.type()) {
        case ValueType::Null:
            return true;
        case ValueType::Error:
            return lhs.as_error() == rhs.as_error();
        case ValueType::Integer:
            return lhs.as_integer() == rhs.as_integer();
        case ValueType::Array:
            return lhs.as_array() == rhs.as_array();
        case ValueType::Map:
            return maps_equal(lhs.as_map(), rhs.as_map());
        case ValueType::SimpleString:
        case ValueType::BulkString:
            break;
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    if (value.storage().valueless_by_exception()) {
        return os << "(valueless)";
    }
    std::visit(Printer{os}, value.storage());
    return os;
}

}  // namespace respkv::core

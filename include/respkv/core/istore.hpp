#ifndef RESPKV_CORE_ISTORE_HPP
#define RESPKV_CORE_ISTORE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "respkv/core/value.hpp"

namespace respkv::core {

class IStore {
   public:
    virtual ~IStore() = default;

    virtual void set(std::string_view key, Value value) = 0;
    // applies pairs left to right as one atomic step, returns the number of pairs applied
    virtual std::size_t set_many(std::vector<std::pair<std::string, Value>> pairs) = 0;

    [[nodiscard]] virtual std::optional<Value> get(std::string_view key) const = 0;
    // one lookup per key, same order as the input
    [[nodiscard]] virtual std::vector<std::optional<Value>> get_many(
        const std::vector<std::string>& keys) const = 0;

    [[nodiscard]] virtual bool remove(std::string_view key) = 0;
    [[nodiscard]] virtual bool contains(std::string_view key) const = 0;
    [[nodiscard]] virtual std::size_t size() const = 0;
    [[nodiscard]] virtual bool empty() const = 0;

    // returns the number of entries removed
    virtual std::size_t clear() = 0;
};

}  // namespace respkv::core

#endif

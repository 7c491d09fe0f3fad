#ifndef RESPKV_CORE_STORE_HPP
#define RESPKV_CORE_STORE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "respkv/core/istore.hpp"
#include "respkv/core/value.hpp"

namespace respkv::core {

/*
    in-memory store guarded by a single mutex. every operation holds the lock for its whole body,
    so operations from different connections never interleave. there is no reader/writer split:
    gets are serialised against each other too.
*/
class Store : public IStore {
   public:
    Store();
    ~Store() override;

    /*
        copies are deleted: the store holds a mutex and is meant to exist exactly once per
        server. moves are fine since the state lives behind a unique_ptr (PIMPL)
    */
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) noexcept;
    Store& operator=(Store&&) noexcept;

    void set(std::string_view key, Value value) override;
    std::size_t set_many(std::vector<std::pair<std::string, Value>> pairs) override;

    [[nodiscard]] std::optional<Value> get(std::string_view key) const override;
    [[nodiscard]] std::vector<std::optional<Value>> get_many(
        const std::vector<std::string>& keys) const override;

    [[nodiscard]] bool remove(std::string_view key) override;
    [[nodiscard]] bool contains(std::string_view key) const override;
    [[nodiscard]] std::size_t size() const override;
    [[nodiscard]] bool empty() const override;

    std::size_t clear() override;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::core

#endif

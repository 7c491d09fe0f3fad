#include "respkv/core/store.hpp"

#include <mutex>
#include <unordered_map>

namespace respkv::core {

class Store::Impl {
   public:
    void set(std::string_view key, Value value) {
        std::lock_guard lock(mutex_);
        data_[std::string(key)] = std::move(value);
    }

    std::size_t set_many(std::vector<std::pair<std::string, Value>> pairs) {
        std::lock_guard lock(mutex_);
        for (auto& [key, value] : pairs) {
            data_[std::move(key)] = std::move(value);
        }
        return pairs.size();
    }

    [[nodiscard]] std::optional<Value> get(std::string_view key) const {
        std::lock_guard lock(mutex_);
        return lookup(key);
    }

    [[nodiscard]] std::vector<std::optional<Value>> get_many(
        const std::vector<std::string>& keys) const {
        std::vector<std::optional<Value>> result;
        result.reserve(keys.size());
        std::lock_guard lock(mutex_);
        for (const auto& key : keys) {
            result.push_back(lookup(key));
        }
        return result;
    }

    [[nodiscard]] bool remove(std::string_view key) {
        std::lock_guard lock(mutex_);
        return data_.erase(std::string(key)) > 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        std::lock_guard lock(mutex_);
        return data_.find(std::string(key)) != data_.end();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return data_.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mutex_);
        return data_.empty();
    }

    std::size_t clear() {
        std::lock_guard lock(mutex_);
        std::size_t count = data_.size();
        data_.clear();
        return count;
    }

   private:
    // caller must hold mutex_
    [[nodiscard]] std::optional<Value> lookup(std::string_view key) const {
        auto it = data_.find(std::string(key));
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Value> data_;
};

Store::Store() : impl_(std::make_unique<Impl>()) {}

Store::~Store() = default;

Store::Store(Store&&) noexcept = default;

Store& Store::operator=(Store&&) noexcept = default;

void Store::set(std::string_view key, Value value) {
    impl_->set(key, std::move(value));
}

std::size_t Store::set_many(std::vector<std::pair<std::string, Value>> pairs) {
    return impl_->set_many(std::move(pairs));
}

std::optional<Value> Store::get(std::string_view key) const {
    return impl_->get(key);
}

std::vector<std::optional<Value>> Store::get_many(const std::vector<std::string>& keys) const {
    return impl_->get_many(keys);
}

bool Store::remove(std::string_view key) {
    return impl_->remove(key);
}

bool Store::contains(std::string_view key) const {
    return impl_->contains(key);
}

std::size_t Store::size() const {
    return impl_->size();
}

bool Store::empty() const {
    return impl_->empty();
}

std::size_t Store::clear() {
    return impl_->clear();
}

}  // namespace respkv::core

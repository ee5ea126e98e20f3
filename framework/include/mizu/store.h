#ifndef MIZU_STORE_H
#define MIZU_STORE_H

#include <any>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace mizu {

/**
 * @brief Heterogeneous key/value bag used for the environment and the per-request store.
 *
 * Routers never copy a Store: the environment travels as shared_ptr<const Store>
 * and the store as shared_ptr<Store>, so writes made by a mounted router are seen
 * by the parent chain and the other way round.
 */
class Store {
public:
    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::make_any<std::decay_t<T>>(std::forward<T>(value));
    }

    template<typename T>
    T get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            throw std::runtime_error("Key not found in store: " + key);
        }
        return std::any_cast<T>(it->second);
    }

    template<typename T>
    std::optional<T> get_opt(const std::string& key) const {
        const auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    bool erase(const std::string& key) { return values_.erase(key) > 0; }
    size_t size() const { return values_.size(); }

private:
    std::unordered_map<std::string, std::any> values_;
};

} // namespace mizu

#endif

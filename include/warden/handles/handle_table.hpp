#pragma once

#include "warden/core/constants.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden::handles {

using Handle = uint64_t;

/**
 * @brief Owns every live instance of one resource kind, addressed by integer handles
 *
 * Handles come from a 64-bit counter that starts at 1 and only moves forward,
 * so a destroyed handle is never issued again. Every operation, reads
 * included, runs under the table's single mutex. Unknown handles are reported
 * as absence (std::nullopt / false), never as undefined behaviour.
 *
 * Access to an item is given through a callable that runs while the lock is
 * held; references to the item never escape the table.
 */
template<typename T>
class HandleTable {
public:
    HandleTable() = default;

    HandleTable(const HandleTable&) = delete;
    HandleTable& operator=(const HandleTable&) = delete;
    HandleTable(HandleTable&&) = delete;
    HandleTable& operator=(HandleTable&&) = delete;

    Handle Create(T item) {
        std::lock_guard guard(lock_);
        const Handle handle = next_handle_++;
        items_.emplace(handle, std::move(item));
        return handle;
    }

    /**
     * @brief Run @p func with a const reference to the item
     * @return func's result, or std::nullopt when the handle is unknown
     */
    template<typename F>
    auto With(const Handle handle, F&& func) const
        -> std::optional<std::invoke_result_t<F, const T&>> {
        std::lock_guard guard(lock_);
        const auto it = items_.find(handle);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return std::forward<F>(func)(it->second);
    }

    template<typename F>
    auto WithMut(const Handle handle, F&& func)
        -> std::optional<std::invoke_result_t<F, T&>> {
        std::lock_guard guard(lock_);
        const auto it = items_.find(handle);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return std::forward<F>(func)(it->second);
    }

    /**
     * @brief Copy of the item, for copyable payloads such as shared_ptr
     */
    std::optional<T> Get(const Handle handle) const
        requires std::copy_constructible<T> {
        std::lock_guard guard(lock_);
        const auto it = items_.find(handle);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Remove the entry and hand ownership back to the caller
     *
     * Of two threads destroying the same handle exactly one receives the item.
     */
    std::optional<T> Destroy(const Handle handle) {
        std::lock_guard guard(lock_);
        const auto it = items_.find(handle);
        if (it == items_.end()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(it->second));
        items_.erase(it);
        return item;
    }

    /**
     * @brief Remove every entry, returning the items for teardown
     */
    std::vector<std::pair<Handle, T>> Drain() {
        std::lock_guard guard(lock_);
        std::vector<std::pair<Handle, T>> drained;
        drained.reserve(items_.size());
        for (auto& [handle, item] : items_) {
            drained.emplace_back(handle, std::move(item));
        }
        items_.clear();
        return drained;
    }

    [[nodiscard]] size_t Count() const {
        std::lock_guard guard(lock_);
        return items_.size();
    }

    [[nodiscard]] bool Contains(const Handle handle) const {
        std::lock_guard guard(lock_);
        return items_.contains(handle);
    }

    [[nodiscard]] std::vector<Handle> Handles() const {
        std::lock_guard guard(lock_);
        std::vector<Handle> handles;
        handles.reserve(items_.size());
        for (const auto& entry : items_) {
            handles.push_back(entry.first);
        }
        return handles;
    }

private:
    mutable std::mutex lock_;
    std::unordered_map<Handle, T> items_;
    Handle next_handle_ = HandleConstants::FIRST_HANDLE;
};

} // namespace warden::handles

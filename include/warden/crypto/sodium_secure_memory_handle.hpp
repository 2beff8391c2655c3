#pragma once

#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace warden::crypto {

/**
 * @brief Move-only owner of a sodium_malloc region
 *
 * The region is guard-paged, locked against swap and wiped when freed.
 * Secret material for private keys and the vault sealing key lives here.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate exactly data.size() bytes and copy @p data in
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes() const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Secure memory has been released"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Secure memory has been released"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<uint8_t>(static_cast<uint8_t*>(ptr_), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return ptr_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace warden::crypto

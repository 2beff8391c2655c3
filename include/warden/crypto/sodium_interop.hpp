#pragma once

#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace warden::crypto {

class SecureMemoryHandle;

/**
 * @brief Thin layer over the libsodium calls the runtime depends on
 *
 * Initialize() must succeed before secure memory can be allocated.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Memory
    // ========================================================================

    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison; buffers of different length are unequal
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

    // ========================================================================
    // Randomness
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);
    static void FillRandom(std::span<uint8_t> output) noexcept;

    /**
     * @brief Lowercase hex of @p byte_count random bytes
     */
    static std::string RandomHex(size_t byte_count);

    // ========================================================================
    // Ristretto255
    // ========================================================================

    /**
     * @brief Generate a uniformly random Ristretto255 scalar in secure memory
     */
    static Result<SecureMemoryHandle, SodiumFailure> GenerateScalar();

    /**
     * @brief A scalar is canonical when it is fully reduced modulo the group order
     */
    static bool IsCanonicalScalar(std::span<const uint8_t> scalar) noexcept;

    /**
     * @brief Compute scalar * G; fails for the zero scalar
     */
    static Result<std::vector<uint8_t>, SodiumFailure> DerivePublicPoint(
        std::span<const uint8_t> scalar);

    static bool IsValidPoint(std::span<const uint8_t> point) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

} // namespace warden::crypto

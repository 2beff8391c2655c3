#pragma once

#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/crypto/sodium_secure_memory_handle.hpp"
#include "warden/models/public_key.hpp"

#include <span>

namespace warden::models {

/**
 * @brief Ristretto255 secret scalar held in libsodium secure memory
 *
 * Move-only. The scalar never leaves secure memory except through
 * WithScalar(), which lends a read-only view for the duration of a call.
 */
class PrivateKey {
public:
    static Result<PrivateKey, WardenFailure> Generate();

    /// Rejects anything that is not a canonical, non-zero 32-byte scalar.
    static Result<PrivateKey, WardenFailure> FromBytes(std::span<const uint8_t> scalar);

    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    [[nodiscard]] Result<PublicKey, WardenFailure> DerivePublicKey() const;

    template<typename F>
    auto WithScalar(F&& func) const {
        return scalar_.WithReadAccess(std::forward<F>(func));
    }

private:
    explicit PrivateKey(crypto::SecureMemoryHandle scalar) noexcept
        : scalar_(std::move(scalar)) {}

    crypto::SecureMemoryHandle scalar_;
};

} // namespace warden::models

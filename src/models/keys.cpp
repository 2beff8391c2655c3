#include "warden/models/private_key.hpp"
#include "warden/models/public_key.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "warden/core/constants.hpp"

#include "warden/core/format.hpp"

namespace warden::models {

using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

// ============================================================================
// PublicKey
// ============================================================================

Result<PublicKey, WardenFailure> PublicKey::FromBytes(std::span<const uint8_t> point) {
    if (point.size() != Constants::RISTRETTO_POINT_SIZE) {
        return Result<PublicKey, WardenFailure>::Err(
            WardenFailure::InvalidArgument(
                compat::format("Public key must be {} bytes, got {}", Constants::RISTRETTO_POINT_SIZE, point.size())));
    }
    if (!SodiumInterop::IsValidPoint(point)) {
        return Result<PublicKey, WardenFailure>::Err(
            WardenFailure::InvalidArgument("Public key is not a valid Ristretto255 encoding"));
    }
    return Result<PublicKey, WardenFailure>::Ok(PublicKey(std::vector<uint8_t>(point.begin(), point.end())));
}

// ============================================================================
// PrivateKey
// ============================================================================

Result<PrivateKey, WardenFailure> PrivateKey::Generate() {
    auto scalar = SodiumInterop::GenerateScalar();
    if (scalar.IsErr()) {
        return Result<PrivateKey, WardenFailure>::Err(
            WardenFailure::FromSodiumFailure(scalar.UnwrapErr()));
    }
    return Result<PrivateKey, WardenFailure>::Ok(PrivateKey(std::move(scalar).Unwrap()));
}

Result<PrivateKey, WardenFailure> PrivateKey::FromBytes(std::span<const uint8_t> scalar) {
    if (scalar.size() != Constants::RISTRETTO_SCALAR_SIZE) {
        return Result<PrivateKey, WardenFailure>::Err(
            WardenFailure::InvalidArgument(
                compat::format("Private key must be {} bytes, got {}", Constants::RISTRETTO_SCALAR_SIZE, scalar.size())));
    }
    if (!SodiumInterop::IsCanonicalScalar(scalar)) {
        return Result<PrivateKey, WardenFailure>::Err(
            WardenFailure::InvalidArgument("Private key is not a canonical scalar"));
    }
    if (sodium_is_zero(scalar.data(), scalar.size()) == 1) {
        return Result<PrivateKey, WardenFailure>::Err(
            WardenFailure::InvalidArgument("Private key must not be zero"));
    }

    auto handle = SecureMemoryHandle::FromBytes(scalar);
    if (handle.IsErr()) {
        return Result<PrivateKey, WardenFailure>::Err(
            WardenFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<PrivateKey, WardenFailure>::Ok(PrivateKey(std::move(handle).Unwrap()));
}

Result<PublicKey, WardenFailure> PrivateKey::DerivePublicKey() const {
    auto derived = scalar_.WithReadAccess([](std::span<const uint8_t> scalar) {
        return SodiumInterop::DerivePublicPoint(scalar);
    });
    if (derived.IsErr()) {
        return Result<PublicKey, WardenFailure>::Err(
            WardenFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    auto point = std::move(derived).Unwrap();
    if (point.IsErr()) {
        return Result<PublicKey, WardenFailure>::Err(
            WardenFailure::FromSodiumFailure(point.UnwrapErr()));
    }
    return PublicKey::FromBytes(point.Unwrap());
}

} // namespace warden::models

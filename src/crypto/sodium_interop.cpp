#include "warden/crypto/sodium_interop.hpp"
#include "warden/crypto/sodium_secure_memory_handle.hpp"

#include <algorithm>
#include <array>

namespace warden::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Memory
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

// ============================================================================
// Randomness
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    FillRandom(buffer);
    return buffer;
}

void SodiumInterop::FillRandom(std::span<uint8_t> output) noexcept {
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
}

std::string SodiumInterop::RandomHex(const size_t byte_count) {
    std::vector<uint8_t> bytes = GetRandomBytes(byte_count);
    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

// ============================================================================
// Ristretto255
// ============================================================================

Result<SecureMemoryHandle, SodiumFailure> SodiumInterop::GenerateScalar() {
    auto handle_result = SecureMemoryHandle::Allocate(Constants::RISTRETTO_SCALAR_SIZE);
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();

    auto fill = handle.WithWriteAccess([](std::span<uint8_t> scalar) {
        crypto_core_ristretto255_scalar_random(scalar.data());
        return unit;
    });
    if (fill.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(std::move(fill).UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

bool SodiumInterop::IsCanonicalScalar(std::span<const uint8_t> scalar) noexcept {
    if (scalar.size() != Constants::RISTRETTO_SCALAR_SIZE) {
        return false;
    }
    std::array<uint8_t, crypto_core_ristretto255_NONREDUCEDSCALARBYTES> wide{};
    std::copy(scalar.begin(), scalar.end(), wide.begin());
    std::array<uint8_t, crypto_core_ristretto255_SCALARBYTES> reduced{};
    crypto_core_ristretto255_scalar_reduce(reduced.data(), wide.data());
    const bool canonical = sodium_memcmp(reduced.data(), scalar.data(), reduced.size()) == 0;
    SecureWipe(wide);
    SecureWipe(reduced);
    return canonical;
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::DerivePublicPoint(
    std::span<const uint8_t> scalar) {

    if (scalar.size() != Constants::RISTRETTO_SCALAR_SIZE) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Scalar must be " + std::to_string(Constants::RISTRETTO_SCALAR_SIZE) + " bytes"));
    }
    std::vector<uint8_t> point(Constants::RISTRETTO_POINT_SIZE);
    if (crypto_scalarmult_ristretto255_base(point.data(), scalar.data()) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Scalar yields the identity element"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(point));
}

bool SodiumInterop::IsValidPoint(std::span<const uint8_t> point) noexcept {
    return point.size() == Constants::RISTRETTO_POINT_SIZE &&
           crypto_core_ristretto255_is_valid_point(point.data()) == 1;
}

} // namespace warden::crypto

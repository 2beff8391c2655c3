#pragma once
#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace warden::crypto {

/**
 * AES-256-GCM sealing for secrets held in process memory.
 *
 * Sealed layout: nonce (12) || ciphertext || tag (16). Every Seal() draws a
 * fresh random nonce, so one key must not seal more than 2^32 values.
 * Open() fails with AccessDenied when authentication fails.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, WardenFailure> Seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, WardenFailure> Open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static constexpr size_t SealedSize(const size_t plaintext_size) noexcept {
        return plaintext_size + 12 + 16;
    }
private:
    AesGcm() = delete;
};
}

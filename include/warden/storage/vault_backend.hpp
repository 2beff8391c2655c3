#pragma once

#include "warden/crypto/sodium_secure_memory_handle.hpp"
#include "warden/interfaces/i_secure_storage_backend.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace warden::storage {

/**
 * @brief Volatile in-process secret store
 *
 * Each secret is sealed with AES-256-GCM under a per-instance key that lives
 * in libsodium secure memory. The associated data binds a ciphertext to its
 * (service, account) pair, so a sealed blob moved to another account fails
 * to open. Contents vanish with the instance.
 */
class VaultBackend final : public interfaces::ISecureStorageBackend {
public:
    static Result<std::unique_ptr<VaultBackend>, WardenFailure> Create(std::string service);

    [[nodiscard]] std::string_view Name() const noexcept override;
    [[nodiscard]] BackendCapabilities Capabilities() const noexcept override;
    Result<Unit, WardenFailure> Probe() override;
    Result<Unit, WardenFailure> Write(
        std::string_view account,
        std::span<const uint8_t> secret,
        const StoreOptions& options) override;
    Result<std::vector<uint8_t>, WardenFailure> Read(std::string_view account) override;
    Result<Unit, WardenFailure> Delete(std::string_view account) override;
    Result<std::vector<std::string>, WardenFailure> ListAccounts() override;
    Result<StorageMetadata, WardenFailure> ReadMetadata(std::string_view account) override;

private:
    struct Record {
        std::vector<uint8_t> sealed;
        StorageMetadata metadata;
        std::optional<std::string> label;
        std::optional<std::string> comment;
    };

    VaultBackend(std::string service, crypto::SecureMemoryHandle key);

    [[nodiscard]] std::string AssociatedData(std::string_view account) const;
    static WardenFailure Missing(std::string_view account);

    std::string service_;
    crypto::SecureMemoryHandle key_;
    mutable std::mutex lock_;
    std::map<std::string, Record, std::less<>> records_;
};

} // namespace warden::storage

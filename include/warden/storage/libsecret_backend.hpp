#pragma once

#include "warden/interfaces/i_secure_storage_backend.hpp"

#include <string>

namespace warden::storage {

/// Headless Linux fallback over libsecret's password API (schema org.warden.Secret).
/// Tried only when the Secret Service backend cannot reach a session bus or daemon.
class LibSecretBackend final : public interfaces::ISecureStorageBackend {
public:
    explicit LibSecretBackend(std::string service);

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
    std::string service_;
};

} // namespace warden::storage

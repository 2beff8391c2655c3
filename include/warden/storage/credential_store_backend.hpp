#pragma once

#include "warden/interfaces/i_secure_storage_backend.hpp"

#include <string>

namespace warden::storage {

/**
 * @brief Windows Credential Manager generic credentials
 *
 * Target names are "<service>/<account>". The credential manager does not
 * encrypt blobs at rest by itself, so every value is wrapped with
 * user-scoped DPAPI (CryptProtectData, entropy bound to the target name)
 * before CredWriteW and unwrapped after CredReadW.
 */
class CredentialStoreBackend final : public interfaces::ISecureStorageBackend {
public:
    explicit CredentialStoreBackend(std::string service);

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

    /// Maps a Win32 error code from the Cred* or Crypt* APIs onto the failure taxonomy.
    static WardenFailure ClassifyError(uint32_t error_code, std::string_view context);

private:
    [[nodiscard]] std::string TargetName(std::string_view account) const;

    std::string service_;
};

} // namespace warden::storage

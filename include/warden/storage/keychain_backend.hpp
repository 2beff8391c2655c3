#pragma once

#include "warden/interfaces/i_secure_storage_backend.hpp"

#include <string>

namespace warden::storage {

/**
 * @brief macOS Keychain generic-password items via Security.framework
 *
 * Policies that require authentication are translated into a
 * SecAccessControl object: biometry maps to BiometryAny (or'ed with the
 * device passcode when fallback is allowed), user presence alone maps to
 * UserPresence. The encoded policy is kept in kSecAttrGeneric.
 */
class KeychainBackend final : public interfaces::ISecureStorageBackend {
public:
    explicit KeychainBackend(std::string service);

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

    /// Maps an OSStatus from the Security framework onto the failure taxonomy.
    static WardenFailure ClassifyStatus(int32_t status, std::string_view context);

private:
    std::string service_;
};

} // namespace warden::storage

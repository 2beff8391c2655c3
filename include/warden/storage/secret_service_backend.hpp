#pragma once

#include "warden/interfaces/i_secure_storage_backend.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace warden::storage {

/**
 * @brief org.freedesktop.Secret.Service over the D-Bus session bus (GDBus)
 *
 * Items live in the default collection and carry the attributes
 * service, account, application and policy. The transfer session uses the
 * "plain" algorithm. Operations that would need an interactive unlock prompt
 * fail with AccessDenied instead of blocking on a prompt.
 */
class SecretServiceBackend final : public interfaces::ISecureStorageBackend {
public:
    explicit SecretServiceBackend(std::string service);
    ~SecretServiceBackend() override;

    SecretServiceBackend(const SecretServiceBackend&) = delete;
    SecretServiceBackend& operator=(const SecretServiceBackend&) = delete;

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

    /// Maps a D-Bus error name such as org.freedesktop.Secret.Error.IsLocked onto the failure taxonomy.
    static WardenFailure ClassifyError(std::string_view dbus_error_name, std::string message);

    class Connection;

private:
    Result<std::shared_ptr<Connection>, WardenFailure> Connect();

    std::string service_;
    std::mutex connect_lock_;
    std::shared_ptr<Connection> connection_;
};

} // namespace warden::storage

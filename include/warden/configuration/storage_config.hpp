#pragma once

#include "warden/core/constants.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::configuration {

enum class BackendKind : uint8_t {
    Auto = 0,
    Keychain = 1,
    CredentialStore = 2,
    SecretService = 3,
    LibSecret = 4,
    Vault = 5
};

[[nodiscard]] std::string_view BackendKindName(BackendKind kind) noexcept;
[[nodiscard]] std::optional<BackendKind> ParseBackendKind(std::string_view text) noexcept;

/**
 * @brief Secure-storage settings
 *
 * Default() picks the platform backend automatically, allows the headless
 * libsecret fallback and only warns when a backend cannot enforce a policy.
 * InProcess() selects the volatile vault and never touches OS services.
 */
struct StorageConfig {
    std::string service{StorageConstants::DEFAULT_SERVICE};
    BackendKind backend = BackendKind::Auto;
    bool allow_headless_fallback = true;
    bool strict_access_control = false;
    std::chrono::milliseconds operation_timeout = StorageConstants::DEFAULT_OPERATION_TIMEOUT;
    uint32_t worker_count = StorageConstants::DEFAULT_WORKER_COUNT;

    static StorageConfig Default();
    static StorageConfig ForService(std::string service_name);
    static StorageConfig InProcess();

    /// Applies WARDEN_STORAGE_BACKEND and WARDEN_STORAGE_SERVICE on top of @p base.
    /// An unknown backend name is an InvalidArgument, never silently ignored.
    static Result<StorageConfig, WardenFailure> FromEnvironment(StorageConfig base = Default());

    [[nodiscard]] Result<Unit, WardenFailure> Validate() const;
};

} // namespace warden::configuration

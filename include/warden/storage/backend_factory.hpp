#pragma once

#include "warden/configuration/storage_config.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/interfaces/i_secure_storage_backend.hpp"

#include <memory>
#include <optional>
#include <string>

namespace warden::storage {

enum class Platform : uint8_t {
    MacOS,
    Windows,
    Linux,
    Other
};

[[nodiscard]] constexpr Platform CurrentPlatform() noexcept {
#if defined(__APPLE__)
    return Platform::MacOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Other;
#endif
}

struct BackendPlan {
    configuration::BackendKind primary;
    std::optional<configuration::BackendKind> fallback;
};

/**
 * @brief Which backend(s) to try on @p platform
 *
 * Pure function of the platform and the configured preference:
 * - Auto: macOS -> Keychain, Windows -> CredentialStore,
 *   Linux -> SecretService with LibSecret as the headless fallback.
 * - An explicit kind must exist on the platform; Vault exists everywhere.
 * The fallback is only planned when allow_headless_fallback is set.
 */
Result<BackendPlan, WardenFailure> PlanBackends(Platform platform, const configuration::StorageConfig& config);

/// Instantiates one backend. Kinds not compiled for this platform yield StorageUnavailable.
Result<std::unique_ptr<interfaces::ISecureStorageBackend>, WardenFailure> CreateBackend(
    configuration::BackendKind kind,
    const std::string& service);

} // namespace warden::storage

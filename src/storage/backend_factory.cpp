#include "warden/storage/backend_factory.hpp"
#include "warden/core/constants.hpp"
#include "warden/storage/vault_backend.hpp"

#if defined(__APPLE__)
#include "warden/storage/keychain_backend.hpp"
#elif defined(_WIN32)
#include "warden/storage/credential_store_backend.hpp"
#elif defined(__linux__)
#include "warden/storage/libsecret_backend.hpp"
#include "warden/storage/secret_service_backend.hpp"
#endif

#include "warden/core/format.hpp"

namespace warden::storage {

using configuration::BackendKind;

namespace {

    std::string_view PlatformName(const Platform platform) noexcept {
        switch (platform) {
            case Platform::MacOS: return "macOS";
            case Platform::Windows: return "Windows";
            case Platform::Linux: return "Linux";
            case Platform::Other: return "this platform";
        }
        return "this platform";
    }

    bool ExistsOn(const BackendKind kind, const Platform platform) noexcept {
        switch (kind) {
            case BackendKind::Keychain: return platform == Platform::MacOS;
            case BackendKind::CredentialStore: return platform == Platform::Windows;
            case BackendKind::SecretService:
            case BackendKind::LibSecret: return platform == Platform::Linux;
            case BackendKind::Vault: return true;
            case BackendKind::Auto: return false;
        }
        return false;
    }

    template<typename Backend>
    Result<std::unique_ptr<interfaces::ISecureStorageBackend>, WardenFailure> Make(const std::string& service) {
        return Result<std::unique_ptr<interfaces::ISecureStorageBackend>, WardenFailure>::Ok(
            std::make_unique<Backend>(service));
    }

} // anonymous namespace

Result<BackendPlan, WardenFailure> PlanBackends(const Platform platform, const configuration::StorageConfig& config) {
    using R = Result<BackendPlan, WardenFailure>;
    if (config.backend == BackendKind::Auto) {
        switch (platform) {
            case Platform::MacOS:
                return R::Ok(BackendPlan{BackendKind::Keychain, std::nullopt});
            case Platform::Windows:
                return R::Ok(BackendPlan{BackendKind::CredentialStore, std::nullopt});
            case Platform::Linux:
                return R::Ok(BackendPlan{BackendKind::SecretService,
                    config.allow_headless_fallback ? std::optional(BackendKind::LibSecret) : std::nullopt});
            case Platform::Other:
                break;
        }
        return R::Err(WardenFailure::StorageUnavailable(std::string(ErrorMessages::STORAGE_UNAVAILABLE)));
    }

    if (!ExistsOn(config.backend, platform)) {
        return R::Err(WardenFailure::StorageUnavailable(compat::format("Backend '{}' is not available on {}",
            configuration::BackendKindName(config.backend), PlatformName(platform))));
    }
    if (config.backend == BackendKind::SecretService && config.allow_headless_fallback) {
        return R::Ok(BackendPlan{BackendKind::SecretService, BackendKind::LibSecret});
    }
    return R::Ok(BackendPlan{config.backend, std::nullopt});
}

Result<std::unique_ptr<interfaces::ISecureStorageBackend>, WardenFailure> CreateBackend(
    const BackendKind kind,
    const std::string& service) {
    using R = Result<std::unique_ptr<interfaces::ISecureStorageBackend>, WardenFailure>;
    switch (kind) {
        case BackendKind::Vault: {
            auto vault = VaultBackend::Create(service);
            if (vault.IsErr()) {
                return R::Err(std::move(vault).UnwrapErr());
            }
            return R::Ok(std::move(vault).Unwrap());
        }
#if defined(__APPLE__)
        case BackendKind::Keychain:
            return Make<KeychainBackend>(service);
#elif defined(_WIN32)
        case BackendKind::CredentialStore:
            return Make<CredentialStoreBackend>(service);
#elif defined(__linux__)
        case BackendKind::SecretService:
            return Make<SecretServiceBackend>(service);
        case BackendKind::LibSecret:
            return Make<LibSecretBackend>(service);
#endif
        default:
            break;
    }
    return R::Err(WardenFailure::StorageUnavailable(compat::format("Backend '{}' is not compiled into this build",
        configuration::BackendKindName(kind))));
}

} // namespace warden::storage

#include "warden/configuration/storage_config.hpp"
#include "warden/storage/key_validator.hpp"

#include <array>
#include <cstdlib>
#include "warden/core/format.hpp"
#include <utility>

namespace warden::configuration {

namespace {

    constexpr const char* ENV_BACKEND = "WARDEN_STORAGE_BACKEND";
    constexpr const char* ENV_SERVICE = "WARDEN_STORAGE_SERVICE";
    constexpr uint32_t MAX_WORKER_COUNT = 64;

    constexpr std::array<std::pair<std::string_view, BackendKind>, 6> BACKEND_NAMES{{
        {"auto", BackendKind::Auto},
        {"keychain", BackendKind::Keychain},
        {"credential-store", BackendKind::CredentialStore},
        {"secret-service", BackendKind::SecretService},
        {"libsecret", BackendKind::LibSecret},
        {"vault", BackendKind::Vault},
    }};

} // anonymous namespace

std::string_view BackendKindName(const BackendKind kind) noexcept {
    for (const auto& [name, value] : BACKEND_NAMES) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

std::optional<BackendKind> ParseBackendKind(const std::string_view text) noexcept {
    for (const auto& [name, value] : BACKEND_NAMES) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

StorageConfig StorageConfig::Default() {
    return StorageConfig{};
}

StorageConfig StorageConfig::ForService(std::string service_name) {
    StorageConfig config;
    config.service = std::move(service_name);
    return config;
}

StorageConfig StorageConfig::InProcess() {
    StorageConfig config;
    config.backend = BackendKind::Vault;
    config.allow_headless_fallback = false;
    return config;
}

Result<StorageConfig, WardenFailure> StorageConfig::FromEnvironment(StorageConfig base) {
    if (const char* backend = std::getenv(ENV_BACKEND); backend != nullptr && *backend != '\0') {
        const auto kind = ParseBackendKind(backend);
        if (!kind.has_value()) {
            return Result<StorageConfig, WardenFailure>::Err(WardenFailure::InvalidArgument(
                compat::format("{}='{}' is not a known storage backend", ENV_BACKEND, backend)));
        }
        base.backend = *kind;
    }
    if (const char* service = std::getenv(ENV_SERVICE); service != nullptr && *service != '\0') {
        base.service = service;
    }
    return Result<StorageConfig, WardenFailure>::Ok(std::move(base));
}

Result<Unit, WardenFailure> StorageConfig::Validate() const {
    using R = Result<Unit, WardenFailure>;
    WARDEN_TRY_ERR(R, storage::KeyValidator::ValidateServiceName(service));
    if (operation_timeout.count() <= 0) {
        return R::Err(
            WardenFailure::InvalidArgument("Storage operation timeout must be positive"));
    }
    if (worker_count == 0 || worker_count > MAX_WORKER_COUNT) {
        return R::Err(WardenFailure::InvalidArgument(
            compat::format("Storage worker count must be between 1 and {}", MAX_WORKER_COUNT)));
    }
    return R::Ok(unit);
}

} // namespace warden::configuration

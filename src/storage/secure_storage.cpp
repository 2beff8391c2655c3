#include "warden/storage/secure_storage.hpp"
#include "warden/core/constants.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "warden/debug/log.hpp"
#include "warden/storage/backend_factory.hpp"
#include "warden/storage/key_validator.hpp"

#include <algorithm>
#include "warden/core/format.hpp"

namespace warden::storage {

namespace {

    constexpr std::string_view LOG_COMPONENT = "storage";
    constexpr size_t SELF_TEST_SUFFIX_BYTES = 8;

    bool IsSelfTestKey(const std::string_view key) noexcept {
        return key.starts_with(StorageConstants::SELF_TEST_KEY_PREFIX);
    }

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<SecureStorage>, WardenFailure> SecureStorage::Create(
    const configuration::StorageConfig& config) {
    using R = Result<std::unique_ptr<SecureStorage>, WardenFailure>;
    WARDEN_TRY_ERR(R, config.Validate());

    auto plan_result = PlanBackends(CurrentPlatform(), config);
    if (plan_result.IsErr()) {
        return R::Err(std::move(plan_result).UnwrapErr());
    }
    const BackendPlan plan = plan_result.Unwrap();

    auto primary = CreateBackend(plan.primary, config.service);
    if (primary.IsErr()) {
        return R::Err(std::move(primary).UnwrapErr());
    }
    std::unique_ptr<interfaces::ISecureStorageBackend> fallback;
    if (plan.fallback.has_value()) {
        auto created = CreateBackend(*plan.fallback, config.service);
        if (created.IsOk()) {
            fallback = std::move(created).Unwrap();
        } else {
            WARDEN_LOG_WARN(LOG_COMPONENT, "Fallback backend unavailable: {}", created.UnwrapErr().message);
        }
    }
    return FromBackends(config, std::move(primary).Unwrap(), std::move(fallback));
}

Result<std::unique_ptr<SecureStorage>, WardenFailure> SecureStorage::FromBackends(
    const configuration::StorageConfig& config,
    std::unique_ptr<interfaces::ISecureStorageBackend> primary,
    std::unique_ptr<interfaces::ISecureStorageBackend> fallback) {
    using R = Result<std::unique_ptr<SecureStorage>, WardenFailure>;
    if (!primary) {
        return R::Err(WardenFailure::InvalidArgument("Primary storage backend must not be null"));
    }

    auto probe = primary->Probe();
    if (probe.IsOk()) {
        WARDEN_LOG_INFO(LOG_COMPONENT, "Using backend '{}' for service '{}'", primary->Name(), config.service);
        return R::Ok(std::unique_ptr<SecureStorage>(new SecureStorage(config, std::move(primary), false)));
    }
    const std::string primary_reason = std::move(probe).UnwrapErr().message;
    WARDEN_LOG_WARN(LOG_COMPONENT, "Backend '{}' unavailable: {}", primary->Name(), primary_reason);

    if (!fallback) {
        return R::Err(WardenFailure::StorageUnavailable(
            compat::format("{} ({}: {})", ErrorMessages::STORAGE_UNAVAILABLE, primary->Name(), primary_reason)));
    }
    auto fallback_probe = fallback->Probe();
    if (fallback_probe.IsErr()) {
        const std::string fallback_reason = std::move(fallback_probe).UnwrapErr().message;
        WARDEN_LOG_ERROR(LOG_COMPONENT, "Fallback backend '{}' unavailable: {}", fallback->Name(), fallback_reason);
        return R::Err(WardenFailure::StorageUnavailable(compat::format("{} ({}: {}; {}: {})",
            ErrorMessages::STORAGE_UNAVAILABLE,
            primary->Name(), primary_reason,
            fallback->Name(), fallback_reason)));
    }
    WARDEN_LOG_INFO(LOG_COMPONENT, "Using fallback backend '{}' for service '{}'", fallback->Name(), config.service);
    return R::Ok(std::unique_ptr<SecureStorage>(new SecureStorage(config, std::move(fallback), true)));
}

SecureStorage::SecureStorage(
    configuration::StorageConfig config,
    std::unique_ptr<interfaces::ISecureStorageBackend> backend,
    const bool using_fallback)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , using_fallback_(using_fallback) {}

std::string_view SecureStorage::BackendName() const noexcept {
    return backend_->Name();
}

BackendCapabilities SecureStorage::Capabilities() const noexcept {
    return backend_->Capabilities();
}

// ============================================================================
// Operations
// ============================================================================

Result<Unit, WardenFailure> SecureStorage::CheckPolicy(
    const std::string_view key,
    const security::AccessControlPolicy& policy) const {
    const BackendCapabilities caps = backend_->Capabilities();
    const bool unenforced =
        (policy.RequiresBiometry() && !caps.enforces_biometry) ||
        (policy.RequiresUserPresence() && !caps.enforces_user_presence);
    if (!unenforced) {
        return Result<Unit, WardenFailure>::Ok(unit);
    }
    if (config_.strict_access_control) {
        return Result<Unit, WardenFailure>::Err(WardenFailure::InvalidArgument(compat::format(
            "Backend '{}' cannot enforce policy '{}'", backend_->Name(), policy.Describe())));
    }
    WARDEN_LOG_WARN(LOG_COMPONENT, "Backend '{}' cannot enforce '{}' for key '{}'; storing without enforcement",
        backend_->Name(), policy.Describe(), key);
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> SecureStorage::DeleteIfPresent(const std::string_view key) {
    auto deleted = backend_->Delete(key);
    if (deleted.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::NotFound); })) {
        return Result<Unit, WardenFailure>::Ok(unit);
    }
    return deleted;
}

Result<Unit, WardenFailure> SecureStorage::Store(
    const std::string_view key,
    std::span<const uint8_t> value,
    const security::AccessControlPolicy& policy) {
    StoreOptions options;
    options.policy = policy;
    return Store(key, value, options);
}

Result<Unit, WardenFailure> SecureStorage::Store(
    const std::string_view key,
    std::span<const uint8_t> value,
    const StoreOptions& options) {
    using R = Result<Unit, WardenFailure>;
    WARDEN_TRY_ERR(R, KeyValidator::ValidateKey(key));
    if (value.size() > StorageConstants::MAX_SECRET_SIZE) {
        return R::Err(WardenFailure::InvalidArgument(compat::format("{} ({} > {} bytes)",
            ErrorMessages::SECRET_TOO_LARGE, value.size(), StorageConstants::MAX_SECRET_SIZE)));
    }
    WARDEN_TRY_ERR(R, CheckPolicy(key, options.policy));

    std::lock_guard guard(write_lock_);
    WARDEN_TRY_ERR(R, DeleteIfPresent(key));
    WARDEN_TRY_ERR(R, backend_->Write(key, value, options));
    WARDEN_LOG_INFO(LOG_COMPONENT, "Stored '{}' ({} bytes): {}", key, value.size(), options.policy.Describe());
    return R::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, WardenFailure> SecureStorage::Retrieve(const std::string_view key) {
    using R = Result<std::optional<std::vector<uint8_t>>, WardenFailure>;
    WARDEN_TRY_ERR(R, KeyValidator::ValidateKey(key));
    auto read = backend_->Read(key);
    if (read.IsOk()) {
        return R::Ok(std::move(read).Unwrap());
    }
    auto failure = std::move(read).UnwrapErr();
    if (failure.Is(FailureType::NotFound)) {
        return R::Ok(std::nullopt);
    }
    return R::Err(std::move(failure));
}

Result<Unit, WardenFailure> SecureStorage::Remove(const std::string_view key) {
    using R = Result<Unit, WardenFailure>;
    WARDEN_TRY_ERR(R, KeyValidator::ValidateKey(key));
    std::lock_guard guard(write_lock_);
    return DeleteIfPresent(key);
}

Result<bool, WardenFailure> SecureStorage::Exists(const std::string_view key) {
    using R = Result<bool, WardenFailure>;
    WARDEN_TRY_ERR(R, KeyValidator::ValidateKey(key));
    auto metadata = backend_->ReadMetadata(key);
    if (metadata.IsOk()) {
        return R::Ok(true);
    }
    auto failure = std::move(metadata).UnwrapErr();
    if (failure.Is(FailureType::NotFound)) {
        return R::Ok(false);
    }
    return R::Err(std::move(failure));
}

Result<std::vector<std::string>, WardenFailure> SecureStorage::List() {
    auto accounts = backend_->ListAccounts();
    if (accounts.IsErr()) {
        return accounts;
    }
    std::vector<std::string> keys = std::move(accounts).Unwrap();
    std::erase_if(keys, [](const std::string& key) { return IsSelfTestKey(key); });
    std::sort(keys.begin(), keys.end());
    return Result<std::vector<std::string>, WardenFailure>::Ok(std::move(keys));
}

Result<Unit, WardenFailure> SecureStorage::Clear() {
    using R = Result<Unit, WardenFailure>;
    std::lock_guard guard(write_lock_);
    auto accounts = backend_->ListAccounts();
    if (accounts.IsErr()) {
        return R::Err(std::move(accounts).UnwrapErr());
    }
    std::optional<WardenFailure> first_failure;
    size_t removed = 0;
    for (const auto& account : accounts.Unwrap()) {
        auto deleted = DeleteIfPresent(account);
        if (deleted.IsOk()) {
            ++removed;
        } else if (!first_failure.has_value()) {
            first_failure = std::move(deleted).UnwrapErr();
        }
    }
    WARDEN_LOG_INFO(LOG_COMPONENT, "Cleared {} record(s) from '{}'", removed, config_.service);
    if (first_failure.has_value()) {
        return R::Err(std::move(*first_failure));
    }
    return R::Ok(unit);
}

Result<StorageMetadata, WardenFailure> SecureStorage::GetMetadata(const std::string_view key) {
    using R = Result<StorageMetadata, WardenFailure>;
    WARDEN_TRY_ERR(R, KeyValidator::ValidateKey(key));
    return backend_->ReadMetadata(key);
}

Result<StorageInfo, WardenFailure> SecureStorage::GetInfo() {
    using R = Result<StorageInfo, WardenFailure>;
    StorageInfo info;
    info.backend_name = std::string(backend_->Name());
    info.using_fallback = using_fallback_;
    info.persistent = backend_->Capabilities().persistent;

    auto probe = backend_->Probe();
    if (probe.IsErr()) {
        WARDEN_LOG_WARN(LOG_COMPONENT, "Backend '{}' stopped answering: {}", info.backend_name,
            probe.UnwrapErr().message);
        return R::Ok(std::move(info));
    }
    info.available = true;
    auto keys = List();
    if (keys.IsErr()) {
        return R::Err(std::move(keys).UnwrapErr());
    }
    info.item_count = keys.Unwrap().size();
    return R::Ok(std::move(info));
}

Result<Unit, WardenFailure> SecureStorage::Test() {
    using R = Result<Unit, WardenFailure>;
    const std::string key = compat::format("{}{}", StorageConstants::SELF_TEST_KEY_PREFIX,
        crypto::SodiumInterop::RandomHex(SELF_TEST_SUFFIX_BYTES));
    const std::span<const uint8_t> payload(
        reinterpret_cast<const uint8_t*>(StorageConstants::SELF_TEST_PAYLOAD.data()),
        StorageConstants::SELF_TEST_PAYLOAD.size());

    auto outcome = [&]() -> R {
        WARDEN_TRY_ERR(R, Store(key, payload, security::AccessControlPolicy::LowSecurity()));
        auto read = Retrieve(key);
        if (read.IsErr()) {
            return R::Err(std::move(read).UnwrapErr());
        }
        const auto& value = read.Unwrap();
        if (!value.has_value() || !crypto::SodiumInterop::ConstantTimeEquals(*value, payload)) {
            return R::Err(WardenFailure::BackendError(std::string(ErrorMessages::SELF_TEST_MISMATCH)));
        }
        return R::Ok(unit);
    }();

    auto cleanup = Remove(key);
    if (cleanup.IsErr()) {
        WARDEN_LOG_ERROR(LOG_COMPONENT, "Self-test record '{}' could not be removed: {}", key,
            cleanup.UnwrapErr().message);
        if (outcome.IsOk()) {
            return cleanup;
        }
    }
    if (outcome.IsOk()) {
        WARDEN_LOG_DEBUG(LOG_COMPONENT, "Self-test passed on backend '{}'", backend_->Name());
    }
    return outcome;
}

} // namespace warden::storage

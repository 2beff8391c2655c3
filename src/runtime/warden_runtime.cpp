#include "warden/runtime/warden_runtime.hpp"
#include "warden/core/constants.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "warden/debug/log.hpp"

namespace warden::runtime {

namespace {

    constexpr std::string_view LOG_COMPONENT = "runtime";

    WardenFailure NoStorage() {
        return WardenFailure::StorageUnavailable(std::string(ErrorMessages::STORAGE_UNAVAILABLE));
    }

} // anonymous namespace

Result<std::unique_ptr<WardenRuntime>, WardenFailure> WardenRuntime::Create(configuration::RuntimeConfig config) {
    using R = Result<std::unique_ptr<WardenRuntime>, WardenFailure>;
    WARDEN_TRY_ERR(R, config.Validate());
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return R::Err(WardenFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::shared_ptr<storage::SecureStorage> secure_storage;
    auto created = storage::SecureStorage::Create(config.storage);
    if (created.IsOk()) {
        secure_storage = std::move(created).Unwrap();
    } else if (config.require_storage) {
        return R::Err(std::move(created).UnwrapErr());
    } else {
        WARDEN_LOG_WARN(LOG_COMPONENT, "Starting without secure storage: {}", created.UnwrapErr().message);
    }
    return R::Ok(std::unique_ptr<WardenRuntime>(new WardenRuntime(std::move(config), std::move(secure_storage))));
}

Result<std::unique_ptr<WardenRuntime>, WardenFailure> WardenRuntime::CreateWithStorage(
    configuration::RuntimeConfig config,
    std::shared_ptr<storage::SecureStorage> secure_storage) {
    using R = Result<std::unique_ptr<WardenRuntime>, WardenFailure>;
    WARDEN_TRY_ERR(R, config.Validate());
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return R::Err(WardenFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (!secure_storage && config.require_storage) {
        return R::Err(NoStorage());
    }
    return R::Ok(std::unique_ptr<WardenRuntime>(new WardenRuntime(std::move(config), std::move(secure_storage))));
}

WardenRuntime::WardenRuntime(configuration::RuntimeConfig config, std::shared_ptr<storage::SecureStorage> secure_storage)
    : config_(std::move(config))
    , bridge_(config_.events)
    , registry_(bridge_)
    , storage_(std::move(secure_storage)) {
    if (storage_) {
        async_storage_ = std::make_shared<storage::AsyncSecureStorage>(
            storage_, config_.storage.worker_count, config_.storage.operation_timeout);
    }
    WARDEN_LOG_INFO(LOG_COMPONENT, "Runtime started (storage: {})",
        storage_ ? storage_->BackendName() : std::string_view("none"));
}

WardenRuntime::~WardenRuntime() {
    Shutdown();
}

Result<std::shared_ptr<storage::SecureStorage>, WardenFailure> WardenRuntime::Storage() const {
    if (!storage_) {
        return Result<std::shared_ptr<storage::SecureStorage>, WardenFailure>::Err(NoStorage());
    }
    return Result<std::shared_ptr<storage::SecureStorage>, WardenFailure>::Ok(storage_);
}

Result<std::shared_ptr<storage::AsyncSecureStorage>, WardenFailure> WardenRuntime::AsyncStorage() const {
    if (!async_storage_) {
        return Result<std::shared_ptr<storage::AsyncSecureStorage>, WardenFailure>::Err(NoStorage());
    }
    return Result<std::shared_ptr<storage::AsyncSecureStorage>, WardenFailure>::Ok(async_storage_);
}

void WardenRuntime::Shutdown() {
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    bridge_.Shutdown();
    const auto remaining = registry_.Counts();
    registry_.DestroyAll();
    if (async_storage_) {
        async_storage_->Shutdown();
    }
    WARDEN_LOG_INFO(LOG_COMPONENT, "Runtime stopped ({} wallet(s) released)", remaining.wallets);
}

bool WardenRuntime::IsShutDown() const noexcept {
    return shut_down_.load(std::memory_order_acquire);
}

} // namespace warden::runtime

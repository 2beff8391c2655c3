#pragma once

#include "warden/configuration/runtime_config.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/events/event_bridge.hpp"
#include "warden/handles/resource_registry.hpp"
#include "warden/storage/async_secure_storage.hpp"
#include "warden/storage/secure_storage.hpp"

#include <atomic>
#include <memory>

namespace warden::runtime {

/**
 * @brief Composition root: one event bridge, one resource registry, one secure store
 *
 * Nothing here is process-global. A host (or a test) constructs as many
 * independent runtimes as it needs.
 *
 * Teardown order:
 * 1. the event bridge stops, so no callback fires afterwards
 * 2. every remaining wallet is shut down and released with the other resources
 * 3. the storage worker pool finishes queued operations
 */
class WardenRuntime {
public:
    /// Initializes libsodium, then builds the bridge, registry and platform storage.
    static Result<std::unique_ptr<WardenRuntime>, WardenFailure> Create(configuration::RuntimeConfig config);

    /// Same as Create, with an already constructed store (for example over injected backends).
    static Result<std::unique_ptr<WardenRuntime>, WardenFailure> CreateWithStorage(
        configuration::RuntimeConfig config,
        std::shared_ptr<storage::SecureStorage> secure_storage);

    ~WardenRuntime();

    WardenRuntime(const WardenRuntime&) = delete;
    WardenRuntime& operator=(const WardenRuntime&) = delete;

    [[nodiscard]] events::EventBridge& Events() noexcept { return bridge_; }
    [[nodiscard]] handles::ResourceRegistry& Resources() noexcept { return registry_; }

    /// StorageUnavailable when the runtime was started without a secure store.
    Result<std::shared_ptr<storage::SecureStorage>, WardenFailure> Storage() const;
    Result<std::shared_ptr<storage::AsyncSecureStorage>, WardenFailure> AsyncStorage() const;

    [[nodiscard]] const configuration::RuntimeConfig& Config() const noexcept { return config_; }

    /// Idempotent.
    void Shutdown();
    [[nodiscard]] bool IsShutDown() const noexcept;

private:
    WardenRuntime(configuration::RuntimeConfig config, std::shared_ptr<storage::SecureStorage> secure_storage);

    configuration::RuntimeConfig config_;
    events::EventBridge bridge_;
    handles::ResourceRegistry registry_;
    std::shared_ptr<storage::SecureStorage> storage_;
    std::shared_ptr<storage::AsyncSecureStorage> async_storage_;
    std::atomic<bool> shut_down_{false};
};

} // namespace warden::runtime

#pragma once
#include "warden/configuration/event_bridge_config.hpp"
#include "warden/configuration/storage_config.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
namespace warden::configuration {
struct RuntimeConfig {
    StorageConfig storage = StorageConfig::Default();
    EventBridgeConfig events = EventBridgeConfig::Default();
    /// When false the runtime starts without a secure store; storage calls fail with StorageUnavailable.
    bool require_storage = true;

    static RuntimeConfig Default() { return RuntimeConfig{}; }

    /// Volatile vault storage; used by tests and hosts that opt out of OS secret stores.
    static RuntimeConfig InProcess() {
        RuntimeConfig config;
        config.storage = StorageConfig::InProcess();
        return config;
    }

    [[nodiscard]] Result<Unit, WardenFailure> Validate() const {
        return storage.Validate();
    }
};
}

#pragma once
#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"
#include <memory>
#include <string>
namespace warden::events {
class WalletEventEmitter;
}
namespace warden::interfaces {
/// Boundary to the wallet engine. The runtime only owns, wires and tears down
/// instances; it never inspects engine state.
class IWalletEngine {
public:
    virtual ~IWalletEngine() = default;
    /// Called once, right after the wallet receives its handle.
    virtual void AttachEvents(std::shared_ptr<events::WalletEventEmitter> emitter) = 0;
    /// Called once when the handle is destroyed, before the engine is released.
    virtual void Shutdown() noexcept = 0;
    [[nodiscard]] virtual std::string Name() const = 0;
};
}

#pragma once
#include "warden/interfaces/i_wallet_engine.hpp"
#include "warden/events/wallet_event_emitter.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace warden::test_helpers {

/// Records the calls the runtime makes on a wallet engine.
class MockWalletEngine : public interfaces::IWalletEngine {
public:
    explicit MockWalletEngine(std::string name = "mock-wallet")
        : name_(std::move(name)) {}

    void AttachEvents(std::shared_ptr<events::WalletEventEmitter> emitter) override {
        std::lock_guard guard(lock_);
        emitter_ = std::move(emitter);
        ++attach_count_;
    }

    void Shutdown() noexcept override {
        shutdown_count_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] std::string Name() const override { return name_; }

    [[nodiscard]] std::shared_ptr<events::WalletEventEmitter> Emitter() const {
        std::lock_guard guard(lock_);
        return emitter_;
    }

    [[nodiscard]] int AttachCount() const {
        std::lock_guard guard(lock_);
        return attach_count_;
    }

    [[nodiscard]] int ShutdownCount() const noexcept {
        return shutdown_count_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    mutable std::mutex lock_;
    std::shared_ptr<events::WalletEventEmitter> emitter_;
    int attach_count_ = 0;
    std::atomic<int> shutdown_count_{0};
};

} // namespace warden::test_helpers

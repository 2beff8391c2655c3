#pragma once

#include "warden/configuration/event_bridge_config.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/events/event_payload.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace warden::events {

namespace detail {
    struct DispatchState;
}

struct EventBridgeStats {
    size_t registered_count = 0;
    size_t queued_count = 0;
    uint64_t emitted_total = 0;
    uint64_t delivered_total = 0;
    uint64_t dropped_total = 0;
    uint64_t callback_failures = 0;
};

/**
 * @brief Routes native events to at most one host callback per resource handle
 *
 * Emit() appends to an unbounded FIFO drained by one dispatcher thread, so
 * events for a handle arrive in emission order. The callback is resolved
 * when an event is delivered, not when it is queued: an event emitted before
 * a re-registration goes to the newer callback, and an event whose handle has
 * no registration at delivery time is dropped.
 *
 * Callbacks always run with no bridge lock held. Exceptions escaping a
 * callback are logged and counted, never propagated.
 *
 * Shutdown() is terminal: pending events are discarded, registrations are
 * released and no callback starts after it returns.
 *
 * Queue, registrations and counters live in a DispatchState shared with the
 * dispatcher thread. The bridge may therefore be shut down or destroyed from
 * inside one of its own callbacks: on the dispatcher thread the thread is
 * detached and finishes on its own copy of that state.
 */
class EventBridge {
public:
    explicit EventBridge(configuration::EventBridgeConfig config = configuration::EventBridgeConfig::Default());
    ~EventBridge();

    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;
    EventBridge(EventBridge&&) = delete;
    EventBridge& operator=(EventBridge&&) = delete;

    /// Replaces (and releases) any callback already registered for the handle.
    Result<CallbackId, WardenFailure> Register(Handle resource_handle, EventCallback callback);

    /// No-op when nothing is registered.
    void Unregister(Handle resource_handle);

    [[nodiscard]] bool HasCallback(Handle resource_handle) const;

    /// Enqueue and return; never waits for delivery.
    Result<Unit, WardenFailure> Emit(Handle resource_handle, std::string_view event_type, std::vector<uint8_t> data);

    /// Invoke the current callback on the calling thread, bypassing the queue.
    Result<Unit, WardenFailure> EmitDirect(Handle resource_handle, std::string_view event_type, std::vector<uint8_t> data);

    [[nodiscard]] EventBridgeStats Stats() const;

    /**
     * @brief Block until the queue is empty and no queued delivery is running
     * @return false on timeout
     */
    bool WaitUntilIdle(std::chrono::milliseconds timeout);

    void Shutdown();

    [[nodiscard]] bool IsShutDown() const noexcept;

private:
    std::shared_ptr<detail::DispatchState> state_;

    std::mutex shutdown_lock_;
    std::thread dispatcher_;
    std::thread::id dispatcher_id_;
};

} // namespace warden::events

#include "warden/events/event_bridge.hpp"
#include "warden/core/constants.hpp"
#include "warden/debug/log.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <unordered_map>

namespace warden::events {

namespace detail {

    struct Registration {
        CallbackId id;
        std::shared_ptr<const EventCallback> callback;
    };

    struct DispatchState {
        explicit DispatchState(const configuration::EventBridgeConfig bridge_config)
            : config(bridge_config) {}

        configuration::EventBridgeConfig config;

        mutable std::mutex registry_lock;
        std::unordered_map<Handle, Registration> registrations;
        std::condition_variable direct_done_cv;
        size_t active_direct = 0;
        bool registry_closed = false;

        mutable std::mutex queue_lock;
        std::condition_variable queue_cv;
        std::condition_variable idle_cv;
        std::deque<EventPayload> queue;
        bool delivering = false;
        bool stopping = false;
        bool backlog_warned = false;

        std::atomic<CallbackId> next_callback_id{1};
        std::atomic<bool> shut_down{false};
        std::atomic<uint64_t> emitted_total{0};
        std::atomic<uint64_t> delivered_total{0};
        std::atomic<uint64_t> dropped_total{0};
        std::atomic<uint64_t> callback_failures{0};
    };

} // namespace detail

namespace {

    constexpr std::string_view LOG_COMPONENT = "events";

    // Nesting depth of callback invocations on this thread; a direct callback
    // that shuts the bridge down cannot wait for itself to return.
    thread_local int t_callback_depth = 0;

    struct CallbackScope {
        CallbackScope() noexcept { ++t_callback_depth; }
        ~CallbackScope() { --t_callback_depth; }
        CallbackScope(const CallbackScope&) = delete;
        CallbackScope& operator=(const CallbackScope&) = delete;
    };

    Result<Unit, WardenFailure> BridgeClosed() {
        return Result<Unit, WardenFailure>::Err(
            WardenFailure::BackendError(std::string(ErrorMessages::BRIDGE_SHUT_DOWN)));
    }

    std::shared_ptr<const EventCallback> CurrentCallback(const detail::DispatchState& state, const Handle resource_handle) {
        std::lock_guard guard(state.registry_lock);
        const auto it = state.registrations.find(resource_handle);
        if (it == state.registrations.end()) {
            return nullptr;
        }
        return it->second.callback;
    }

    void InvokeGuarded(detail::DispatchState& state, const EventCallback& callback, const EventPayload& payload) {
        CallbackScope scope;
        try {
            callback(payload);
        } catch (const std::exception& ex) {
            state.callback_failures.fetch_add(1, std::memory_order_relaxed);
            WARDEN_LOG_ERROR(LOG_COMPONENT, "Callback for handle {} threw on '{}': {}",
                payload.ResourceHandle(), payload.EventType(), ex.what());
        } catch (...) {
            state.callback_failures.fetch_add(1, std::memory_order_relaxed);
            WARDEN_LOG_ERROR(LOG_COMPONENT, "Callback for handle {} threw a non-standard exception on '{}'",
                payload.ResourceHandle(), payload.EventType());
        }
    }

    void Deliver(detail::DispatchState& state, const EventPayload& payload) {
        const auto callback = CurrentCallback(state, payload.ResourceHandle());
        if (!callback) {
            state.dropped_total.fetch_add(1, std::memory_order_relaxed);
            WARDEN_LOG_TRACE(LOG_COMPONENT, "Dropped '{}' for handle {} (no callback)",
                payload.EventType(), payload.ResourceHandle());
            return;
        }
        InvokeGuarded(state, *callback, payload);
        state.delivered_total.fetch_add(1, std::memory_order_relaxed);
    }

    // Runs on the dispatcher thread and only ever touches the shared state, so
    // it keeps working after the owning bridge is gone.
    void DispatchLoop(const std::shared_ptr<detail::DispatchState> owned) {
        detail::DispatchState& state = *owned;
        std::unique_lock lock(state.queue_lock);
        for (;;) {
            state.queue_cv.wait(lock, [&state]() { return state.stopping || !state.queue.empty(); });
            if (state.stopping) {
                break;
            }

            EventPayload payload = std::move(state.queue.front());
            state.queue.pop_front();
            state.delivering = true;
            if (state.backlog_warned && state.queue.size() < state.config.QueueWarningThreshold() / 2) {
                state.backlog_warned = false;
            }

            lock.unlock();
            Deliver(state, payload);
            lock.lock();

            state.delivering = false;
            if (state.queue.empty()) {
                state.idle_cv.notify_all();
            }
        }

        const size_t discarded = state.queue.size();
        state.queue.clear();
        state.delivering = false;
        lock.unlock();
        state.idle_cv.notify_all();

        if (discarded > 0) {
            state.dropped_total.fetch_add(discarded, std::memory_order_relaxed);
            WARDEN_LOG_DEBUG(LOG_COMPONENT, "Discarded {} pending event(s) at shutdown", discarded);
        }
    }

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

EventBridge::EventBridge(const configuration::EventBridgeConfig config)
    : state_(std::make_shared<detail::DispatchState>(config)) {
    dispatcher_ = std::thread(DispatchLoop, state_);
    dispatcher_id_ = dispatcher_.get_id();
}

EventBridge::~EventBridge() {
    Shutdown();
}

void EventBridge::Shutdown() {
    const auto state = state_;
    state->shut_down.store(true, std::memory_order_release);
    {
        std::lock_guard guard(state->queue_lock);
        state->stopping = true;
    }
    state->queue_cv.notify_all();
    state->idle_cv.notify_all();

    const bool on_dispatcher = std::this_thread::get_id() == dispatcher_id_;
    {
        std::unique_lock shutdown_guard(shutdown_lock_, std::defer_lock);
        if (on_dispatcher) {
            // Another thread already joining would wait on this very callback.
            if (!shutdown_guard.try_lock()) {
                std::unordered_map<Handle, detail::Registration> released;
                std::lock_guard guard(state->registry_lock);
                state->registry_closed = true;
                released.swap(state->registrations);
                return;
            }
            if (dispatcher_.joinable()) {
                WARDEN_LOG_DEBUG(LOG_COMPONENT, "Shutdown from the dispatcher thread; detaching it");
                dispatcher_.detach();
            }
        } else {
            shutdown_guard.lock();
            if (dispatcher_.joinable()) {
                dispatcher_.join();
            }
        }
    }

    std::unordered_map<Handle, detail::Registration> released;
    {
        std::unique_lock guard(state->registry_lock);
        state->registry_closed = true;
        if (t_callback_depth == 0) {
            state->direct_done_cv.wait(guard, [&state]() { return state->active_direct == 0; });
        }
        released.swap(state->registrations);
    }
    if (!released.empty()) {
        WARDEN_LOG_DEBUG(LOG_COMPONENT, "Released {} callback registration(s) at shutdown", released.size());
    }
}

bool EventBridge::IsShutDown() const noexcept {
    return state_->shut_down.load(std::memory_order_acquire);
}

// ============================================================================
// Registration
// ============================================================================

Result<CallbackId, WardenFailure> EventBridge::Register(const Handle resource_handle, EventCallback callback) {
    if (!callback) {
        return Result<CallbackId, WardenFailure>::Err(
            WardenFailure::InvalidArgument(std::string(ErrorMessages::NULL_CALLBACK)));
    }

    auto shared = std::make_shared<const EventCallback>(std::move(callback));
    const CallbackId id = state_->next_callback_id.fetch_add(1, std::memory_order_relaxed);

    std::shared_ptr<const EventCallback> previous;
    {
        std::lock_guard guard(state_->registry_lock);
        if (state_->registry_closed) {
            return Result<CallbackId, WardenFailure>::Err(
                WardenFailure::BackendError(std::string(ErrorMessages::BRIDGE_SHUT_DOWN)));
        }
        auto& slot = state_->registrations[resource_handle];
        previous = std::move(slot.callback);
        slot = detail::Registration{id, std::move(shared)};
    }

    if (previous) {
        WARDEN_LOG_DEBUG(LOG_COMPONENT, "Replaced callback for handle {}", resource_handle);
    }
    return Result<CallbackId, WardenFailure>::Ok(id);
}

void EventBridge::Unregister(const Handle resource_handle) {
    std::shared_ptr<const EventCallback> released;
    {
        std::lock_guard guard(state_->registry_lock);
        const auto it = state_->registrations.find(resource_handle);
        if (it == state_->registrations.end()) {
            return;
        }
        released = std::move(it->second.callback);
        state_->registrations.erase(it);
    }
}

bool EventBridge::HasCallback(const Handle resource_handle) const {
    std::lock_guard guard(state_->registry_lock);
    return state_->registrations.contains(resource_handle);
}

// ============================================================================
// Emission
// ============================================================================

Result<Unit, WardenFailure> EventBridge::Emit(
    const Handle resource_handle,
    const std::string_view event_type,
    std::vector<uint8_t> data) {

    detail::DispatchState& state = *state_;
    if (state.shut_down.load(std::memory_order_acquire)) {
        return BridgeClosed();
    }

    EventPayload payload = EventPayload::Create(resource_handle, event_type, std::move(data));
    size_t depth = 0;
    bool warn_backlog = false;
    {
        std::lock_guard guard(state.queue_lock);
        if (state.stopping) {
            return BridgeClosed();
        }
        state.queue.push_back(std::move(payload));
        depth = state.queue.size();
        const size_t threshold = state.config.QueueWarningThreshold();
        if (threshold > 0 && depth >= threshold && !state.backlog_warned) {
            state.backlog_warned = true;
            warn_backlog = true;
        }
    }
    state.queue_cv.notify_one();
    state.emitted_total.fetch_add(1, std::memory_order_relaxed);

    if (warn_backlog) {
        WARDEN_LOG_WARN(LOG_COMPONENT, "Event queue backlog reached {} pending events", depth);
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> EventBridge::EmitDirect(
    const Handle resource_handle,
    const std::string_view event_type,
    std::vector<uint8_t> data) {

    // The callback may destroy this bridge; the local reference keeps the state alive.
    const auto state = state_;
    if (state->shut_down.load(std::memory_order_acquire)) {
        return BridgeClosed();
    }

    std::shared_ptr<const EventCallback> callback;
    {
        std::lock_guard guard(state->registry_lock);
        if (state->registry_closed) {
            return BridgeClosed();
        }
        const auto it = state->registrations.find(resource_handle);
        if (it != state->registrations.end()) {
            callback = it->second.callback;
            ++state->active_direct;
        }
    }
    state->emitted_total.fetch_add(1, std::memory_order_relaxed);

    if (!callback) {
        state->dropped_total.fetch_add(1, std::memory_order_relaxed);
        WARDEN_LOG_TRACE(LOG_COMPONENT, "Dropped direct '{}' for handle {} (no callback)", event_type, resource_handle);
        return Result<Unit, WardenFailure>::Ok(unit);
    }

    const EventPayload payload = EventPayload::Create(resource_handle, event_type, std::move(data));
    InvokeGuarded(*state, *callback, payload);
    state->delivered_total.fetch_add(1, std::memory_order_relaxed);
    callback.reset();

    {
        std::lock_guard guard(state->registry_lock);
        --state->active_direct;
    }
    state->direct_done_cv.notify_all();
    return Result<Unit, WardenFailure>::Ok(unit);
}

// ============================================================================
// Statistics
// ============================================================================

EventBridgeStats EventBridge::Stats() const {
    const detail::DispatchState& state = *state_;
    EventBridgeStats stats;
    {
        std::lock_guard guard(state.registry_lock);
        stats.registered_count = state.registrations.size();
    }
    {
        std::lock_guard guard(state.queue_lock);
        stats.queued_count = state.queue.size();
    }
    stats.emitted_total = state.emitted_total.load(std::memory_order_relaxed);
    stats.delivered_total = state.delivered_total.load(std::memory_order_relaxed);
    stats.dropped_total = state.dropped_total.load(std::memory_order_relaxed);
    stats.callback_failures = state.callback_failures.load(std::memory_order_relaxed);
    return stats;
}

bool EventBridge::WaitUntilIdle(const std::chrono::milliseconds timeout) {
    detail::DispatchState& state = *state_;
    std::unique_lock lock(state.queue_lock);
    return state.idle_cv.wait_for(lock, timeout, [&state]() {
        return state.stopping || (state.queue.empty() && !state.delivering);
    });
}

} // namespace warden::events

#pragma once

#include "warden/core/constants.hpp"

#include <cstddef>

namespace warden::configuration {

/// Tuning for the event bridge. The delivery queue is always unbounded;
/// the threshold only controls when a backlog warning is logged.
class EventBridgeConfig {
public:
    [[nodiscard]] static constexpr EventBridgeConfig Default() noexcept {
        return EventBridgeConfig(EventConstants::DEFAULT_QUEUE_WARNING_THRESHOLD);
    }

    [[nodiscard]] static constexpr EventBridgeConfig WithQueueWarningThreshold(const size_t threshold) noexcept {
        return EventBridgeConfig(threshold);
    }

    /// Zero disables the backlog warning.
    [[nodiscard]] constexpr size_t QueueWarningThreshold() const noexcept {
        return queue_warning_threshold_;
    }

private:
    explicit constexpr EventBridgeConfig(const size_t threshold) noexcept
        : queue_warning_threshold_(threshold) {}

    size_t queue_warning_threshold_;
};

} // namespace warden::configuration

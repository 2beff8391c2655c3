#pragma once

#include "warden/handles/handle_table.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::events {

using handles::Handle;

/**
 * @brief One native event addressed to the callback of a resource handle
 *
 * Immutable after construction. The timestamp is taken when the event is
 * emitted, in milliseconds since the Unix epoch. For wallet events the data
 * is a serialized warden.events protobuf message.
 */
class EventPayload {
public:
    static EventPayload Create(Handle resource_handle, std::string_view event_type, std::vector<uint8_t> data) {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return EventPayload(std::string(event_type), resource_handle, std::move(data), static_cast<int64_t>(now));
    }

    EventPayload(std::string event_type, const Handle resource_handle, std::vector<uint8_t> data, const int64_t timestamp_ms)
        : event_type_(std::move(event_type))
        , resource_handle_(resource_handle)
        , data_(std::move(data))
        , timestamp_ms_(timestamp_ms) {}

    [[nodiscard]] const std::string& EventType() const noexcept { return event_type_; }
    [[nodiscard]] Handle ResourceHandle() const noexcept { return resource_handle_; }
    [[nodiscard]] std::span<const uint8_t> Data() const noexcept { return data_; }
    [[nodiscard]] int64_t TimestampMs() const noexcept { return timestamp_ms_; }

private:
    std::string event_type_;
    Handle resource_handle_;
    std::vector<uint8_t> data_;
    int64_t timestamp_ms_;
};

using EventCallback = std::function<void(const EventPayload&)>;
using CallbackId = uint64_t;

} // namespace warden::events

#include <catch2/catch_test_macros.hpp>
#include "warden/events/event_bridge.hpp"
#include "helpers/event_recorder.hpp"
#include <future>
#include <stdexcept>
#include <thread>
using namespace warden;
using namespace warden::events;
using namespace warden::test_helpers;
using namespace std::chrono_literals;
namespace {
std::vector<uint8_t> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}
}
TEST_CASE("EventBridge - Registration", "[events][bridge]") {
    EventBridge bridge;
    EventRecorder recorder;
    SECTION("Register and unregister") {
        auto id = bridge.Register(7, recorder.Callback());
        REQUIRE(id.IsOk());
        REQUIRE(bridge.HasCallback(7));
        REQUIRE(bridge.Stats().registered_count == 1);
        bridge.Unregister(7);
        REQUIRE_FALSE(bridge.HasCallback(7));
        bridge.Unregister(7);
        REQUIRE(bridge.Stats().registered_count == 0);
    }
    SECTION("Empty callback is rejected") {
        auto id = bridge.Register(7, EventCallback{});
        REQUIRE(id.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::InvalidArgument); }));
        REQUIRE_FALSE(bridge.HasCallback(7));
    }
    SECTION("Re-registration yields a new id and keeps one slot") {
        const auto first = bridge.Register(7, recorder.Callback()).Unwrap();
        const auto second = bridge.Register(7, recorder.Callback()).Unwrap();
        REQUIRE(first != second);
        REQUIRE(bridge.Stats().registered_count == 1);
    }
}
TEST_CASE("EventBridge - Queued delivery", "[events][bridge]") {
    EventBridge bridge;
    EventRecorder recorder;
    REQUIRE(bridge.Register(1, recorder.Callback()).IsOk());
    SECTION("Events arrive in emission order with their data") {
        for (int i = 0; i < 50; ++i) {
            REQUIRE(bridge.Emit(1, "seq", Bytes(std::to_string(i))).IsOk());
        }
        REQUIRE(recorder.WaitFor(50));
        const auto events = recorder.Events();
        for (int i = 0; i < 50; ++i) {
            REQUIRE(events[i].type == "seq");
            REQUIRE(events[i].handle == 1);
            REQUIRE(events[i].data == Bytes(std::to_string(i)));
            REQUIRE(events[i].timestamp_ms > 0);
        }
        REQUIRE(bridge.WaitUntilIdle(5s));
        const auto stats = bridge.Stats();
        REQUIRE(stats.emitted_total == 50);
        REQUIRE(stats.delivered_total == 50);
        REQUIRE(stats.queued_count == 0);
    }
    SECTION("Events without a callback are dropped and counted") {
        REQUIRE(bridge.Emit(99, "orphan", {}).IsOk());
        REQUIRE(bridge.WaitUntilIdle(5s));
        REQUIRE(bridge.Stats().dropped_total == 1);
        REQUIRE(recorder.Count() == 0);
    }
    SECTION("Emit does not wait for a slow callback") {
        std::promise<void> release;
        auto released = release.get_future().share();
        REQUIRE(bridge.Register(2, [released](const EventPayload&) { released.wait(); }).IsOk());
        REQUIRE(bridge.Emit(2, "block", {}).IsOk());
        const auto start = std::chrono::steady_clock::now();
        REQUIRE(bridge.Emit(2, "behind", {}).IsOk());
        REQUIRE(std::chrono::steady_clock::now() - start < 1s);
        REQUIRE_FALSE(bridge.WaitUntilIdle(20ms));
        release.set_value();
        REQUIRE(bridge.WaitUntilIdle(5s));
    }
}
TEST_CASE("EventBridge - Callback resolved at delivery", "[events][bridge]") {
    EventBridge bridge;
    EventRecorder older;
    EventRecorder newer;
    std::promise<void> release;
    auto released = release.get_future().share();
    REQUIRE(bridge.Register(5, [released](const EventPayload&) { released.wait(); }).IsOk());
    REQUIRE(bridge.Emit(5, "barrier", {}).IsOk());
    REQUIRE(bridge.Register(6, older.Callback()).IsOk());
    REQUIRE(bridge.Emit(6, "pending", {}).IsOk());
    SECTION("Queued event goes to the newer callback") {
        REQUIRE(bridge.Register(6, newer.Callback()).IsOk());
        release.set_value();
        REQUIRE(bridge.WaitUntilIdle(5s));
        REQUIRE(older.Count() == 0);
        REQUIRE(newer.Count() == 1);
    }
    SECTION("Queued event is dropped after unregister") {
        bridge.Unregister(6);
        release.set_value();
        REQUIRE(bridge.WaitUntilIdle(5s));
        REQUIRE(older.Count() == 0);
        REQUIRE(bridge.Stats().dropped_total == 1);
    }
}
TEST_CASE("EventBridge - Direct delivery", "[events][bridge]") {
    EventBridge bridge;
    SECTION("Runs on the calling thread before returning") {
        std::thread::id seen;
        REQUIRE(bridge.Register(3, [&seen](const EventPayload&) { seen = std::this_thread::get_id(); }).IsOk());
        REQUIRE(bridge.EmitDirect(3, "now", {}).IsOk());
        REQUIRE(seen == std::this_thread::get_id());
        REQUIRE(bridge.Stats().delivered_total == 1);
    }
    SECTION("Without a callback the event is dropped") {
        REQUIRE(bridge.EmitDirect(3, "now", {}).IsOk());
        REQUIRE(bridge.Stats().dropped_total == 1);
    }
    SECTION("Throwing callbacks are contained and counted") {
        REQUIRE(bridge.Register(3, [](const EventPayload&) { throw std::runtime_error("host failure"); }).IsOk());
        REQUIRE(bridge.EmitDirect(3, "boom", {}).IsOk());
        REQUIRE(bridge.Emit(3, "boom", {}).IsOk());
        REQUIRE(bridge.WaitUntilIdle(5s));
        REQUIRE(bridge.Stats().callback_failures == 2);
        REQUIRE(bridge.EmitDirect(3, "still-alive", {}).IsOk());
    }
}
TEST_CASE("EventBridge - Shutdown", "[events][bridge]") {
    EventBridge bridge;
    EventRecorder recorder;
    REQUIRE(bridge.Register(4, recorder.Callback()).IsOk());
    bridge.Shutdown();
    SECTION("Is terminal") {
        REQUIRE(bridge.IsShutDown());
        REQUIRE(bridge.Emit(4, "late", {}).IsErr());
        REQUIRE(bridge.EmitDirect(4, "late", {}).IsErr());
        REQUIRE(bridge.Register(4, recorder.Callback()).IsErr());
        REQUIRE(recorder.Count() == 0);
    }
    SECTION("Releases registrations and is idempotent") {
        REQUIRE_FALSE(bridge.HasCallback(4));
        bridge.Shutdown();
        REQUIRE(bridge.WaitUntilIdle(0ms));
    }
}
TEST_CASE("EventBridge - Shutdown from inside a callback", "[events][bridge]") {
    EventBridge bridge;
    std::promise<void> done;
    auto finished = done.get_future();
    REQUIRE(bridge.Register(8, [&bridge, &done](const EventPayload&) {
        bridge.Shutdown();
        done.set_value();
    }).IsOk());
    REQUIRE(bridge.Emit(8, "stop", {}).IsOk());
    REQUIRE(finished.wait_for(5s) == std::future_status::ready);
    REQUIRE(bridge.IsShutDown());
}
TEST_CASE("EventBridge - Destroyed from inside its own callback", "[events][bridge]") {
    SECTION("Queued callback deletes the bridge") {
        auto* bridge = new EventBridge();
        std::promise<void> done;
        auto finished = done.get_future();
        REQUIRE(bridge->Register(3, [bridge, &done](const EventPayload&) {
            delete bridge;
            done.set_value();
        }).IsOk());
        REQUIRE(bridge->Emit(3, "wallet:stopped", {}).IsOk());
        REQUIRE(finished.wait_for(5s) == std::future_status::ready);
    }
    SECTION("Direct callback deletes the bridge") {
        auto* bridge = new EventBridge();
        int calls = 0;
        REQUIRE(bridge->Register(4, [bridge, &calls](const EventPayload&) {
            ++calls;
            delete bridge;
        }).IsOk());
        REQUIRE(bridge->EmitDirect(4, "wallet:stopped", {}).IsOk());
        REQUIRE(calls == 1);
    }
}

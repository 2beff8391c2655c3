#include <catch2/catch_test_macros.hpp>
#include "warden/storage/async_secure_storage.hpp"
#include "helpers/fake_backend.hpp"
#include <string_view>
using namespace warden;
using namespace warden::storage;
using namespace warden::test_helpers;
using warden::configuration::StorageConfig;
using namespace std::chrono_literals;
namespace {
std::vector<uint8_t> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}
std::shared_ptr<SecureStorage> MakeShared(const std::shared_ptr<FakeBackendState>& state) {
    auto storage = SecureStorage::FromBackends(StorageConfig::Default(), MakeFakeBackend(state), nullptr);
    REQUIRE(storage.IsOk());
    return std::shared_ptr<SecureStorage>(std::move(storage).Unwrap());
}
}
TEST_CASE("AsyncSecureStorage - Operations complete on workers", "[storage][async]") {
    auto state = std::make_shared<FakeBackendState>();
    AsyncSecureStorage async(MakeShared(state), 2, 5000ms);
    SECTION("Store then retrieve") {
        auto stored = async.Store("alpha", Bytes("one"), StoreOptions{});
        REQUIRE(async.Await(stored).IsOk());
        auto retrieved = async.Retrieve("alpha");
        auto value = async.Await(retrieved);
        REQUIRE(value.IsOk());
        REQUIRE(value.Unwrap() == std::optional(Bytes("one")));
    }
    SECTION("Exists, list and remove") {
        auto stored = async.Store("beta", Bytes("two"), StoreOptions{});
        REQUIRE(async.Await(stored).IsOk());
        auto exists = async.Exists("beta");
        REQUIRE(async.Await(exists).Unwrap());
        auto listed = async.List();
        REQUIRE(async.Await(listed).Unwrap() == std::vector<std::string>{"beta"});
        auto removed = async.Remove("beta");
        REQUIRE(async.Await(removed).IsOk());
        auto gone = async.Exists("beta");
        REQUIRE_FALSE(async.Await(gone).Unwrap());
    }
    SECTION("Invalid keys fail through the future") {
        auto stored = async.Store("", Bytes("x"), StoreOptions{});
        REQUIRE(async.Await(stored).IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::InvalidArgument); }));
    }
    SECTION("Many concurrent stores all land") {
        std::vector<AsyncSecureStorage::Future<Unit>> futures;
        for (int i = 0; i < 16; ++i) {
            futures.push_back(async.Store("key-" + std::to_string(i), Bytes("v"), StoreOptions{}));
        }
        for (auto& future : futures) {
            REQUIRE(async.Await(future).IsOk());
        }
        REQUIRE(state->writes == 16);
    }
    async.Shutdown();
}
TEST_CASE("AsyncSecureStorage - Timeouts and shutdown", "[storage][async]") {
    auto state = std::make_shared<FakeBackendState>();
    SECTION("Slow backend reports a timeout without cancelling the write") {
        state->operation_delay = 300ms;
        AsyncSecureStorage async(MakeShared(state), 1, 20ms);
        auto stored = async.Store("slow", Bytes("v"), StoreOptions{});
        auto result = async.Await(stored);
        REQUIRE(result.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::StorageUnavailable); }));
        async.Shutdown();
        REQUIRE(state->Contains("slow"));
    }
    SECTION("Consumed future is rejected") {
        AsyncSecureStorage async(MakeShared(state), 1, 1000ms);
        auto listed = async.List();
        REQUIRE(async.Await(listed).IsOk());
        REQUIRE(async.Await(listed).IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::InvalidArgument); }));
        async.Shutdown();
    }
    SECTION("Submissions after shutdown are refused") {
        AsyncSecureStorage async(MakeShared(state), 1, 1000ms);
        async.Shutdown();
        auto stored = async.Store("late", Bytes("v"), StoreOptions{});
        REQUIRE(async.Await(stored).IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::StorageUnavailable); }));
        REQUIRE_FALSE(state->Contains("late"));
    }
    SECTION("Queued work finishes before shutdown returns") {
        state->operation_delay = 10ms;
        AsyncSecureStorage async(MakeShared(state), 1, 1000ms);
        std::vector<AsyncSecureStorage::Future<Unit>> futures;
        for (int i = 0; i < 4; ++i) {
            futures.push_back(async.Store("queued-" + std::to_string(i), Bytes("v"), StoreOptions{}));
        }
        async.Shutdown();
        for (auto& future : futures) {
            REQUIRE(AsyncSecureStorage::AwaitWithTimeout(future, 0ms).IsOk());
        }
    }
}

#include <catch2/catch_test_macros.hpp>
#include "warden/runtime/warden_runtime.hpp"
#include "warden/storage/backend_factory.hpp"
#include "warden/events/wallet_event_emitter.hpp"
#include "warden/core/constants.hpp"
#include "helpers/event_recorder.hpp"
#include "helpers/fake_backend.hpp"
#include "helpers/mock_wallet_engine.hpp"
#include <future>
#include <string_view>

using namespace warden;
using namespace warden::runtime;
using namespace warden::test_helpers;
using warden::configuration::BackendKind;
using warden::configuration::RuntimeConfig;
using warden::security::AccessControlPolicy;
using namespace std::chrono_literals;

namespace {

std::vector<uint8_t> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

BackendKind ForeignBackend() {
    return storage::CurrentPlatform() == storage::Platform::MacOS
        ? BackendKind::CredentialStore
        : BackendKind::Keychain;
}

} // namespace

TEST_CASE("Integration - Runtime with in-process storage", "[integration][runtime]") {
    auto created = WardenRuntime::Create(RuntimeConfig::InProcess());
    REQUIRE(created.IsOk());
    auto runtime = std::move(created).Unwrap();

    SECTION("Wallet seed survives a store/retrieve cycle") {
        auto storage = runtime->Storage().Unwrap();
        REQUIRE(storage->BackendName() == "vault");
        const auto seed = Bytes("abandon ability able about above absent");

        REQUIRE(storage->Store("wallet-1.seed", seed, AccessControlPolicy::HighSecurity()).IsOk());
        REQUIRE(storage->Exists("wallet-1.seed").Unwrap());
        REQUIRE(storage->Retrieve("wallet-1.seed").Unwrap() == std::optional(seed));

        const auto metadata = storage->GetMetadata("wallet-1.seed");
        REQUIRE(metadata.IsOk());
        REQUIRE(metadata.Unwrap().size == seed.size());

        REQUIRE(storage->Test().IsOk());
        REQUIRE(storage->List().Unwrap() == std::vector<std::string>{"wallet-1.seed"});
        REQUIRE(storage->Remove("wallet-1.seed").IsOk());
        REQUIRE_FALSE(storage->Retrieve("wallet-1.seed").Unwrap().has_value());
    }

    SECTION("Async facade shares the same store") {
        auto async = runtime->AsyncStorage().Unwrap();
        auto stored = async->Store("async-key", Bytes("value"), storage::StoreOptions{});
        REQUIRE(async->Await(stored).IsOk());
        REQUIRE(runtime->Storage().Unwrap()->Exists("async-key").Unwrap());
        auto info = async->GetInfo();
        const auto result = async->Await(info);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().item_count == 1);
        REQUIRE_FALSE(result.Unwrap().persistent);
    }

    SECTION("Wallet events flow through the runtime bridge") {
        auto engine = std::make_shared<MockWalletEngine>("integration");
        const auto wallet = runtime->Resources().AddWallet(engine).Unwrap();
        EventRecorder recorder;
        REQUIRE(runtime->Resources().RegisterWalletCallback(wallet, recorder.Callback()).IsOk());

        auto emitter = engine->Emitter();
        REQUIRE(emitter->OnWalletStarted().IsOk());
        REQUIRE(emitter->OnSyncProgress(events::SyncProgressEvent{.current = 50, .total = 100}).IsOk());
        REQUIRE(emitter->OnTransaction(events::TransactionReceived{.tx_id = 1, .amount = 10}).IsOk());
        REQUIRE(recorder.WaitFor(3));

        const auto received = recorder.Events();
        REQUIRE(received[0].type == EventConstants::WALLET_STARTED);
        REQUIRE(received[1].type == EventConstants::SYNC_PROGRESS);
        REQUIRE(received[2].type == EventConstants::TX_RECEIVED);

        REQUIRE(runtime->Resources().DestroyWallet(wallet).IsOk());
        REQUIRE(engine->ShutdownCount() == 1);
        REQUIRE_FALSE(runtime->Events().HasCallback(wallet));
    }

    SECTION("Shutdown releases wallets and stops the bridge") {
        auto engine = std::make_shared<MockWalletEngine>();
        const auto wallet = runtime->Resources().AddWallet(engine).Unwrap();
        REQUIRE(runtime->Resources().RegisterWalletCallback(wallet, [](const events::EventPayload&) {}).IsOk());

        runtime->Shutdown();
        REQUIRE(runtime->IsShutDown());
        REQUIRE(engine->ShutdownCount() == 1);
        REQUIRE(runtime->Events().IsShutDown());
        REQUIRE(runtime->Resources().Counts().wallets == 0);
        REQUIRE(engine->Emitter()->OnBalance(events::BalanceEvent{}).IsErr());

        auto async = runtime->AsyncStorage().Unwrap();
        auto late = async->List();
        REQUIRE(async->Await(late).IsErrAnd([](const WardenFailure& f) {
            return f.Is(FailureType::StorageUnavailable);
        }));

        runtime->Shutdown();
        REQUIRE(engine->ShutdownCount() == 1);
    }
}

TEST_CASE("Integration - Runtime storage requirements", "[integration][runtime]") {
    SECTION("Missing storage is fatal by default") {
        auto config = RuntimeConfig::Default();
        config.storage.backend = ForeignBackend();
        auto created = WardenRuntime::Create(config);
        REQUIRE(created.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::StorageUnavailable); }));
    }

    SECTION("Optional storage starts without a store") {
        auto config = RuntimeConfig::Default();
        config.storage.backend = ForeignBackend();
        config.require_storage = false;
        auto runtime = WardenRuntime::Create(config).Unwrap();
        REQUIRE(runtime->Storage().IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::StorageUnavailable); }));
        REQUIRE(runtime->AsyncStorage().IsErr());
        REQUIRE(runtime->Resources().LoadScript(models::ScriptKind::Script, Bytes("op")).IsOk());
    }

    SECTION("Invalid configuration is rejected") {
        auto config = RuntimeConfig::InProcess();
        config.storage.service.clear();
        REQUIRE(WardenRuntime::Create(config).IsErrAnd([](const WardenFailure& f) {
            return f.Is(FailureType::InvalidArgument);
        }));
    }

    SECTION("Injected storage is used as given") {
        auto state = std::make_shared<FakeBackendState>();
        auto storage = storage::SecureStorage::FromBackends(
            configuration::StorageConfig::Default(), MakeFakeBackend(state, "injected"), nullptr);
        REQUIRE(storage.IsOk());
        auto runtime = WardenRuntime::CreateWithStorage(RuntimeConfig::Default(),
            std::shared_ptr<storage::SecureStorage>(std::move(storage).Unwrap())).Unwrap();
        REQUIRE(runtime->Storage().Unwrap()->BackendName() == "injected");
        REQUIRE(runtime->Storage().Unwrap()->Store("k", Bytes("v"), AccessControlPolicy::Default()).IsOk());
        REQUIRE(state->Contains("k"));

        REQUIRE(WardenRuntime::CreateWithStorage(RuntimeConfig::Default(), nullptr).IsErr());
    }
}

TEST_CASE("Integration - Runtime released from a wallet callback", "[integration][runtime][events]") {
    WardenRuntime* runtime = WardenRuntime::Create(RuntimeConfig::InProcess()).Unwrap().release();
    auto engine = std::make_shared<MockWalletEngine>("self-release");
    const auto wallet = runtime->Resources().AddWallet(engine).Unwrap();

    std::promise<void> released;
    auto finished = released.get_future();
    REQUIRE(runtime->Resources().RegisterWalletCallback(wallet, [runtime, &released](const events::EventPayload& payload) {
        if (payload.EventType() == EventConstants::WALLET_STOPPED) {
            delete runtime;
            released.set_value();
        }
    }).IsOk());

    REQUIRE(runtime->Events().Emit(wallet, EventConstants::WALLET_STOPPED, {}).IsOk());
    REQUIRE(finished.wait_for(5s) == std::future_status::ready);
    REQUIRE(engine->ShutdownCount() == 1);
}

TEST_CASE("Integration - Independent runtimes", "[integration][runtime]") {
    auto first = WardenRuntime::Create(RuntimeConfig::InProcess()).Unwrap();
    auto second = WardenRuntime::Create(RuntimeConfig::InProcess()).Unwrap();

    REQUIRE(first->Storage().Unwrap()->Store("shared-name", Bytes("one"), AccessControlPolicy::Default()).IsOk());
    REQUIRE_FALSE(second->Storage().Unwrap()->Exists("shared-name").Unwrap());

    const auto key = first->Resources().GeneratePrivateKey().Unwrap();
    REQUIRE(second->Resources().DestroyPrivateKey(key).IsErrAnd([](const WardenFailure& f) {
        return f.Is(FailureType::InvalidHandle);
    }));

    first->Shutdown();
    REQUIRE_FALSE(second->IsShutDown());
    REQUIRE(second->Storage().Unwrap()->Test().IsOk());
}

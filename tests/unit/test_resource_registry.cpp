#include <catch2/catch_test_macros.hpp>
#include "warden/handles/resource_registry.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "helpers/event_recorder.hpp"
#include "helpers/mock_wallet_engine.hpp"
#include <array>
using namespace warden;
using namespace warden::handles;
using namespace warden::test_helpers;
using warden::models::ScriptKind;
using namespace std::chrono_literals;
namespace {
bool IsInvalidHandle(const WardenFailure& failure) {
    return failure.Is(FailureType::InvalidHandle);
}
bool IsInvalidArgument(const WardenFailure& failure) {
    return failure.Is(FailureType::InvalidArgument);
}
// Encoding of the Ristretto255 generator, the public key of scalar 1.
constexpr std::array<uint8_t, 32> RISTRETTO_BASEPOINT = {
    0xe2, 0xf2, 0xae, 0x0a, 0x6a, 0xbc, 0x4e, 0x71, 0xa8, 0x84, 0xa9, 0x61, 0xc5, 0x00, 0x51, 0x5f,
    0x58, 0xe3, 0x0b, 0x6a, 0xa5, 0x82, 0xdd, 0x8d, 0xb6, 0xa6, 0x59, 0x45, 0xe0, 0x8d, 0x2d, 0x76};
std::array<uint8_t, 32> ScalarOne() {
    std::array<uint8_t, 32> scalar{};
    scalar[0] = 1;
    return scalar;
}
}
TEST_CASE("ResourceRegistry - Private and public keys", "[handles][registry]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    events::EventBridge bridge;
    ResourceRegistry registry(bridge);
    SECTION("Generated keys get distinct handles") {
        const auto first = registry.GeneratePrivateKey();
        const auto second = registry.GeneratePrivateKey();
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap() != second.Unwrap());
        REQUIRE(first.Unwrap() != HandleConstants::INVALID_HANDLE);
        REQUIRE(registry.Counts().private_keys == 2);
    }
    SECTION("Imported scalar derives the expected public key") {
        const auto scalar = ScalarOne();
        const auto key = registry.ImportPrivateKey(scalar).Unwrap();
        const auto public_key = registry.DerivePublicKey(key);
        REQUIRE(public_key.IsOk());
        const auto exported = registry.ExportPublicKey(public_key.Unwrap());
        REQUIRE(exported.IsOk());
        REQUIRE(exported.Unwrap() == std::vector<uint8_t>(RISTRETTO_BASEPOINT.begin(), RISTRETTO_BASEPOINT.end()));
    }
    SECTION("Malformed private keys are rejected") {
        const std::array<uint8_t, 31> short_key{};
        REQUIRE(registry.ImportPrivateKey(short_key).IsErrAnd(IsInvalidArgument));
        const std::array<uint8_t, 32> zero{};
        REQUIRE(registry.ImportPrivateKey(zero).IsErrAnd(IsInvalidArgument));
        std::array<uint8_t, 32> non_canonical;
        non_canonical.fill(0xff);
        REQUIRE(registry.ImportPrivateKey(non_canonical).IsErrAnd(IsInvalidArgument));
        REQUIRE(registry.Counts().private_keys == 0);
    }
    SECTION("Public key import validates the point") {
        REQUIRE(registry.ImportPublicKey(RISTRETTO_BASEPOINT).IsOk());
        std::array<uint8_t, 32> invalid;
        invalid.fill(0xff);
        REQUIRE(registry.ImportPublicKey(invalid).IsErrAnd(IsInvalidArgument));
        REQUIRE(registry.ImportPublicKey(std::span<const uint8_t>{}).IsErrAnd(IsInvalidArgument));
    }
    SECTION("Destroyed handles are invalid") {
        const auto key = registry.GeneratePrivateKey().Unwrap();
        const auto public_key = registry.DerivePublicKey(key).Unwrap();
        REQUIRE(registry.DestroyPrivateKey(key).IsOk());
        REQUIRE(registry.DestroyPrivateKey(key).IsErrAnd(IsInvalidHandle));
        REQUIRE(registry.DerivePublicKey(key).IsErrAnd(IsInvalidHandle));
        REQUIRE(registry.ExportPublicKey(public_key).IsOk());
        REQUIRE(registry.DestroyPublicKey(public_key).IsOk());
        REQUIRE(registry.ExportPublicKey(public_key).IsErrAnd(IsInvalidHandle));
    }
    SECTION("Unknown handles are invalid") {
        REQUIRE(registry.DerivePublicKey(12345).IsErrAnd(IsInvalidHandle));
        REQUIRE(registry.ExportPublicKey(HandleConstants::INVALID_HANDLE).IsErrAnd(IsInvalidHandle));
        REQUIRE(registry.DestroyPublicKey(12345).IsErrAnd(IsInvalidHandle));
    }
}
TEST_CASE("ResourceRegistry - Scripts and covenants", "[handles][registry]") {
    events::EventBridge bridge;
    ResourceRegistry registry(bridge);
    const std::vector<uint8_t> image = {0x7e, 0x01, 0x02, 0x03};
    SECTION("Load, size and export") {
        const auto script = registry.LoadScript(ScriptKind::Script, image).Unwrap();
        REQUIRE(registry.ScriptSize(ScriptKind::Script, script).Unwrap() == image.size());
        REQUIRE(registry.ScriptImage(ScriptKind::Script, script).Unwrap() == image);
        REQUIRE(registry.Counts().scripts == 1);
        REQUIRE(registry.Counts().covenants == 0);
    }
    SECTION("Kinds live in separate tables") {
        const auto script = registry.LoadScript(ScriptKind::Script, image).Unwrap();
        const auto covenant = registry.LoadScript(ScriptKind::Covenant, image).Unwrap();
        REQUIRE(registry.DestroyScript(ScriptKind::Covenant, covenant).IsOk());
        REQUIRE(registry.ScriptSize(ScriptKind::Script, script).IsOk());
        REQUIRE(registry.ScriptSize(ScriptKind::Covenant, covenant).IsErrAnd(IsInvalidHandle));
    }
    SECTION("Empty images are rejected") {
        REQUIRE(registry.LoadScript(ScriptKind::Covenant, std::span<const uint8_t>{}).IsErrAnd(IsInvalidArgument));
    }
    SECTION("Double destroy fails") {
        const auto script = registry.LoadScript(ScriptKind::Script, image).Unwrap();
        REQUIRE(registry.DestroyScript(ScriptKind::Script, script).IsOk());
        REQUIRE(registry.DestroyScript(ScriptKind::Script, script).IsErrAnd(IsInvalidHandle));
    }
}
TEST_CASE("ResourceRegistry - Wallets", "[handles][registry]") {
    events::EventBridge bridge;
    ResourceRegistry registry(bridge);
    auto engine = std::make_shared<MockWalletEngine>("primary");
    SECTION("Null engines are rejected") {
        REQUIRE(registry.AddWallet(nullptr).IsErrAnd(IsInvalidArgument));
    }
    SECTION("Adding attaches an emitter bound to the handle") {
        const auto handle = registry.AddWallet(engine).Unwrap();
        REQUIRE(engine->AttachCount() == 1);
        REQUIRE(engine->Emitter() != nullptr);
        REQUIRE(engine->Emitter()->WalletHandle() == handle);
        REQUIRE(registry.GetWallet(handle).Unwrap()->Name() == "primary");
    }
    SECTION("Emitter events reach the wallet callback") {
        const auto handle = registry.AddWallet(engine).Unwrap();
        EventRecorder recorder;
        REQUIRE(registry.RegisterWalletCallback(handle, recorder.Callback()).IsOk());
        REQUIRE(engine->Emitter()->OnBalance(events::BalanceEvent{.available = 1, .total = 1}).IsOk());
        REQUIRE(recorder.WaitFor(1));
        REQUIRE(recorder.Events().front().handle == handle);
    }
    SECTION("Destroy shuts the engine down and releases the callback") {
        const auto handle = registry.AddWallet(engine).Unwrap();
        EventRecorder recorder;
        REQUIRE(registry.RegisterWalletCallback(handle, recorder.Callback()).IsOk());
        REQUIRE(registry.DestroyWallet(handle).IsOk());
        REQUIRE(engine->ShutdownCount() == 1);
        REQUIRE_FALSE(bridge.HasCallback(handle));
        REQUIRE(registry.GetWallet(handle).IsErrAnd(IsInvalidHandle));
        REQUIRE(registry.DestroyWallet(handle).IsErrAnd(IsInvalidHandle));
        REQUIRE(engine->ShutdownCount() == 1);
    }
    SECTION("Callbacks only attach to live wallets") {
        EventRecorder recorder;
        REQUIRE(registry.RegisterWalletCallback(HandleConstants::FIRST_HANDLE + 99, recorder.Callback())
            .IsErrAnd(IsInvalidHandle));
        const auto handle = registry.AddWallet(engine).Unwrap();
        REQUIRE(registry.DestroyWallet(handle).IsOk());
        REQUIRE(registry.RegisterWalletCallback(handle, recorder.Callback()).IsErrAnd(IsInvalidHandle));
        REQUIRE_FALSE(bridge.HasCallback(handle));
        REQUIRE(bridge.Stats().registered_count == 0);
    }
    SECTION("Empty callbacks are rejected for live wallets") {
        const auto handle = registry.AddWallet(engine).Unwrap();
        REQUIRE(registry.RegisterWalletCallback(handle, events::EventCallback{}).IsErrAnd(IsInvalidArgument));
    }
}
TEST_CASE("ResourceRegistry - DestroyAll", "[handles][registry]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    events::EventBridge bridge;
    auto first = std::make_shared<MockWalletEngine>("first");
    auto second = std::make_shared<MockWalletEngine>("second");
    {
        ResourceRegistry registry(bridge);
        const auto wallet = registry.AddWallet(first).Unwrap();
        REQUIRE(registry.AddWallet(second).IsOk());
        REQUIRE(registry.GeneratePrivateKey().IsOk());
        REQUIRE(registry.LoadScript(ScriptKind::Script, std::vector<uint8_t>{1}).IsOk());
        REQUIRE(registry.RegisterWalletCallback(wallet, [](const events::EventPayload&) {}).IsOk());
        registry.DestroyAll();
        const auto counts = registry.Counts();
        REQUIRE(counts.wallets == 0);
        REQUIRE(counts.private_keys == 0);
        REQUIRE(counts.scripts == 0);
        REQUIRE_FALSE(bridge.HasCallback(wallet));
        REQUIRE(first->ShutdownCount() == 1);
        REQUIRE(second->ShutdownCount() == 1);
    }
    REQUIRE(first->ShutdownCount() == 1);
}

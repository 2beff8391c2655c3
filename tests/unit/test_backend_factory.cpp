#include <catch2/catch_test_macros.hpp>
#include "warden/storage/backend_factory.hpp"
#include "warden/crypto/sodium_interop.hpp"
using namespace warden;
using namespace warden::storage;
using warden::configuration::BackendKind;
using warden::configuration::StorageConfig;
namespace {
StorageConfig WithBackend(const BackendKind kind, const bool fallback = true) {
    auto config = StorageConfig::Default();
    config.backend = kind;
    config.allow_headless_fallback = fallback;
    return config;
}
}
TEST_CASE("PlanBackends - Automatic selection", "[storage][factory]") {
    SECTION("macOS uses the Keychain") {
        auto plan = PlanBackends(Platform::MacOS, StorageConfig::Default()).Unwrap();
        REQUIRE(plan.primary == BackendKind::Keychain);
        REQUIRE_FALSE(plan.fallback.has_value());
    }
    SECTION("Windows uses the Credential Store") {
        auto plan = PlanBackends(Platform::Windows, StorageConfig::Default()).Unwrap();
        REQUIRE(plan.primary == BackendKind::CredentialStore);
        REQUIRE_FALSE(plan.fallback.has_value());
    }
    SECTION("Linux uses Secret Service with the libsecret fallback") {
        auto plan = PlanBackends(Platform::Linux, StorageConfig::Default()).Unwrap();
        REQUIRE(plan.primary == BackendKind::SecretService);
        REQUIRE(plan.fallback == BackendKind::LibSecret);
    }
    SECTION("Linux without the fallback") {
        auto plan = PlanBackends(Platform::Linux, WithBackend(BackendKind::Auto, false)).Unwrap();
        REQUIRE_FALSE(plan.fallback.has_value());
    }
    SECTION("Unknown platforms have no secure storage") {
        auto plan = PlanBackends(Platform::Other, StorageConfig::Default());
        REQUIRE(plan.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::StorageUnavailable); }));
    }
    SECTION("The vault is never chosen automatically") {
        for (const auto platform : {Platform::MacOS, Platform::Windows, Platform::Linux}) {
            auto plan = PlanBackends(platform, StorageConfig::Default()).Unwrap();
            REQUIRE(plan.primary != BackendKind::Vault);
            REQUIRE(plan.fallback != BackendKind::Vault);
        }
    }
}
TEST_CASE("PlanBackends - Explicit selection", "[storage][factory]") {
    SECTION("Vault exists everywhere") {
        for (const auto platform : {Platform::MacOS, Platform::Windows, Platform::Linux, Platform::Other}) {
            auto plan = PlanBackends(platform, StorageConfig::InProcess());
            REQUIRE(plan.IsOk());
            REQUIRE(plan.Unwrap().primary == BackendKind::Vault);
        }
    }
    SECTION("Platform backends elsewhere are unavailable") {
        REQUIRE(PlanBackends(Platform::Linux, WithBackend(BackendKind::Keychain)).IsErr());
        REQUIRE(PlanBackends(Platform::MacOS, WithBackend(BackendKind::CredentialStore)).IsErr());
        REQUIRE(PlanBackends(Platform::Windows, WithBackend(BackendKind::LibSecret)).IsErr());
    }
    SECTION("Explicit libsecret has no further fallback") {
        auto plan = PlanBackends(Platform::Linux, WithBackend(BackendKind::LibSecret)).Unwrap();
        REQUIRE(plan.primary == BackendKind::LibSecret);
        REQUIRE_FALSE(plan.fallback.has_value());
    }
}
TEST_CASE("CreateBackend - Vault", "[storage][factory]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto backend = CreateBackend(BackendKind::Vault, "org.warden.test");
    REQUIRE(backend.IsOk());
    REQUIRE(backend.Unwrap()->Name() == "vault");
    REQUIRE(CreateBackend(BackendKind::Auto, "org.warden.test").IsErr());
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include "warden/storage/secret_service_backend.hpp"
#include "warden/storage/libsecret_backend.hpp"
#include "warden/storage/secure_storage.hpp"
#include "warden/configuration/storage_config.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unistd.h>
using namespace warden;
using namespace warden::storage;
using warden::configuration::StorageConfig;
using warden::security::AccessControlPolicy;
namespace {
std::vector<uint8_t> Bytes(std::string_view text) {
    return {text.begin(), text.end()};
}
std::string TestService() {
    return "org.warden.roundtrip-test-" + std::to_string(::getpid());
}
}
TEMPLATE_TEST_CASE("Linux secret backends - Round trip against a live daemon",
                   "[storage][secret-service][libsecret][live]",
                   SecretServiceBackend, LibSecretBackend) {
    auto probe = std::make_unique<TestType>(TestService());
    if (probe->Probe().IsErr()) {
        SKIP("No session bus or secrets daemon");
    }
    StorageConfig config = StorageConfig::Default();
    config.service = TestService();
    auto created = SecureStorage::FromBackends(config, std::move(probe), nullptr);
    REQUIRE(created.IsOk());
    auto storage = std::move(created).Unwrap();
    if (storage->Store("roundtrip.seed", Bytes("seed-bytes"), AccessControlPolicy::LowSecurity()).IsErr()) {
        SKIP("Default collection is locked or needs a prompt");
    }
    SECTION("Stored bytes come back and metadata reports their size") {
        REQUIRE(storage->Exists("roundtrip.seed").Unwrap());
        const auto value = storage->Retrieve("roundtrip.seed").Unwrap();
        REQUIRE(value.has_value());
        REQUIRE(*value == Bytes("seed-bytes"));
        const auto metadata = storage->GetMetadata("roundtrip.seed").Unwrap();
        REQUIRE(metadata.size == 10);
        REQUIRE(metadata.policy == AccessControlPolicy::LowSecurity());
        REQUIRE(metadata.created_ms > 0);
    }
    SECTION("Store replaces and remove deletes") {
        REQUIRE(storage->Store("roundtrip.seed", Bytes("v2"), AccessControlPolicy::LowSecurity()).IsOk());
        REQUIRE(*storage->Retrieve("roundtrip.seed").Unwrap() == Bytes("v2"));
        REQUIRE(storage->GetMetadata("roundtrip.seed").Unwrap().size == 2);
        const auto accounts = storage->List().Unwrap();
        REQUIRE(accounts == std::vector<std::string>{"roundtrip.seed"});
    }
    REQUIRE(storage->Remove("roundtrip.seed").IsOk());
    REQUIRE_FALSE(storage->Exists("roundtrip.seed").Unwrap());
}

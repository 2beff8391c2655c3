#include <catch2/catch_test_macros.hpp>
#include "warden/storage/key_validator.hpp"
#include "warden/core/constants.hpp"
#include <string>
using namespace warden;
using namespace warden::storage;
namespace {
bool IsInvalidArgument(const WardenFailure& failure) {
    return failure.Is(FailureType::InvalidArgument);
}
}
TEST_CASE("KeyValidator - Accepted keys", "[storage][validation]") {
    REQUIRE(KeyValidator::ValidateKey("wallet_seed").IsOk());
    REQUIRE(KeyValidator::ValidateKey("a").IsOk());
    REQUIRE(KeyValidator::ValidateKey("Wallet-1.backup_v2").IsOk());
    REQUIRE(KeyValidator::ValidateKey(std::string(StorageConstants::MAX_KEY_LENGTH, 'k')).IsOk());
}
TEST_CASE("KeyValidator - Rejected keys", "[storage][validation]") {
    SECTION("Empty") {
        auto result = KeyValidator::ValidateKey("");
        REQUIRE(result.IsErrAnd(IsInvalidArgument));
        REQUIRE(result.UnwrapErr().message == ErrorMessages::KEY_EMPTY);
    }
    SECTION("Too long") {
        auto result = KeyValidator::ValidateKey(std::string(StorageConstants::MAX_KEY_LENGTH + 1, 'k'));
        REQUIRE(result.IsErrAnd(IsInvalidArgument));
        REQUIRE(result.UnwrapErr().message == ErrorMessages::KEY_TOO_LONG);
    }
    SECTION("Characters outside the alphabet") {
        for (const char* key : {"wallet seed", "a/b", "key:1", "naïve", "tab\there", "line\n", "*"}) {
            REQUIRE(KeyValidator::ValidateKey(key).IsErrAnd(IsInvalidArgument));
        }
    }
    SECTION("Embedded NUL") {
        const std::string key("ab\0cd", 5);
        REQUIRE(KeyValidator::ValidateKey(key).IsErrAnd(IsInvalidArgument));
    }
}
TEST_CASE("KeyValidator - Service names", "[storage][validation]") {
    REQUIRE(KeyValidator::ValidateServiceName(StorageConstants::DEFAULT_SERVICE).IsOk());
    REQUIRE(KeyValidator::ValidateServiceName("").IsErrAnd(IsInvalidArgument));
    REQUIRE(KeyValidator::ValidateServiceName("org warden").IsErrAnd(IsInvalidArgument));
    REQUIRE(KeyValidator::IsAllowedCharacter('-'));
    REQUIRE_FALSE(KeyValidator::IsAllowedCharacter('@'));
}

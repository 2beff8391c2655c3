#include <catch2/catch_test_macros.hpp>
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include <string>
using namespace warden;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, WardenFailure>::Ok(unit);
        REQUIRE(result.IsOk());
    }
    SECTION("Unwrap on Err throws instead of reading garbage") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("FromOptional") {
        auto present = Result<int, std::string>::FromOptional(7, "missing");
        auto absent = Result<int, std::string>::FromOptional(std::nullopt, "missing");
        REQUIRE(present.Unwrap() == 7);
        REQUIRE(absent.UnwrapErr() == "missing");
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
}
TEST_CASE("Result<T, E> - UnwrapOr", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
}
namespace {
Result<Unit, WardenFailure> RequirePositive(const int value) {
    if (value <= 0) {
        return Result<Unit, WardenFailure>::Err(WardenFailure::InvalidArgument("not positive"));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}
Result<std::string, WardenFailure> Describe(const int value) {
    using R = Result<std::string, WardenFailure>;
    WARDEN_TRY_ERR(R, RequirePositive(value));
    return R::Ok(std::to_string(value));
}
}
TEST_CASE("Result<T, E> - WARDEN_TRY_ERR propagation", "[result][core]") {
    REQUIRE(Describe(3).Unwrap() == "3");
    auto failed = Describe(-1);
    REQUIRE(failed.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::InvalidArgument); }));
    REQUIRE(failed.UnwrapErr().message == "not positive");
}
TEST_CASE("WardenFailure - Taxonomy", "[result][core]") {
    SECTION("Only StorageUnavailable is transient") {
        REQUIRE(WardenFailure::StorageUnavailable("x").IsTransient());
        REQUIRE_FALSE(WardenFailure::AccessDenied("x").IsTransient());
        REQUIRE_FALSE(WardenFailure::NotFound("x").IsTransient());
        REQUIRE_FALSE(WardenFailure::BackendError("x").IsTransient());
    }
    SECTION("Sodium failures convert") {
        const auto small = WardenFailure::FromSodiumFailure(SodiumFailure::BufferTooSmall("short"));
        const auto alloc = WardenFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom"));
        REQUIRE(small.Is(FailureType::InvalidArgument));
        REQUIRE(alloc.Is(FailureType::BackendError));
        REQUIRE(alloc.message == "oom");
    }
    SECTION("Type names") {
        REQUIRE(FailureTypeName(FailureType::DuplicateItem) == "DuplicateItem");
        REQUIRE(FailureTypeName(FailureType::InvalidHandle) == "InvalidHandle");
    }
}

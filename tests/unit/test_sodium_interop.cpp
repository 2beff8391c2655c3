#include <catch2/catch_test_macros.hpp>
#include "warden/crypto/sodium_interop.hpp"
#include "warden/crypto/sodium_secure_memory_handle.hpp"
#include "warden/core/constants.hpp"
#include <algorithm>
#include <cctype>
using namespace warden;
using namespace warden::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
}
TEST_CASE("SodiumInterop - Secure Wipe and comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe zeroes the buffer") {
        std::vector<uint8_t> buffer(64, 0xFF);
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe of an empty buffer is safe") {
        std::vector<uint8_t> empty;
        SodiumInterop::SecureWipe(empty);
        REQUIRE(empty.empty());
    }
    SECTION("Constant time equality") {
        const std::vector<uint8_t> a(32, 0x42);
        std::vector<uint8_t> b(32, 0x42);
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
        b[31] = 0x43;
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, std::vector<uint8_t>(31, 0x42)));
    }
}
TEST_CASE("SodiumInterop - Randomness", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Random bytes differ") {
        REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    }
    SECTION("RandomHex is lowercase hex of twice the length") {
        const auto hex = SodiumInterop::RandomHex(8);
        REQUIRE(hex.size() == 16);
        REQUIRE(std::all_of(hex.begin(), hex.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f');
        }));
    }
}
TEST_CASE("SodiumInterop - Ristretto255", "[sodium][crypto][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Generated scalars are canonical and derive valid points") {
        auto scalar = SodiumInterop::GenerateScalar();
        REQUIRE(scalar.IsOk());
        auto bytes = scalar.Unwrap().ReadBytes().Unwrap();
        REQUIRE(SodiumInterop::IsCanonicalScalar(bytes));
        auto point = SodiumInterop::DerivePublicPoint(bytes);
        REQUIRE(point.IsOk());
        REQUIRE(point.Unwrap().size() == Constants::RISTRETTO_POINT_SIZE);
        REQUIRE(SodiumInterop::IsValidPoint(point.Unwrap()));
    }
    SECTION("Non-canonical scalar is rejected") {
        const std::vector<uint8_t> all_ones(Constants::RISTRETTO_SCALAR_SIZE, 0xFF);
        REQUIRE_FALSE(SodiumInterop::IsCanonicalScalar(all_ones));
    }
    SECTION("Zero scalar has no public point") {
        const std::vector<uint8_t> zero(Constants::RISTRETTO_SCALAR_SIZE, 0x00);
        REQUIRE(SodiumInterop::DerivePublicPoint(zero).IsErr());
    }
    SECTION("Arbitrary bytes are not a point") {
        const std::vector<uint8_t> garbage(Constants::RISTRETTO_POINT_SIZE, 0xFF);
        REQUIRE_FALSE(SodiumInterop::IsValidPoint(garbage));
    }
}
TEST_CASE("SecureMemoryHandle - Lifecycle", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate and zero size") {
        auto handle = SecureMemoryHandle::Allocate(32);
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().Size() == 32);
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("Move transfers ownership") {
        auto first = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle second(std::move(first));
        REQUIRE(first.IsInvalid());
        REQUIRE_FALSE(second.IsInvalid());
        REQUIRE(first.WithReadAccess([](std::span<const uint8_t>) { return 0; }).IsErr());
    }
    SECTION("Write larger than the buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto written = handle.Write(std::vector<uint8_t>(17, 0x01));
        REQUIRE(written.IsErrAnd([](const SodiumFailure& f) { return f.type == SodiumFailureType::BufferTooSmall; }));
    }
    SECTION("FromBytes round-trips through access callbacks") {
        const std::vector<uint8_t> data = {1, 2, 3, 4};
        auto handle = SecureMemoryHandle::FromBytes(data).Unwrap();
        auto copied = handle.WithReadAccess([](std::span<const uint8_t> view) {
            return std::vector<uint8_t>(view.begin(), view.end());
        });
        REQUIRE(copied.Unwrap() == data);
        REQUIRE(handle.WithWriteAccess([](std::span<uint8_t> view) {
            view[0] = 9;
            return unit;
        }).IsOk());
        REQUIRE(handle.ReadBytes().Unwrap()[0] == 9);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "warden/security/access_control_policy.hpp"
using namespace warden;
using namespace warden::security;
TEST_CASE("AccessControlPolicy - Presets", "[security][policy]") {
    SECTION("Low security needs no authentication and is always readable") {
        constexpr auto policy = AccessControlPolicy::LowSecurity();
        STATIC_REQUIRE_FALSE(policy.RequiresAuthentication());
        STATIC_REQUIRE(policy.GetAccessibility() == Accessibility::Always);
    }
    SECTION("Standard security is user presence with passcode fallback") {
        constexpr auto policy = AccessControlPolicy::StandardSecurity();
        STATIC_REQUIRE(policy.RequiresUserPresence());
        STATIC_REQUIRE(policy.AllowsPasscodeFallback());
        STATIC_REQUIRE_FALSE(policy.RequiresBiometry());
        STATIC_REQUIRE(policy.GetAccessibility() == Accessibility::WhenUnlockedDeviceOnly);
        STATIC_REQUIRE(policy.IsDeviceOnly());
    }
    SECTION("High security is biometry without fallback") {
        constexpr auto policy = AccessControlPolicy::HighSecurity();
        STATIC_REQUIRE(policy.RequiresBiometry());
        STATIC_REQUIRE_FALSE(policy.AllowsPasscodeFallback());
        STATIC_REQUIRE(policy.GetAccessibility() == Accessibility::WhenUnlockedDeviceOnly);
    }
    SECTION("Default is standard") {
        STATIC_REQUIRE(AccessControlPolicy::Default() == AccessControlPolicy::StandardSecurity());
    }
}
TEST_CASE("AccessControlPolicy - Builder", "[security][policy]") {
    const auto policy = AccessControlPolicy::Custom()
        .WithUserPresence()
        .WithAccessibility(Accessibility::AfterFirstUnlockDeviceOnly);
    REQUIRE(policy.RequiresUserPresence());
    REQUIRE_FALSE(policy.RequiresBiometry());
    REQUIRE(policy.GetAccessibility() == Accessibility::AfterFirstUnlockDeviceOnly);
    SECTION("Builder returns a new value") {
        const auto base = AccessControlPolicy::Custom();
        const auto modified = base.WithBiometry();
        REQUIRE_FALSE(base.RequiresBiometry());
        REQUIRE(modified.RequiresBiometry());
    }
    SECTION("Biometry alone does not imply presence") {
        const auto biometry_only = AccessControlPolicy::Custom().WithBiometry();
        REQUIRE(biometry_only.RequiresAuthentication());
        REQUIRE_FALSE(biometry_only.RequiresUserPresence());
    }
}
TEST_CASE("AccessControlPolicy - Describe", "[security][policy]") {
    REQUIRE(AccessControlPolicy::LowSecurity().Describe() == "No authentication required, accessible always");
    REQUIRE(AccessControlPolicy::StandardSecurity().Describe() ==
            "User authentication required, with passcode fallback, accessible when unlocked (this device only)");
    REQUIRE(AccessControlPolicy::HighSecurity().Describe() ==
            "Biometric authentication required (no fallback), accessible when unlocked (this device only)");
    REQUIRE(AccessControlPolicy::Custom().WithBiometry().Describe() ==
            "Biometric authentication required (no fallback), biometry only, accessible when unlocked");
}
TEST_CASE("AccessControlPolicy - Encoding", "[security][policy]") {
    SECTION("Encode and decode every preset") {
        for (const auto& policy : {AccessControlPolicy::LowSecurity(), AccessControlPolicy::StandardSecurity(),
                                   AccessControlPolicy::HighSecurity(), AccessControlPolicy::Custom()}) {
            auto decoded = AccessControlPolicy::Decode(policy.Encode());
            REQUIRE(decoded.IsOk());
            REQUIRE(decoded.Unwrap() == policy);
        }
    }
    SECTION("Known encoding") {
        REQUIRE(AccessControlPolicy::StandardSecurity().Encode() == "b0p1f1a1");
    }
    SECTION("Malformed input") {
        for (const char* bad : {"", "b0p1f1", "x0p1f1a1", "b2p1f1a1", "b0p1f1a9", "b0p1f1a1x"}) {
            auto decoded = AccessControlPolicy::Decode(bad);
            REQUIRE(decoded.IsErrAnd([](const WardenFailure& f) { return f.Is(FailureType::InvalidArgument); }));
        }
    }
    SECTION("Accessibility index bounds") {
        REQUIRE(AccessControlPolicy::AccessibilityFromIndex(5) == Accessibility::AlwaysDeviceOnly);
        REQUIRE_FALSE(AccessControlPolicy::AccessibilityFromIndex(6).has_value());
        REQUIRE(AccessControlPolicy::AccessibilityName(Accessibility::AfterFirstUnlock) == "AfterFirstUnlock");
    }
}

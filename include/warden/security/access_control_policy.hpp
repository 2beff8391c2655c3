#pragma once

#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::security {

/// Device-lock condition under which a stored secret can be read.
enum class Accessibility : uint8_t {
    WhenUnlocked = 0,
    WhenUnlockedDeviceOnly = 1,
    AfterFirstUnlock = 2,
    AfterFirstUnlockDeviceOnly = 3,
    Always = 4,
    AlwaysDeviceOnly = 5
};

/// Authentication and accessibility requirements of one secret-store entry.
///
/// Plain value type. Presets:
/// - LowSecurity(): no authentication, readable Always (non-sensitive metadata only)
/// - StandardSecurity(): user presence with passcode fallback, WhenUnlockedDeviceOnly
/// - HighSecurity(): biometry, no passcode fallback, WhenUnlockedDeviceOnly
///
/// Biometry does not force RequiresUserPresence(). A policy with biometry and
/// without presence is a valid, if degenerate, combination: backends that can
/// enforce biometry treat it as biometry-only.
///
/// @example
/// ```cpp
/// auto policy = AccessControlPolicy::Custom()
///     .WithUserPresence()
///     .WithAccessibility(Accessibility::AfterFirstUnlockDeviceOnly);
/// ```
class AccessControlPolicy {
public:
    // =========================================================================
    // Presets
    // =========================================================================

    [[nodiscard]] static constexpr AccessControlPolicy LowSecurity() noexcept {
        return AccessControlPolicy(false, false, false, Accessibility::Always);
    }

    [[nodiscard]] static constexpr AccessControlPolicy StandardSecurity() noexcept {
        return AccessControlPolicy(false, true, true, Accessibility::WhenUnlockedDeviceOnly);
    }

    [[nodiscard]] static constexpr AccessControlPolicy HighSecurity() noexcept {
        return AccessControlPolicy(true, true, false, Accessibility::WhenUnlockedDeviceOnly);
    }

    /// Starting point for the builder: no authentication, WhenUnlocked.
    [[nodiscard]] static constexpr AccessControlPolicy Custom() noexcept {
        return AccessControlPolicy(false, false, false, Accessibility::WhenUnlocked);
    }

    [[nodiscard]] static constexpr AccessControlPolicy Default() noexcept {
        return StandardSecurity();
    }

    // =========================================================================
    // Builder
    // =========================================================================

    [[nodiscard]] constexpr AccessControlPolicy WithBiometry(const bool required = true) const noexcept {
        AccessControlPolicy copy = *this;
        copy.require_biometry_ = required;
        return copy;
    }

    [[nodiscard]] constexpr AccessControlPolicy WithUserPresence(const bool required = true) const noexcept {
        AccessControlPolicy copy = *this;
        copy.require_user_presence_ = required;
        return copy;
    }

    [[nodiscard]] constexpr AccessControlPolicy WithPasscodeFallback(const bool allowed = true) const noexcept {
        AccessControlPolicy copy = *this;
        copy.allow_passcode_fallback_ = allowed;
        return copy;
    }

    [[nodiscard]] constexpr AccessControlPolicy WithAccessibility(const Accessibility accessibility) const noexcept {
        AccessControlPolicy copy = *this;
        copy.accessibility_ = accessibility;
        return copy;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr bool RequiresBiometry() const noexcept { return require_biometry_; }
    [[nodiscard]] constexpr bool RequiresUserPresence() const noexcept { return require_user_presence_; }
    [[nodiscard]] constexpr bool AllowsPasscodeFallback() const noexcept { return allow_passcode_fallback_; }
    [[nodiscard]] constexpr Accessibility GetAccessibility() const noexcept { return accessibility_; }

    [[nodiscard]] constexpr bool RequiresAuthentication() const noexcept {
        return require_biometry_ || require_user_presence_;
    }

    [[nodiscard]] constexpr bool IsDeviceOnly() const noexcept {
        return accessibility_ == Accessibility::WhenUnlockedDeviceOnly ||
               accessibility_ == Accessibility::AfterFirstUnlockDeviceOnly ||
               accessibility_ == Accessibility::AlwaysDeviceOnly;
    }

    [[nodiscard]] constexpr bool operator==(const AccessControlPolicy& other) const noexcept = default;

    /// Human-readable summary for audit logs. Descriptive only.
    [[nodiscard]] std::string Describe() const;

    /// Compact form such as "b1p1f0a1", stored as an attribute next to the secret.
    [[nodiscard]] std::string Encode() const;
    static Result<AccessControlPolicy, WardenFailure> Decode(std::string_view encoded);

    static std::optional<Accessibility> AccessibilityFromIndex(uint8_t index) noexcept;
    static std::string_view AccessibilityName(Accessibility accessibility) noexcept;

private:
    constexpr AccessControlPolicy(
        const bool require_biometry,
        const bool require_user_presence,
        const bool allow_passcode_fallback,
        const Accessibility accessibility) noexcept
        : require_biometry_(require_biometry)
        , require_user_presence_(require_user_presence)
        , allow_passcode_fallback_(allow_passcode_fallback)
        , accessibility_(accessibility) {}

    bool require_biometry_;
    bool require_user_presence_;
    bool allow_passcode_fallback_;
    Accessibility accessibility_;
};

} // namespace warden::security

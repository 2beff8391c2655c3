#include "warden/security/access_control_policy.hpp"

#include "warden/core/format.hpp"

namespace warden::security {

namespace {

    constexpr size_t ENCODED_LENGTH = 8;
    constexpr uint8_t ACCESSIBILITY_COUNT = 6;

    std::string_view AccessibilityPhrase(const Accessibility accessibility) noexcept {
        switch (accessibility) {
            case Accessibility::WhenUnlocked: return "when unlocked";
            case Accessibility::WhenUnlockedDeviceOnly: return "when unlocked (this device only)";
            case Accessibility::AfterFirstUnlock: return "after first unlock";
            case Accessibility::AfterFirstUnlockDeviceOnly: return "after first unlock (this device only)";
            case Accessibility::Always: return "always";
            case Accessibility::AlwaysDeviceOnly: return "always (this device only)";
        }
        return "under unknown conditions";
    }

    std::optional<bool> ParseFlag(const std::string_view encoded, const size_t pos, const char tag) {
        if (encoded[pos] != tag) {
            return std::nullopt;
        }
        switch (encoded[pos + 1]) {
            case '0': return false;
            case '1': return true;
            default: return std::nullopt;
        }
    }

} // anonymous namespace

std::string AccessControlPolicy::Describe() const {
    std::string description;
    if (require_biometry_) {
        description = "Biometric authentication required";
        description += allow_passcode_fallback_ ? ", with passcode fallback" : " (no fallback)";
        if (!require_user_presence_) {
            description += ", biometry only";
        }
    } else if (require_user_presence_) {
        description = "User authentication required";
        if (allow_passcode_fallback_) {
            description += ", with passcode fallback";
        }
    } else {
        description = "No authentication required";
    }
    description += ", accessible ";
    description += AccessibilityPhrase(accessibility_);
    return description;
}

std::string AccessControlPolicy::Encode() const {
    return compat::format("b{}p{}f{}a{}",
        require_biometry_ ? 1 : 0,
        require_user_presence_ ? 1 : 0,
        allow_passcode_fallback_ ? 1 : 0,
        static_cast<int>(accessibility_));
}

Result<AccessControlPolicy, WardenFailure> AccessControlPolicy::Decode(const std::string_view encoded) {
    const auto malformed = [encoded]() {
        return Result<AccessControlPolicy, WardenFailure>::Err(
            WardenFailure::InvalidArgument(compat::format("Malformed access-control policy '{}'", encoded)));
    };
    if (encoded.size() != ENCODED_LENGTH) {
        return malformed();
    }
    const auto biometry = ParseFlag(encoded, 0, 'b');
    const auto presence = ParseFlag(encoded, 2, 'p');
    const auto fallback = ParseFlag(encoded, 4, 'f');
    if (!biometry || !presence || !fallback || encoded[6] != 'a' ||
        encoded[7] < '0' || encoded[7] > '9') {
        return malformed();
    }
    const auto accessibility = AccessibilityFromIndex(static_cast<uint8_t>(encoded[7] - '0'));
    if (!accessibility) {
        return malformed();
    }
    return Result<AccessControlPolicy, WardenFailure>::Ok(
        AccessControlPolicy(*biometry, *presence, *fallback, *accessibility));
}

std::optional<Accessibility> AccessControlPolicy::AccessibilityFromIndex(const uint8_t index) noexcept {
    if (index >= ACCESSIBILITY_COUNT) {
        return std::nullopt;
    }
    return static_cast<Accessibility>(index);
}

std::string_view AccessControlPolicy::AccessibilityName(const Accessibility accessibility) noexcept {
    switch (accessibility) {
        case Accessibility::WhenUnlocked: return "WhenUnlocked";
        case Accessibility::WhenUnlockedDeviceOnly: return "WhenUnlockedDeviceOnly";
        case Accessibility::AfterFirstUnlock: return "AfterFirstUnlock";
        case Accessibility::AfterFirstUnlockDeviceOnly: return "AfterFirstUnlockDeviceOnly";
        case Accessibility::Always: return "Always";
        case Accessibility::AlwaysDeviceOnly: return "AlwaysDeviceOnly";
    }
    return "Unknown";
}

} // namespace warden::security

#include "warden/storage/keychain_backend.hpp"
#include "warden/core/constants.hpp"
#include "warden/debug/log.hpp"

#include <CoreFoundation/CoreFoundation.h>
#include <Security/Security.h>

#include <charconv>
#include "warden/core/format.hpp"
#include <optional>
#include <utility>

namespace warden::storage {

namespace {

    constexpr std::string_view LOG_COMPONENT = "keychain";

    /// Owning reference for CoreFoundation objects obtained from Create/Copy calls.
    template<typename T>
    class CFRef {
    public:
        explicit CFRef(T ref = nullptr) noexcept : ref_(ref) {}
        ~CFRef() {
            if (ref_ != nullptr) {
                CFRelease(ref_);
            }
        }
        CFRef(CFRef&& other) noexcept : ref_(std::exchange(other.ref_, nullptr)) {}
        CFRef& operator=(CFRef&& other) noexcept {
            if (this != &other) {
                if (ref_ != nullptr) {
                    CFRelease(ref_);
                }
                ref_ = std::exchange(other.ref_, nullptr);
            }
            return *this;
        }
        CFRef(const CFRef&) = delete;
        CFRef& operator=(const CFRef&) = delete;

        [[nodiscard]] T Get() const noexcept { return ref_; }
        explicit operator bool() const noexcept { return ref_ != nullptr; }

    private:
        T ref_;
    };

    CFRef<CFStringRef> MakeString(const std::string_view text) {
        return CFRef<CFStringRef>(CFStringCreateWithBytes(kCFAllocatorDefault,
            reinterpret_cast<const UInt8*>(text.data()), static_cast<CFIndex>(text.size()),
            kCFStringEncodingUTF8, false));
    }

    CFRef<CFDataRef> MakeData(std::span<const uint8_t> bytes) {
        return CFRef<CFDataRef>(CFDataCreate(kCFAllocatorDefault, bytes.data(), static_cast<CFIndex>(bytes.size())));
    }

    std::string ToString(CFStringRef text) {
        if (text == nullptr) {
            return {};
        }
        if (const char* direct = CFStringGetCStringPtr(text, kCFStringEncodingUTF8)) {
            return direct;
        }
        const CFIndex capacity = CFStringGetMaximumSizeForEncoding(CFStringGetLength(text), kCFStringEncodingUTF8) + 1;
        std::string buffer(static_cast<size_t>(capacity), '\0');
        if (!CFStringGetCString(text, buffer.data(), capacity, kCFStringEncodingUTF8)) {
            return {};
        }
        buffer.resize(std::char_traits<char>::length(buffer.c_str()));
        return buffer;
    }

    int64_t ToUnixMs(CFTypeRef value) {
        if (value == nullptr || CFGetTypeID(value) != CFDateGetTypeID()) {
            return 0;
        }
        const CFAbsoluteTime absolute = CFDateGetAbsoluteTime(static_cast<CFDateRef>(value));
        return static_cast<int64_t>((absolute + kCFAbsoluteTimeIntervalSince1970) * 1000.0);
    }

    CFStringRef AccessibilityConstant(const security::Accessibility accessibility) {
        switch (accessibility) {
            case security::Accessibility::WhenUnlocked: return kSecAttrAccessibleWhenUnlocked;
            case security::Accessibility::WhenUnlockedDeviceOnly: return kSecAttrAccessibleWhenUnlockedThisDeviceOnly;
            case security::Accessibility::AfterFirstUnlock: return kSecAttrAccessibleAfterFirstUnlock;
            case security::Accessibility::AfterFirstUnlockDeviceOnly: return kSecAttrAccessibleAfterFirstUnlockThisDeviceOnly;
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
            case security::Accessibility::Always: return kSecAttrAccessibleAlways;
            case security::Accessibility::AlwaysDeviceOnly: return kSecAttrAccessibleAlwaysThisDeviceOnly;
#pragma clang diagnostic pop
        }
        return kSecAttrAccessibleWhenUnlockedThisDeviceOnly;
    }

    SecAccessControlCreateFlags AccessControlFlags(const security::AccessControlPolicy& policy) {
        if (policy.RequiresBiometry()) {
            // Biometry stands on its own; RequiresUserPresence() adds nothing on top of it.
            SecAccessControlCreateFlags flags = kSecAccessControlBiometryAny;
            if (policy.AllowsPasscodeFallback()) {
                flags |= kSecAccessControlOr | kSecAccessControlDevicePasscode;
            }
            return flags;
        }
        if (policy.RequiresUserPresence()) {
            return kSecAccessControlUserPresence;
        }
        return 0;
    }

    class Query {
    public:
        Query(const std::string& service, const std::optional<std::string_view> account)
            : dict_(CFDictionaryCreateMutable(kCFAllocatorDefault, 0,
                &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks)) {
            CFDictionarySetValue(dict_.Get(), kSecClass, kSecClassGenericPassword);
            CFDictionarySetValue(dict_.Get(), kSecUseDataProtectionKeychain, kCFBooleanTrue);
            Set(kSecAttrService, MakeString(service));
            if (account.has_value()) {
                Set(kSecAttrAccount, MakeString(*account));
            }
        }

        template<typename T>
        void Set(CFStringRef key, const CFRef<T>& value) {
            CFDictionarySetValue(dict_.Get(), key, value.Get());
        }

        void Set(CFStringRef key, CFTypeRef value) {
            CFDictionarySetValue(dict_.Get(), key, value);
        }

        [[nodiscard]] CFDictionaryRef Get() const noexcept { return dict_.Get(); }

    private:
        CFRef<CFMutableDictionaryRef> dict_;
    };

    // kSecAttrGeneric carries "<policy>:<plaintext size>" so metadata never needs the item data.
    std::string EncodeGeneric(const security::AccessControlPolicy& policy, const size_t size) {
        return compat::format("{}:{}", policy.Encode(), size);
    }

    struct GenericAttribute {
        std::string_view policy;
        std::optional<size_t> size;
    };

    GenericAttribute DecodeGeneric(const std::string_view encoded) {
        const size_t separator = encoded.find(':');
        if (separator == std::string_view::npos) {
            return GenericAttribute{encoded, std::nullopt};
        }
        const std::string_view digits = encoded.substr(separator + 1);
        size_t size = 0;
        const auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), size);
        if (error != std::errc() || end != digits.data() + digits.size()) {
            return GenericAttribute{encoded.substr(0, separator), std::nullopt};
        }
        return GenericAttribute{encoded.substr(0, separator), size};
    }

    WardenFailure Missing(const std::string_view account) {
        return WardenFailure::NotFound(compat::format("No keychain item for '{}'", account));
    }

} // anonymous namespace

KeychainBackend::KeychainBackend(std::string service)
    : service_(std::move(service)) {}

std::string_view KeychainBackend::Name() const noexcept {
    return "keychain";
}

BackendCapabilities KeychainBackend::Capabilities() const noexcept {
    return BackendCapabilities{
        .enforces_biometry = true,
        .enforces_user_presence = true,
        .persistent = true,
    };
}

WardenFailure KeychainBackend::ClassifyStatus(const int32_t status, const std::string_view context) {
    const CFRef<CFStringRef> description(SecCopyErrorMessageString(status, nullptr));
    std::string message = compat::format("{}: {} (OSStatus {})", context, ToString(description.Get()), status);
    switch (status) {
        case errSecItemNotFound:
            return WardenFailure::NotFound(std::move(message));
        case errSecDuplicateItem:
            return WardenFailure::DuplicateItem(std::move(message));
        case errSecAuthFailed:
        case errSecUserCanceled:
        case errSecInteractionNotAllowed:
            return WardenFailure::AccessDenied(std::move(message));
        case errSecNotAvailable:
        case errSecNoSuchKeychain:
        case errSecMissingEntitlement:
            return WardenFailure::StorageUnavailable(std::move(message));
        default:
            return WardenFailure::BackendError(std::move(message));
    }
}

Result<Unit, WardenFailure> KeychainBackend::Probe() {
    Query query(service_, std::nullopt);
    query.Set(kSecReturnAttributes, kCFBooleanTrue);
    query.Set(kSecMatchLimit, kSecMatchLimitOne);
    CFTypeRef raw = nullptr;
    const OSStatus status = SecItemCopyMatching(query.Get(), &raw);
    const CFRef<CFTypeRef> result(raw);
    if (status != errSecSuccess && status != errSecItemNotFound) {
        return Result<Unit, WardenFailure>::Err(ClassifyStatus(status, "SecItemCopyMatching"));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> KeychainBackend::Write(
    const std::string_view account,
    std::span<const uint8_t> secret,
    const StoreOptions& options) {
    using R = Result<Unit, WardenFailure>;
    Query query(service_, account);
    query.Set(kSecValueData, MakeData(secret));
    query.Set(kSecAttrLabel, MakeString(options.label.value_or(
        compat::format("{}{}", StorageConstants::LABEL_PREFIX, account))));
    if (options.comment.has_value()) {
        query.Set(kSecAttrComment, MakeString(*options.comment));
    }
    const std::string encoded = EncodeGeneric(options.policy, secret.size());
    query.Set(kSecAttrGeneric, MakeData(std::span(reinterpret_cast<const uint8_t*>(encoded.data()), encoded.size())));

    const SecAccessControlCreateFlags flags = AccessControlFlags(options.policy);
    if (flags != 0) {
        CFErrorRef raw_error = nullptr;
        const CFRef<SecAccessControlRef> access(SecAccessControlCreateWithFlags(kCFAllocatorDefault,
            AccessibilityConstant(options.policy.GetAccessibility()), flags, &raw_error));
        const CFRef<CFErrorRef> error(raw_error);
        if (!access) {
            const CFRef<CFStringRef> description(error ? CFErrorCopyDescription(error.Get()) : nullptr);
            return R::Err(WardenFailure::InvalidArgument(compat::format(
                "Keychain rejected access control '{}': {}",
                options.policy.Describe(), ToString(description.Get()))));
        }
        query.Set(kSecAttrAccessControl, access);
    } else {
        query.Set(kSecAttrAccessible, AccessibilityConstant(options.policy.GetAccessibility()));
    }

    const OSStatus status = SecItemAdd(query.Get(), nullptr);
    if (status != errSecSuccess) {
        return R::Err(ClassifyStatus(status, "SecItemAdd"));
    }
    WARDEN_LOG_DEBUG(LOG_COMPONENT, "Added keychain item for '{}'", account);
    return R::Ok(unit);
}

Result<std::vector<uint8_t>, WardenFailure> KeychainBackend::Read(const std::string_view account) {
    using R = Result<std::vector<uint8_t>, WardenFailure>;
    Query query(service_, account);
    query.Set(kSecReturnData, kCFBooleanTrue);
    query.Set(kSecMatchLimit, kSecMatchLimitOne);
    CFTypeRef raw = nullptr;
    const OSStatus status = SecItemCopyMatching(query.Get(), &raw);
    const CFRef<CFTypeRef> result(raw);
    if (status == errSecItemNotFound) {
        return R::Err(Missing(account));
    }
    if (status != errSecSuccess) {
        return R::Err(ClassifyStatus(status, "SecItemCopyMatching"));
    }
    if (!result || CFGetTypeID(result.Get()) != CFDataGetTypeID()) {
        return R::Err(WardenFailure::BackendError("Keychain returned no data for the item"));
    }
    const auto data = static_cast<CFDataRef>(result.Get());
    const UInt8* bytes = CFDataGetBytePtr(data);
    return R::Ok(std::vector<uint8_t>(bytes, bytes + CFDataGetLength(data)));
}

Result<Unit, WardenFailure> KeychainBackend::Delete(const std::string_view account) {
    const Query query(service_, account);
    const OSStatus status = SecItemDelete(query.Get());
    if (status == errSecItemNotFound) {
        return Result<Unit, WardenFailure>::Err(Missing(account));
    }
    if (status != errSecSuccess) {
        return Result<Unit, WardenFailure>::Err(ClassifyStatus(status, "SecItemDelete"));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<std::vector<std::string>, WardenFailure> KeychainBackend::ListAccounts() {
    using R = Result<std::vector<std::string>, WardenFailure>;
    Query query(service_, std::nullopt);
    query.Set(kSecReturnAttributes, kCFBooleanTrue);
    query.Set(kSecMatchLimit, kSecMatchLimitAll);
    CFTypeRef raw = nullptr;
    const OSStatus status = SecItemCopyMatching(query.Get(), &raw);
    const CFRef<CFTypeRef> result(raw);
    if (status == errSecItemNotFound) {
        return R::Ok({});
    }
    if (status != errSecSuccess) {
        return R::Err(ClassifyStatus(status, "SecItemCopyMatching"));
    }
    std::vector<std::string> accounts;
    if (!result || CFGetTypeID(result.Get()) != CFArrayGetTypeID()) {
        return R::Ok(std::move(accounts));
    }
    const auto items = static_cast<CFArrayRef>(result.Get());
    const CFIndex count = CFArrayGetCount(items);
    accounts.reserve(static_cast<size_t>(count));
    for (CFIndex i = 0; i < count; ++i) {
        const auto attributes = static_cast<CFDictionaryRef>(CFArrayGetValueAtIndex(items, i));
        const auto account = static_cast<CFStringRef>(CFDictionaryGetValue(attributes, kSecAttrAccount));
        if (account != nullptr) {
            accounts.push_back(ToString(account));
        }
    }
    return R::Ok(std::move(accounts));
}

Result<StorageMetadata, WardenFailure> KeychainBackend::ReadMetadata(const std::string_view account) {
    using R = Result<StorageMetadata, WardenFailure>;
    // Attributes only: the item data may sit behind a biometry or passcode prompt.
    Query query(service_, account);
    query.Set(kSecReturnAttributes, kCFBooleanTrue);
    query.Set(kSecMatchLimit, kSecMatchLimitOne);
    CFTypeRef raw = nullptr;
    const OSStatus status = SecItemCopyMatching(query.Get(), &raw);
    const CFRef<CFTypeRef> result(raw);
    if (status == errSecItemNotFound) {
        return R::Err(Missing(account));
    }
    if (status != errSecSuccess) {
        return R::Err(ClassifyStatus(status, "SecItemCopyMatching"));
    }
    if (!result || CFGetTypeID(result.Get()) != CFDictionaryGetTypeID()) {
        return R::Err(WardenFailure::BackendError("Keychain returned no attributes for the item"));
    }
    const auto attributes = static_cast<CFDictionaryRef>(result.Get());

    StorageMetadata metadata;
    metadata.created_ms = ToUnixMs(CFDictionaryGetValue(attributes, kSecAttrCreationDate));
    metadata.modified_ms = ToUnixMs(CFDictionaryGetValue(attributes, kSecAttrModificationDate));
    if (const auto generic = static_cast<CFDataRef>(CFDictionaryGetValue(attributes, kSecAttrGeneric))) {
        const GenericAttribute decoded = DecodeGeneric(std::string_view(
            reinterpret_cast<const char*>(CFDataGetBytePtr(generic)), static_cast<size_t>(CFDataGetLength(generic))));
        metadata.size = decoded.size.value_or(0);
        auto policy = security::AccessControlPolicy::Decode(decoded.policy);
        if (policy.IsOk()) {
            metadata.policy = std::move(policy).Unwrap();
        } else {
            WARDEN_LOG_WARN(LOG_COMPONENT, "Ignoring policy attribute of '{}': {}",
                account, policy.UnwrapErr().message);
        }
    }
    return R::Ok(std::move(metadata));
}

} // namespace warden::storage

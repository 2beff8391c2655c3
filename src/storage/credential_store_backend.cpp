#include "warden/storage/credential_store_backend.hpp"
#include "warden/core/constants.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "warden/debug/log.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <wincred.h>
#include <dpapi.h>

#include <array>
#include <charconv>
#include <chrono>
#include "warden/core/format.hpp"

namespace warden::storage {

namespace {

    constexpr std::string_view LOG_COMPONENT = "credential-store";
    constexpr const wchar_t* ATTR_POLICY = L"warden.policy";
    constexpr const wchar_t* ATTR_CREATED = L"warden.created";
    constexpr const wchar_t* ATTR_SIZE = L"warden.size";

    struct CredentialDeleter {
        void operator()(void* credential) const noexcept { CredFree(credential); }
    };
    using CredentialPtr = std::unique_ptr<CREDENTIALW, CredentialDeleter>;

    /// Output blob of CryptProtectData / CryptUnprotectData, released with LocalFree.
    class DataBlob {
    public:
        DataBlob() noexcept : blob_{0, nullptr} {}
        ~DataBlob() {
            if (blob_.pbData != nullptr) {
                SecureZeroMemory(blob_.pbData, blob_.cbData);
                LocalFree(blob_.pbData);
            }
        }
        DataBlob(const DataBlob&) = delete;
        DataBlob& operator=(const DataBlob&) = delete;

        DATA_BLOB* Out() noexcept { return &blob_; }
        [[nodiscard]] std::vector<uint8_t> Bytes() const {
            return std::vector<uint8_t>(blob_.pbData, blob_.pbData + blob_.cbData);
        }

    private:
        DATA_BLOB blob_;
    };

    std::wstring Widen(const std::string_view text) {
        if (text.empty()) {
            return {};
        }
        const int length = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
        std::wstring wide(static_cast<size_t>(length), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), wide.data(), length);
        return wide;
    }

    std::string Narrow(const wchar_t* text) {
        if (text == nullptr || *text == L'\0') {
            return {};
        }
        const int length = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
        std::string narrow(static_cast<size_t>(length), '\0');
        WideCharToMultiByte(CP_UTF8, 0, text, -1, narrow.data(), length, nullptr, nullptr);
        narrow.resize(static_cast<size_t>(length) - 1);
        return narrow;
    }

    DATA_BLOB InputBlob(std::span<const uint8_t> bytes) {
        return DATA_BLOB{static_cast<DWORD>(bytes.size()), const_cast<BYTE*>(bytes.data())};
    }

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    int64_t FileTimeToUnixMs(const FILETIME& time) {
        constexpr uint64_t EPOCH_DIFFERENCE_100NS = 116'444'736'000'000'000ULL;
        const uint64_t ticks = (static_cast<uint64_t>(time.dwHighDateTime) << 32) | time.dwLowDateTime;
        if (ticks < EPOCH_DIFFERENCE_100NS) {
            return 0;
        }
        return static_cast<int64_t>((ticks - EPOCH_DIFFERENCE_100NS) / 10'000);
    }

    std::optional<std::string> FindAttribute(const CREDENTIALW& credential, const wchar_t* keyword) {
        for (DWORD i = 0; i < credential.AttributeCount; ++i) {
            const CREDENTIAL_ATTRIBUTEW& attribute = credential.Attributes[i];
            if (attribute.Keyword != nullptr && wcscmp(attribute.Keyword, keyword) == 0) {
                return std::string(reinterpret_cast<const char*>(attribute.Value), attribute.ValueSize);
            }
        }
        return std::nullopt;
    }

    int64_t ParseInteger(const std::optional<std::string>& text) {
        int64_t value = 0;
        if (!text.has_value()) {
            return 0;
        }
        const auto [end, error] = std::from_chars(text->data(), text->data() + text->size(), value);
        if (error != std::errc{}) {
            return 0;
        }
        return value;
    }

} // anonymous namespace

CredentialStoreBackend::CredentialStoreBackend(std::string service)
    : service_(std::move(service)) {}

std::string_view CredentialStoreBackend::Name() const noexcept {
    return "credential-store";
}

BackendCapabilities CredentialStoreBackend::Capabilities() const noexcept {
    return BackendCapabilities{
        .enforces_biometry = false,
        .enforces_user_presence = false,
        .persistent = true,
    };
}

std::string CredentialStoreBackend::TargetName(const std::string_view account) const {
    return compat::format("{}/{}", service_, account);
}

WardenFailure CredentialStoreBackend::ClassifyError(const uint32_t error_code, const std::string_view context) {
    std::array<char, 512> buffer{};
    const DWORD length = FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, error_code, 0, buffer.data(), static_cast<DWORD>(buffer.size()), nullptr);
    std::string_view description(buffer.data(), length);
    while (!description.empty() && (description.back() == '\n' || description.back() == '\r')) {
        description.remove_suffix(1);
    }
    std::string message = compat::format("{}: {} (error {})", context, description, error_code);
    switch (error_code) {
        case ERROR_NOT_FOUND:
            return WardenFailure::NotFound(std::move(message));
        case ERROR_ALREADY_EXISTS:
            return WardenFailure::DuplicateItem(std::move(message));
        case ERROR_ACCESS_DENIED:
        case ERROR_CANCELLED:
            return WardenFailure::AccessDenied(std::move(message));
        case ERROR_NO_SUCH_LOGON_SESSION:
            return WardenFailure::StorageUnavailable(std::move(message));
        case ERROR_INVALID_PARAMETER:
        case ERROR_BAD_USERNAME:
            return WardenFailure::InvalidArgument(std::move(message));
        default:
            return WardenFailure::BackendError(std::move(message));
    }
}

Result<Unit, WardenFailure> CredentialStoreBackend::Probe() {
    const std::wstring filter = Widen(compat::format("{}/*", service_));
    DWORD count = 0;
    PCREDENTIALW* credentials = nullptr;
    if (!CredEnumerateW(filter.c_str(), 0, &count, &credentials)) {
        const DWORD error = GetLastError();
        if (error != ERROR_NOT_FOUND) {
            return Result<Unit, WardenFailure>::Err(ClassifyError(error, "CredEnumerateW"));
        }
        return Result<Unit, WardenFailure>::Ok(unit);
    }
    CredFree(credentials);
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> CredentialStoreBackend::Write(
    const std::string_view account,
    std::span<const uint8_t> secret,
    const StoreOptions& options) {
    using R = Result<Unit, WardenFailure>;
    const std::string target = TargetName(account);

    DATA_BLOB plain = InputBlob(secret);
    DATA_BLOB entropy = InputBlob(AsBytes(target));
    DataBlob wrapped;
    if (!CryptProtectData(&plain, nullptr, &entropy, nullptr, nullptr,
            CRYPTPROTECT_UI_FORBIDDEN, wrapped.Out())) {
        return R::Err(ClassifyError(GetLastError(), "CryptProtectData"));
    }
    std::vector<uint8_t> blob = wrapped.Bytes();
    if (blob.size() > CRED_MAX_CREDENTIAL_BLOB_SIZE) {
        return R::Err(WardenFailure::InvalidArgument(compat::format(
            "Secret for '{}' is too large for the credential store ({} bytes after wrapping, limit {})",
            account, blob.size(), CRED_MAX_CREDENTIAL_BLOB_SIZE)));
    }

    std::string policy = options.policy.Encode();
    std::string created = std::to_string(NowMs());
    std::string size = std::to_string(secret.size());
    std::array<CREDENTIAL_ATTRIBUTEW, 3> attributes{{
        {const_cast<LPWSTR>(ATTR_POLICY), 0, static_cast<DWORD>(policy.size()), reinterpret_cast<LPBYTE>(policy.data())},
        {const_cast<LPWSTR>(ATTR_CREATED), 0, static_cast<DWORD>(created.size()), reinterpret_cast<LPBYTE>(created.data())},
        {const_cast<LPWSTR>(ATTR_SIZE), 0, static_cast<DWORD>(size.size()), reinterpret_cast<LPBYTE>(size.data())},
    }};

    std::wstring target_wide = Widen(target);
    std::wstring user_wide = Widen(account);
    std::wstring comment_wide = Widen(options.comment.value_or(
        compat::format("{}{}", StorageConstants::LABEL_PREFIX, account)));

    CREDENTIALW credential{};
    credential.Type = CRED_TYPE_GENERIC;
    credential.TargetName = target_wide.data();
    credential.Comment = comment_wide.data();
    credential.CredentialBlobSize = static_cast<DWORD>(blob.size());
    credential.CredentialBlob = blob.data();
    credential.Persist = CRED_PERSIST_LOCAL_MACHINE;
    credential.AttributeCount = static_cast<DWORD>(attributes.size());
    credential.Attributes = attributes.data();
    credential.UserName = user_wide.data();

    const BOOL written = CredWriteW(&credential, 0);
    crypto::SodiumInterop::SecureWipe(blob);
    if (!written) {
        return R::Err(ClassifyError(GetLastError(), "CredWriteW"));
    }
    WARDEN_LOG_DEBUG(LOG_COMPONENT, "Wrote credential {}", target);
    return R::Ok(unit);
}

Result<std::vector<uint8_t>, WardenFailure> CredentialStoreBackend::Read(const std::string_view account) {
    using R = Result<std::vector<uint8_t>, WardenFailure>;
    const std::string target = TargetName(account);
    const std::wstring target_wide = Widen(target);
    PCREDENTIALW raw = nullptr;
    if (!CredReadW(target_wide.c_str(), CRED_TYPE_GENERIC, 0, &raw)) {
        return R::Err(ClassifyError(GetLastError(), "CredReadW"));
    }
    const CredentialPtr credential(raw);

    DATA_BLOB wrapped = InputBlob({credential->CredentialBlob, credential->CredentialBlobSize});
    DATA_BLOB entropy = InputBlob(AsBytes(target));
    DataBlob plain;
    if (!CryptUnprotectData(&wrapped, nullptr, &entropy, nullptr, nullptr,
            CRYPTPROTECT_UI_FORBIDDEN, plain.Out())) {
        return R::Err(ClassifyError(GetLastError(), "CryptUnprotectData"));
    }
    return R::Ok(plain.Bytes());
}

Result<Unit, WardenFailure> CredentialStoreBackend::Delete(const std::string_view account) {
    const std::wstring target_wide = Widen(TargetName(account));
    if (!CredDeleteW(target_wide.c_str(), CRED_TYPE_GENERIC, 0)) {
        return Result<Unit, WardenFailure>::Err(ClassifyError(GetLastError(), "CredDeleteW"));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<std::vector<std::string>, WardenFailure> CredentialStoreBackend::ListAccounts() {
    using R = Result<std::vector<std::string>, WardenFailure>;
    const std::wstring filter = Widen(compat::format("{}/*", service_));
    DWORD count = 0;
    PCREDENTIALW* raw = nullptr;
    if (!CredEnumerateW(filter.c_str(), 0, &count, &raw)) {
        const DWORD error = GetLastError();
        if (error == ERROR_NOT_FOUND) {
            return R::Ok({});
        }
        return R::Err(ClassifyError(error, "CredEnumerateW"));
    }
    const std::unique_ptr<PCREDENTIALW, CredentialDeleter> credentials(raw);

    const size_t prefix_length = service_.size() + 1;
    std::vector<std::string> accounts;
    accounts.reserve(count);
    for (DWORD i = 0; i < count; ++i) {
        std::string target = Narrow(credentials.get()[i]->TargetName);
        if (target.size() > prefix_length) {
            accounts.push_back(target.substr(prefix_length));
        }
    }
    return R::Ok(std::move(accounts));
}

Result<StorageMetadata, WardenFailure> CredentialStoreBackend::ReadMetadata(const std::string_view account) {
    using R = Result<StorageMetadata, WardenFailure>;
    const std::wstring target_wide = Widen(TargetName(account));
    PCREDENTIALW raw = nullptr;
    if (!CredReadW(target_wide.c_str(), CRED_TYPE_GENERIC, 0, &raw)) {
        return R::Err(ClassifyError(GetLastError(), "CredReadW"));
    }
    const CredentialPtr credential(raw);

    StorageMetadata metadata;
    metadata.modified_ms = FileTimeToUnixMs(credential->LastWritten);
    metadata.created_ms = ParseInteger(FindAttribute(*credential, ATTR_CREATED));
    if (metadata.created_ms == 0) {
        metadata.created_ms = metadata.modified_ms;
    }
    metadata.size = static_cast<size_t>(ParseInteger(FindAttribute(*credential, ATTR_SIZE)));
    if (const auto encoded = FindAttribute(*credential, ATTR_POLICY)) {
        auto policy = security::AccessControlPolicy::Decode(*encoded);
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

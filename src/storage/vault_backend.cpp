#include "warden/storage/vault_backend.hpp"
#include "warden/core/constants.hpp"
#include "warden/crypto/aes_gcm.hpp"
#include "warden/crypto/sodium_interop.hpp"

#include <chrono>
#include "warden/core/format.hpp"

namespace warden::storage {

namespace {

    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::span<const uint8_t> AsBytes(const std::string& text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Result<std::vector<uint8_t>, WardenFailure> Flatten(
        Result<Result<std::vector<uint8_t>, WardenFailure>, SodiumFailure> nested) {
        if (nested.IsErr()) {
            return Result<std::vector<uint8_t>, WardenFailure>::Err(
                WardenFailure::FromSodiumFailure(std::move(nested).UnwrapErr()));
        }
        return std::move(nested).Unwrap();
    }

} // anonymous namespace

Result<std::unique_ptr<VaultBackend>, WardenFailure> VaultBackend::Create(std::string service) {
    using R = Result<std::unique_ptr<VaultBackend>, WardenFailure>;
    auto key_result = crypto::SecureMemoryHandle::Allocate(Constants::AES_KEY_SIZE);
    if (key_result.IsErr()) {
        return R::Err(WardenFailure::FromSodiumFailure(std::move(key_result).UnwrapErr()));
    }
    auto key = std::move(key_result).Unwrap();
    auto filled = key.WithWriteAccess([](std::span<uint8_t> bytes) {
        crypto::SodiumInterop::FillRandom(bytes);
        return unit;
    });
    if (filled.IsErr()) {
        return R::Err(WardenFailure::FromSodiumFailure(std::move(filled).UnwrapErr()));
    }
    return R::Ok(std::unique_ptr<VaultBackend>(new VaultBackend(std::move(service), std::move(key))));
}

VaultBackend::VaultBackend(std::string service, crypto::SecureMemoryHandle key)
    : service_(std::move(service))
    , key_(std::move(key)) {}

std::string_view VaultBackend::Name() const noexcept {
    return "vault";
}

BackendCapabilities VaultBackend::Capabilities() const noexcept {
    return BackendCapabilities{
        .enforces_biometry = false,
        .enforces_user_presence = false,
        .persistent = false,
    };
}

Result<Unit, WardenFailure> VaultBackend::Probe() {
    if (key_.IsInvalid()) {
        return Result<Unit, WardenFailure>::Err(
            WardenFailure::StorageUnavailable("Vault key has been released"));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

std::string VaultBackend::AssociatedData(const std::string_view account) const {
    return compat::format("{}{}/{}", StorageConstants::VAULT_AAD_PREFIX, service_, account);
}

WardenFailure VaultBackend::Missing(const std::string_view account) {
    return WardenFailure::NotFound(compat::format("No vault record for '{}'", account));
}

Result<Unit, WardenFailure> VaultBackend::Write(
    const std::string_view account,
    std::span<const uint8_t> secret,
    const StoreOptions& options) {
    const std::string aad = AssociatedData(account);
    auto sealed = Flatten(key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::AesGcm::Seal(key, secret, AsBytes(aad));
    }));
    if (sealed.IsErr()) {
        return Result<Unit, WardenFailure>::Err(std::move(sealed).UnwrapErr());
    }

    const int64_t now = NowMs();
    Record record{
        .sealed = std::move(sealed).Unwrap(),
        .metadata = StorageMetadata{
            .created_ms = now,
            .modified_ms = now,
            .size = secret.size(),
            .policy = options.policy,
        },
        .label = options.label,
        .comment = options.comment,
    };

    std::lock_guard guard(lock_);
    if (const auto it = records_.find(account); it != records_.end()) {
        record.metadata.created_ms = it->second.metadata.created_ms;
        it->second = std::move(record);
    } else {
        records_.emplace(std::string(account), std::move(record));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, WardenFailure> VaultBackend::Read(const std::string_view account) {
    std::vector<uint8_t> sealed;
    {
        std::lock_guard guard(lock_);
        const auto it = records_.find(account);
        if (it == records_.end()) {
            return Result<std::vector<uint8_t>, WardenFailure>::Err(Missing(account));
        }
        sealed = it->second.sealed;
    }
    const std::string aad = AssociatedData(account);
    return Flatten(key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return crypto::AesGcm::Open(key, sealed, AsBytes(aad));
    }));
}

Result<Unit, WardenFailure> VaultBackend::Delete(const std::string_view account) {
    std::lock_guard guard(lock_);
    const auto it = records_.find(account);
    if (it == records_.end()) {
        return Result<Unit, WardenFailure>::Err(Missing(account));
    }
    records_.erase(it);
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<std::vector<std::string>, WardenFailure> VaultBackend::ListAccounts() {
    std::lock_guard guard(lock_);
    std::vector<std::string> accounts;
    accounts.reserve(records_.size());
    for (const auto& [account, record] : records_) {
        accounts.push_back(account);
    }
    return Result<std::vector<std::string>, WardenFailure>::Ok(std::move(accounts));
}

Result<StorageMetadata, WardenFailure> VaultBackend::ReadMetadata(const std::string_view account) {
    std::lock_guard guard(lock_);
    const auto it = records_.find(account);
    if (it == records_.end()) {
        return Result<StorageMetadata, WardenFailure>::Err(Missing(account));
    }
    return Result<StorageMetadata, WardenFailure>::Ok(it->second.metadata);
}

} // namespace warden::storage

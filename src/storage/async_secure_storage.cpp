#include "warden/storage/async_secure_storage.hpp"
#include "warden/crypto/sodium_interop.hpp"

namespace warden::storage {

AsyncSecureStorage::AsyncSecureStorage(
    std::shared_ptr<SecureStorage> storage,
    const uint32_t worker_count,
    const std::chrono::milliseconds timeout)
    : storage_(std::move(storage))
    , timeout_(timeout)
    , pool_(worker_count) {}

template<typename T, typename F>
AsyncSecureStorage::Future<T> AsyncSecureStorage::Dispatch(F&& operation) {
    auto submitted = pool_.Submit(std::forward<F>(operation));
    if (submitted.has_value()) {
        return std::move(*submitted);
    }
    std::promise<Result<T, WardenFailure>> refused;
    refused.set_value(Result<T, WardenFailure>::Err(
        WardenFailure::StorageUnavailable("Storage worker pool has been shut down")));
    return refused.get_future();
}

AsyncSecureStorage::Future<Unit> AsyncSecureStorage::Store(
    std::string key,
    std::vector<uint8_t> value,
    StoreOptions options) {
    return Dispatch<Unit>([storage = storage_, key = std::move(key), value = std::move(value),
                           options = std::move(options)]() mutable {
        auto result = storage->Store(key, value, options);
        crypto::SodiumInterop::SecureWipe(value);
        return result;
    });
}

AsyncSecureStorage::Future<std::optional<std::vector<uint8_t>>> AsyncSecureStorage::Retrieve(std::string key) {
    return Dispatch<std::optional<std::vector<uint8_t>>>([storage = storage_, key = std::move(key)]() {
        return storage->Retrieve(key);
    });
}

AsyncSecureStorage::Future<Unit> AsyncSecureStorage::Remove(std::string key) {
    return Dispatch<Unit>([storage = storage_, key = std::move(key)]() {
        return storage->Remove(key);
    });
}

AsyncSecureStorage::Future<bool> AsyncSecureStorage::Exists(std::string key) {
    return Dispatch<bool>([storage = storage_, key = std::move(key)]() {
        return storage->Exists(key);
    });
}

AsyncSecureStorage::Future<std::vector<std::string>> AsyncSecureStorage::List() {
    return Dispatch<std::vector<std::string>>([storage = storage_]() {
        return storage->List();
    });
}

AsyncSecureStorage::Future<Unit> AsyncSecureStorage::Clear() {
    return Dispatch<Unit>([storage = storage_]() {
        return storage->Clear();
    });
}

AsyncSecureStorage::Future<StorageMetadata> AsyncSecureStorage::GetMetadata(std::string key) {
    return Dispatch<StorageMetadata>([storage = storage_, key = std::move(key)]() {
        return storage->GetMetadata(key);
    });
}

AsyncSecureStorage::Future<StorageInfo> AsyncSecureStorage::GetInfo() {
    return Dispatch<StorageInfo>([storage = storage_]() {
        return storage->GetInfo();
    });
}

AsyncSecureStorage::Future<Unit> AsyncSecureStorage::Test() {
    return Dispatch<Unit>([storage = storage_]() {
        return storage->Test();
    });
}

void AsyncSecureStorage::Shutdown() {
    pool_.Stop();
}

} // namespace warden::storage

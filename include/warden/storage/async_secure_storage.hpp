#pragma once

#include "warden/core/constants.hpp"
#include "warden/storage/secure_storage.hpp"
#include "warden/storage/worker_pool.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace warden::storage {

/**
 * @brief Runs SecureStorage operations on a fixed worker pool
 *
 * Every call returns immediately with a future. In-flight OS calls cannot be
 * cancelled; a caller that stops waiting (AwaitWithTimeout) gets
 * StorageUnavailable while the operation itself runs to completion.
 */
class AsyncSecureStorage {
public:
    template<typename T>
    using Future = std::future<Result<T, WardenFailure>>;

    AsyncSecureStorage(
        std::shared_ptr<SecureStorage> storage,
        uint32_t worker_count,
        std::chrono::milliseconds timeout);

    AsyncSecureStorage(const AsyncSecureStorage&) = delete;
    AsyncSecureStorage& operator=(const AsyncSecureStorage&) = delete;

    /// The value buffer is wiped once the backend has consumed it.
    Future<Unit> Store(std::string key, std::vector<uint8_t> value, StoreOptions options);
    Future<std::optional<std::vector<uint8_t>>> Retrieve(std::string key);
    Future<Unit> Remove(std::string key);
    Future<bool> Exists(std::string key);
    Future<std::vector<std::string>> List();
    Future<Unit> Clear();
    Future<StorageMetadata> GetMetadata(std::string key);
    Future<StorageInfo> GetInfo();
    Future<Unit> Test();

    template<typename T>
    static Result<T, WardenFailure> AwaitWithTimeout(Future<T>& future, const std::chrono::milliseconds timeout) {
        if (!future.valid()) {
            return Result<T, WardenFailure>::Err(
                WardenFailure::InvalidArgument("Future has already been consumed"));
        }
        if (future.wait_for(timeout) != std::future_status::ready) {
            return Result<T, WardenFailure>::Err(
                WardenFailure::StorageUnavailable(std::string(ErrorMessages::OPERATION_TIMED_OUT)));
        }
        return future.get();
    }

    /// AwaitWithTimeout with the configured operation timeout.
    template<typename T>
    Result<T, WardenFailure> Await(Future<T>& future) const {
        return AwaitWithTimeout(future, timeout_);
    }

    [[nodiscard]] SecureStorage& Storage() const noexcept { return *storage_; }
    [[nodiscard]] std::chrono::milliseconds Timeout() const noexcept { return timeout_; }

    /// Finishes queued operations and joins the workers.
    void Shutdown();

private:
    template<typename T, typename F>
    Future<T> Dispatch(F&& operation);

    std::shared_ptr<SecureStorage> storage_;
    std::chrono::milliseconds timeout_;
    WorkerPool pool_;
};

} // namespace warden::storage

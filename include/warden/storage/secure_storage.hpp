#pragma once

#include "warden/configuration/storage_config.hpp"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/interfaces/i_secure_storage_backend.hpp"
#include "warden/security/access_control_policy.hpp"
#include "warden/storage/storage_types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::storage {

/**
 * @brief One secret-store contract over whichever platform backend is reachable
 *
 * Keys are validated before any backend call. Read-style operations report
 * an absent key as a value (nullopt / false), never as an error.
 *
 * Store has replace semantics: an existing record is deleted before the new
 * one is written, so a record cannot keep an older, weaker policy.
 * Mutations are serialized per instance; reads are not.
 *
 * Thread-safe.
 */
class SecureStorage {
public:
    /// Plans, instantiates and probes the backend for the running platform.
    static Result<std::unique_ptr<SecureStorage>, WardenFailure> Create(
        const configuration::StorageConfig& config);

    /**
     * @brief Probes @p primary, then @p fallback
     *
     * Returns StorageUnavailable when neither answers; there is no
     * plaintext fallback.
     */
    static Result<std::unique_ptr<SecureStorage>, WardenFailure> FromBackends(
        const configuration::StorageConfig& config,
        std::unique_ptr<interfaces::ISecureStorageBackend> primary,
        std::unique_ptr<interfaces::ISecureStorageBackend> fallback);

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    Result<Unit, WardenFailure> Store(
        std::string_view key,
        std::span<const uint8_t> value,
        const security::AccessControlPolicy& policy);

    Result<Unit, WardenFailure> Store(
        std::string_view key,
        std::span<const uint8_t> value,
        const StoreOptions& options);

    Result<std::optional<std::vector<uint8_t>>, WardenFailure> Retrieve(std::string_view key);

    /// Idempotent: removing an absent key succeeds.
    Result<Unit, WardenFailure> Remove(std::string_view key);

    Result<bool, WardenFailure> Exists(std::string_view key);

    /// Keys of this service, excluding in-flight self-test records.
    Result<std::vector<std::string>, WardenFailure> List();

    Result<Unit, WardenFailure> Clear();

    /// NotFound when @p key is absent.
    Result<StorageMetadata, WardenFailure> GetMetadata(std::string_view key);

    Result<StorageInfo, WardenFailure> GetInfo();

    /// Round-trips a throwaway record; the record is removed on every path.
    Result<Unit, WardenFailure> Test();

    [[nodiscard]] std::string_view BackendName() const noexcept;
    [[nodiscard]] bool IsUsingFallback() const noexcept { return using_fallback_; }
    [[nodiscard]] BackendCapabilities Capabilities() const noexcept;
    [[nodiscard]] const configuration::StorageConfig& Config() const noexcept { return config_; }

private:
    SecureStorage(
        configuration::StorageConfig config,
        std::unique_ptr<interfaces::ISecureStorageBackend> backend,
        bool using_fallback);

    Result<Unit, WardenFailure> CheckPolicy(
        std::string_view key,
        const security::AccessControlPolicy& policy) const;
    Result<Unit, WardenFailure> DeleteIfPresent(std::string_view key);

    configuration::StorageConfig config_;
    std::unique_ptr<interfaces::ISecureStorageBackend> backend_;
    bool using_fallback_;
    std::mutex write_lock_;
};

} // namespace warden::storage

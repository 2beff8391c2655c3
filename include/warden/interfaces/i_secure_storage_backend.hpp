#pragma once
#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"
#include "warden/storage/storage_types.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace warden::interfaces {
/**
 * @brief One platform secret store, bound to a single service namespace
 *
 * Implementations translate every OS failure into the WardenFailure taxonomy.
 * Read, Delete and ReadMetadata report an absent account as NotFound; the
 * SecureStorage facade decides what absence means for its callers.
 * Write may assume the account is absent (the facade deletes first) but must
 * not leave a partial record behind when it fails.
 */
class ISecureStorageBackend {
public:
    virtual ~ISecureStorageBackend() = default;
    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    [[nodiscard]] virtual storage::BackendCapabilities Capabilities() const noexcept = 0;
    /// Cheap reachability check; StorageUnavailable when the OS service is absent.
    virtual Result<Unit, WardenFailure> Probe() = 0;
    virtual Result<Unit, WardenFailure> Write(
        std::string_view account,
        std::span<const uint8_t> secret,
        const storage::StoreOptions& options) = 0;
    virtual Result<std::vector<uint8_t>, WardenFailure> Read(std::string_view account) = 0;
    virtual Result<Unit, WardenFailure> Delete(std::string_view account) = 0;
    virtual Result<std::vector<std::string>, WardenFailure> ListAccounts() = 0;
    virtual Result<storage::StorageMetadata, WardenFailure> ReadMetadata(std::string_view account) = 0;
};
}

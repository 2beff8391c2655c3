#pragma once
#include "warden/interfaces/i_secure_storage_backend.hpp"
#include "warden/core/result.hpp"
#include "warden/core/failures.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace warden::test_helpers {

using interfaces::ISecureStorageBackend;
using storage::BackendCapabilities;
using storage::StorageMetadata;
using storage::StoreOptions;

/// Observable state behind a FakeBackend; the test keeps a copy of the
/// shared_ptr after the backend itself is moved into a SecureStorage.
struct FakeBackendState {
    struct Record {
        std::vector<uint8_t> value;
        StorageMetadata metadata;
    };

    std::mutex lock;
    std::map<std::string, Record, std::less<>> records;
    std::optional<WardenFailure> probe_failure;
    std::optional<WardenFailure> write_failure;
    std::optional<WardenFailure> read_failure;
    /// Fails attribute-only calls (list, metadata); read_failure covers secret data only.
    std::optional<WardenFailure> metadata_failure;
    std::optional<WardenFailure> delete_failure;
    BackendCapabilities capabilities{.enforces_biometry = true, .enforces_user_presence = true, .persistent = true};
    std::chrono::milliseconds operation_delay{0};
    size_t probes = 0;
    size_t writes = 0;
    size_t deletes = 0;
    std::vector<std::string> write_log;

    [[nodiscard]] bool Contains(const std::string& account) {
        std::lock_guard guard(lock);
        return records.contains(account);
    }

    [[nodiscard]] std::optional<StoreOptions> LastOptions() {
        std::lock_guard guard(lock);
        return last_options;
    }

    std::optional<StoreOptions> last_options;
};

class FakeBackend : public ISecureStorageBackend {
public:
    explicit FakeBackend(std::shared_ptr<FakeBackendState> state, std::string name = "fake")
        : state_(std::move(state)), name_(std::move(name)) {}

    [[nodiscard]] std::string_view Name() const noexcept override { return name_; }

    [[nodiscard]] BackendCapabilities Capabilities() const noexcept override {
        std::lock_guard guard(state_->lock);
        return state_->capabilities;
    }

    Result<Unit, WardenFailure> Probe() override {
        std::lock_guard guard(state_->lock);
        ++state_->probes;
        if (state_->probe_failure.has_value()) {
            return Result<Unit, WardenFailure>::Err(*state_->probe_failure);
        }
        return Result<Unit, WardenFailure>::Ok(unit);
    }

    Result<Unit, WardenFailure> Write(
        const std::string_view account,
        std::span<const uint8_t> secret,
        const StoreOptions& options) override {
        Delay();
        std::lock_guard guard(state_->lock);
        ++state_->writes;
        state_->write_log.emplace_back(account);
        if (state_->write_failure.has_value()) {
            return Result<Unit, WardenFailure>::Err(*state_->write_failure);
        }
        if (state_->records.contains(account)) {
            return Result<Unit, WardenFailure>::Err(
                WardenFailure::DuplicateItem("Fake record already exists: " + std::string(account)));
        }
        FakeBackendState::Record record;
        record.value.assign(secret.begin(), secret.end());
        record.metadata.created_ms = 1000;
        record.metadata.modified_ms = 1000;
        record.metadata.size = secret.size();
        record.metadata.policy = options.policy;
        state_->records.emplace(std::string(account), std::move(record));
        state_->last_options = options;
        return Result<Unit, WardenFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, WardenFailure> Read(const std::string_view account) override {
        Delay();
        std::lock_guard guard(state_->lock);
        if (state_->read_failure.has_value()) {
            return Result<std::vector<uint8_t>, WardenFailure>::Err(*state_->read_failure);
        }
        const auto it = state_->records.find(account);
        if (it == state_->records.end()) {
            return Result<std::vector<uint8_t>, WardenFailure>::Err(Missing(account));
        }
        return Result<std::vector<uint8_t>, WardenFailure>::Ok(it->second.value);
    }

    Result<Unit, WardenFailure> Delete(const std::string_view account) override {
        std::lock_guard guard(state_->lock);
        ++state_->deletes;
        if (state_->delete_failure.has_value()) {
            return Result<Unit, WardenFailure>::Err(*state_->delete_failure);
        }
        const auto it = state_->records.find(account);
        if (it == state_->records.end()) {
            return Result<Unit, WardenFailure>::Err(Missing(account));
        }
        state_->records.erase(it);
        return Result<Unit, WardenFailure>::Ok(unit);
    }

    Result<std::vector<std::string>, WardenFailure> ListAccounts() override {
        std::lock_guard guard(state_->lock);
        if (state_->metadata_failure.has_value()) {
            return Result<std::vector<std::string>, WardenFailure>::Err(*state_->metadata_failure);
        }
        std::vector<std::string> accounts;
        for (const auto& [account, record] : state_->records) {
            accounts.push_back(account);
        }
        return Result<std::vector<std::string>, WardenFailure>::Ok(std::move(accounts));
    }

    Result<StorageMetadata, WardenFailure> ReadMetadata(const std::string_view account) override {
        std::lock_guard guard(state_->lock);
        if (state_->metadata_failure.has_value()) {
            return Result<StorageMetadata, WardenFailure>::Err(*state_->metadata_failure);
        }
        const auto it = state_->records.find(account);
        if (it == state_->records.end()) {
            return Result<StorageMetadata, WardenFailure>::Err(Missing(account));
        }
        return Result<StorageMetadata, WardenFailure>::Ok(it->second.metadata);
    }

private:
    static WardenFailure Missing(const std::string_view account) {
        return WardenFailure::NotFound("No fake record for " + std::string(account));
    }

    void Delay() const {
        std::chrono::milliseconds delay;
        {
            std::lock_guard guard(state_->lock);
            delay = state_->operation_delay;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }

    std::shared_ptr<FakeBackendState> state_;
    std::string name_;
};

inline std::unique_ptr<FakeBackend> MakeFakeBackend(
    std::shared_ptr<FakeBackendState> state,
    std::string name = "fake") {
    return std::make_unique<FakeBackend>(std::move(state), std::move(name));
}

} // namespace warden::test_helpers

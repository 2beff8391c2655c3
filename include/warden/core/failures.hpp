#pragma once
#include <string>
#include <string_view>
namespace warden {
enum class SodiumFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    InvalidOperation
};
enum class FailureType {
    InvalidHandle,
    StorageUnavailable,
    NotFound,
    AccessDenied,
    DuplicateItem,
    InvalidArgument,
    BackendError
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class WardenFailure {
public:
    FailureType type;
    std::string message;
    WardenFailure(const FailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static WardenFailure InvalidHandle(std::string msg) {
        return {FailureType::InvalidHandle, std::move(msg)};
    }
    static WardenFailure StorageUnavailable(std::string msg) {
        return {FailureType::StorageUnavailable, std::move(msg)};
    }
    static WardenFailure NotFound(std::string msg) {
        return {FailureType::NotFound, std::move(msg)};
    }
    static WardenFailure AccessDenied(std::string msg) {
        return {FailureType::AccessDenied, std::move(msg)};
    }
    static WardenFailure DuplicateItem(std::string msg) {
        return {FailureType::DuplicateItem, std::move(msg)};
    }
    static WardenFailure InvalidArgument(std::string msg) {
        return {FailureType::InvalidArgument, std::move(msg)};
    }
    static WardenFailure BackendError(std::string msg) {
        return {FailureType::BackendError, std::move(msg)};
    }
    static WardenFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::BufferTooSmall) {
            return InvalidArgument(sf.message);
        }
        return BackendError(sf.message);
    }
    /// Service momentarily unreachable; retrying is the caller's decision.
    [[nodiscard]] bool IsTransient() const noexcept {
        return type == FailureType::StorageUnavailable;
    }
    [[nodiscard]] bool Is(const FailureType t) const noexcept {
        return type == t;
    }
};
[[nodiscard]] constexpr std::string_view FailureTypeName(const FailureType type) noexcept {
    switch (type) {
        case FailureType::InvalidHandle:
            return "InvalidHandle";
        case FailureType::StorageUnavailable:
            return "StorageUnavailable";
        case FailureType::NotFound:
            return "NotFound";
        case FailureType::AccessDenied:
            return "AccessDenied";
        case FailureType::DuplicateItem:
            return "DuplicateItem";
        case FailureType::InvalidArgument:
            return "InvalidArgument";
        case FailureType::BackendError:
            return "BackendError";
    }
    return "Unknown";
}
}

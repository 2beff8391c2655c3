#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace warden {
struct Constants {
    static constexpr size_t RISTRETTO_SCALAR_SIZE = 32;
    static constexpr size_t RISTRETTO_POINT_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_BLOB_SIZE = 16 * 1024 * 1024;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct HandleConstants {
    static constexpr uint64_t FIRST_HANDLE = 1;
    static constexpr uint64_t INVALID_HANDLE = 0;
};
struct StorageConstants {
    static constexpr size_t MAX_KEY_LENGTH = 255;
    static constexpr size_t MAX_SECRET_SIZE = 1024 * 1024;
    static constexpr std::string_view DEFAULT_SERVICE = "org.warden.wallet";
    static constexpr std::string_view APPLICATION_ATTRIBUTE = "warden";
    static constexpr std::string_view SELF_TEST_KEY_PREFIX = "warden-selftest-";
    static constexpr std::string_view SELF_TEST_PAYLOAD = "test";
    static constexpr std::string_view LABEL_PREFIX = "Warden: ";
    static constexpr std::string_view LIBSECRET_SCHEMA = "org.warden.Secret";
    static constexpr std::string_view ATTR_SERVICE = "service";
    static constexpr std::string_view ATTR_ACCOUNT = "account";
    static constexpr std::string_view ATTR_APPLICATION = "application";
    static constexpr std::string_view ATTR_POLICY = "policy";
    static constexpr std::string_view ATTR_SIZE = "size";
    static constexpr std::string_view VAULT_AAD_PREFIX = "warden-vault:";
    static constexpr std::chrono::milliseconds DEFAULT_OPERATION_TIMEOUT{10'000};
    static constexpr uint32_t DEFAULT_WORKER_COUNT = 2;
};
struct EventConstants {
    static constexpr size_t DEFAULT_QUEUE_WARNING_THRESHOLD = 10'000;
    static constexpr std::string_view TX_RECEIVED = "tx:received";
    static constexpr std::string_view TX_BROADCAST = "tx:broadcast";
    static constexpr std::string_view TX_MINED = "tx:mined";
    static constexpr std::string_view TX_CANCELLED = "tx:cancelled";
    static constexpr std::string_view BALANCE_UPDATED = "balance:updated";
    static constexpr std::string_view CONNECTIVITY_CHANGED = "connectivity:changed";
    static constexpr std::string_view SYNC_PROGRESS = "sync:progress";
    static constexpr std::string_view SYNC_COMPLETED = "sync:completed";
    static constexpr std::string_view SYNC_FAILED = "sync:failed";
    static constexpr std::string_view BASE_NODE_CONNECTED = "basenode:connected";
    static constexpr std::string_view BASE_NODE_DISCONNECTED = "basenode:disconnected";
    static constexpr std::string_view WALLET_STARTED = "wallet:started";
    static constexpr std::string_view WALLET_STOPPED = "wallet:stopped";
    static constexpr std::string_view WALLET_ERROR = "error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view UNKNOWN_HANDLE = "Unknown handle: ";
    static constexpr std::string_view STORAGE_UNAVAILABLE = "No secure storage backend is available on this system";
    static constexpr std::string_view KEY_EMPTY = "Storage key must not be empty";
    static constexpr std::string_view KEY_TOO_LONG = "Storage key exceeds 255 characters";
    static constexpr std::string_view KEY_INVALID_CHARACTERS = "Storage key may only contain letters, digits, '.', '_' and '-'";
    static constexpr std::string_view SECRET_TOO_LARGE = "Secret exceeds maximum size";
    static constexpr std::string_view BRIDGE_SHUT_DOWN = "Event bridge has been shut down";
    static constexpr std::string_view NULL_CALLBACK = "Callback must not be empty";
    static constexpr std::string_view OPERATION_TIMED_OUT = "Secure storage operation timed out";
    static constexpr std::string_view SELF_TEST_MISMATCH = "Self-test read back different data";
};
}

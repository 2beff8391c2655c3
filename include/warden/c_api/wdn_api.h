#pragma once

#include "warden/c_api/wdn_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define WDN_API_VERSION_MAJOR 1
#define WDN_API_VERSION_MINOR 0
#define WDN_API_VERSION_PATCH 0

typedef enum {
    WDN_SUCCESS = 0,
    WDN_ERROR_INVALID_HANDLE = 1,
    WDN_ERROR_STORAGE_UNAVAILABLE = 2,
    WDN_ERROR_NOT_FOUND = 3,
    WDN_ERROR_ACCESS_DENIED = 4,
    WDN_ERROR_DUPLICATE_ITEM = 5,
    WDN_ERROR_INVALID_ARGUMENT = 6,
    WDN_ERROR_BACKEND = 7,
    WDN_ERROR_NULL_POINTER = 8,
    WDN_ERROR_BUFFER_TOO_SMALL = 9,
    WDN_ERROR_OUT_OF_MEMORY = 10,
    WDN_ERROR_SODIUM_FAILURE = 11,
    WDN_ERROR_INVALID_STATE = 12
} WdnErrorCode;

typedef enum {
    WDN_BACKEND_AUTO = 0,
    WDN_BACKEND_KEYCHAIN = 1,
    WDN_BACKEND_CREDENTIAL_STORE = 2,
    WDN_BACKEND_SECRET_SERVICE = 3,
    WDN_BACKEND_LIBSECRET = 4,
    WDN_BACKEND_VAULT = 5
} WdnBackendKind;

typedef enum {
    WDN_ACCESSIBLE_WHEN_UNLOCKED = 0,
    WDN_ACCESSIBLE_WHEN_UNLOCKED_DEVICE_ONLY = 1,
    WDN_ACCESSIBLE_AFTER_FIRST_UNLOCK = 2,
    WDN_ACCESSIBLE_AFTER_FIRST_UNLOCK_DEVICE_ONLY = 3,
    WDN_ACCESSIBLE_ALWAYS = 4,
    WDN_ACCESSIBLE_ALWAYS_DEVICE_ONLY = 5
} WdnAccessibility;

typedef enum {
    WDN_POLICY_LOW = 0,
    WDN_POLICY_STANDARD = 1,
    WDN_POLICY_HIGH = 2,
    WDN_POLICY_CUSTOM = 3
} WdnPolicyPreset;

typedef enum {
    WDN_SCRIPT = 0,
    WDN_COVENANT = 1
} WdnScriptKind;

typedef uint64_t WdnHandle;

#define WDN_INVALID_HANDLE ((WdnHandle)0)

typedef struct WdnRuntime WdnRuntime;

typedef struct WdnBuffer {
    uint8_t* data;
    size_t length;
} WdnBuffer;

typedef struct WdnError {
    WdnErrorCode code;
    char* message;
} WdnError;

typedef struct WdnRuntimeOptions {
    // NULL selects the default service namespace.
    const char* service;
    WdnBackendKind backend;
    bool allow_headless_fallback;
    bool strict_access_control;
    // Start even when no secure storage backend is reachable.
    bool storage_optional;
} WdnRuntimeOptions;

typedef struct WdnAccessPolicy {
    bool require_biometry;
    bool require_user_presence;
    bool allow_passcode_fallback;
    WdnAccessibility accessibility;
} WdnAccessPolicy;

typedef struct WdnStorageMetadata {
    int64_t created_ms;
    int64_t modified_ms;
    uint64_t size;
    bool has_policy;
    WdnAccessPolicy policy;
} WdnStorageMetadata;

typedef struct WdnStorageInfo {
    char backend_name[32];
    bool available;
    uint64_t item_count;
    bool using_fallback;
    bool persistent;
} WdnStorageInfo;

typedef struct WdnResourceCounts {
    uint64_t wallets;
    uint64_t private_keys;
    uint64_t public_keys;
    uint64_t scripts;
    uint64_t covenants;
} WdnResourceCounts;

typedef struct WdnEventStats {
    uint64_t registered_count;
    uint64_t queued_count;
    uint64_t emitted_total;
    uint64_t delivered_total;
    uint64_t dropped_total;
    uint64_t callback_failures;
} WdnEventStats;

// Valid only for the duration of the callback. event_type is NUL-terminated;
// data is the serialized event body and may be NULL when data_length is 0.
typedef struct WdnEvent {
    const char* event_type;
    WdnHandle resource_handle;
    const uint8_t* data;
    size_t data_length;
    int64_t timestamp_ms;
} WdnEvent;

typedef void (*WdnEventCallback)(const WdnEvent* event, void* user_data);

WDN_API const char* wdn_version(void);

WDN_API const char* wdn_error_string(WdnErrorCode code);

// ----------------------------------------------------------------------------
// Runtime
// ----------------------------------------------------------------------------

WDN_API void wdn_runtime_options_default(WdnRuntimeOptions* out_options);

// options may be NULL for the platform defaults.
WDN_API WdnErrorCode wdn_runtime_create(
    const WdnRuntimeOptions* options,
    WdnRuntime** out_runtime,
    WdnError* out_error);

// Stops event delivery, then releases every remaining resource.
WDN_API void wdn_runtime_destroy(WdnRuntime* runtime);

WDN_API WdnErrorCode wdn_runtime_resource_counts(
    const WdnRuntime* runtime,
    WdnResourceCounts* out_counts,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Access-control policy
// ----------------------------------------------------------------------------

WDN_API WdnErrorCode wdn_policy_preset(
    WdnPolicyPreset preset,
    WdnAccessPolicy* out_policy,
    WdnError* out_error);

// Human-readable description; release with wdn_string_free.
WDN_API WdnErrorCode wdn_policy_describe(
    const WdnAccessPolicy* policy,
    char** out_description,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Secure storage
// ----------------------------------------------------------------------------

// policy may be NULL for the default (standard) policy. Replaces any existing value.
WDN_API WdnErrorCode wdn_storage_store(
    WdnRuntime* runtime,
    const char* key,
    const uint8_t* value,
    size_t value_length,
    const WdnAccessPolicy* policy,
    WdnError* out_error);

// An absent key is not an error: *out_found is false and out_value is left empty.
WDN_API WdnErrorCode wdn_storage_retrieve(
    WdnRuntime* runtime,
    const char* key,
    WdnBuffer* out_value,
    bool* out_found,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_storage_remove(
    WdnRuntime* runtime,
    const char* key,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_storage_exists(
    WdnRuntime* runtime,
    const char* key,
    bool* out_exists,
    WdnError* out_error);

// Keys separated by '\n', in ascending order. Empty buffer when the store is empty.
WDN_API WdnErrorCode wdn_storage_list(
    WdnRuntime* runtime,
    WdnBuffer* out_keys,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_storage_clear(
    WdnRuntime* runtime,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_storage_metadata(
    WdnRuntime* runtime,
    const char* key,
    WdnStorageMetadata* out_metadata,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_storage_info(
    WdnRuntime* runtime,
    WdnStorageInfo* out_info,
    WdnError* out_error);

// Round-trips a temporary record through the active backend.
WDN_API WdnErrorCode wdn_storage_test(
    WdnRuntime* runtime,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Keys
// ----------------------------------------------------------------------------

WDN_API WdnErrorCode wdn_private_key_generate(
    WdnRuntime* runtime,
    WdnHandle* out_handle,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_private_key_import(
    WdnRuntime* runtime,
    const uint8_t* scalar,
    size_t scalar_length,
    WdnHandle* out_handle,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_private_key_derive_public(
    WdnRuntime* runtime,
    WdnHandle private_key,
    WdnHandle* out_public_key,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_private_key_destroy(
    WdnRuntime* runtime,
    WdnHandle handle,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_public_key_import(
    WdnRuntime* runtime,
    const uint8_t* point,
    size_t point_length,
    WdnHandle* out_handle,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_public_key_export(
    WdnRuntime* runtime,
    WdnHandle handle,
    WdnBuffer* out_point,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_public_key_destroy(
    WdnRuntime* runtime,
    WdnHandle handle,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Scripts and covenants
// ----------------------------------------------------------------------------

WDN_API WdnErrorCode wdn_script_load(
    WdnRuntime* runtime,
    WdnScriptKind kind,
    const uint8_t* image,
    size_t image_length,
    WdnHandle* out_handle,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_script_size(
    WdnRuntime* runtime,
    WdnScriptKind kind,
    WdnHandle handle,
    size_t* out_size,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_script_export(
    WdnRuntime* runtime,
    WdnScriptKind kind,
    WdnHandle handle,
    WdnBuffer* out_image,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_script_destroy(
    WdnRuntime* runtime,
    WdnScriptKind kind,
    WdnHandle handle,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Wallets
// ----------------------------------------------------------------------------

// Shuts the engine down and releases its event callback.
WDN_API WdnErrorCode wdn_wallet_destroy(
    WdnRuntime* runtime,
    WdnHandle handle,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------

// Replaces any callback registered for the wallet. WDN_ERROR_INVALID_HANDLE
// when the wallet is unknown or destroyed. Callbacks run on the runtime's
// dispatcher thread (or the emitting thread for direct events).
WDN_API WdnErrorCode wdn_event_set_callback(
    WdnRuntime* runtime,
    WdnHandle resource_handle,
    WdnEventCallback callback,
    void* user_data,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_event_remove_callback(
    WdnRuntime* runtime,
    WdnHandle resource_handle,
    WdnError* out_error);

// Queue an event for the handle; data is copied.
WDN_API WdnErrorCode wdn_event_emit(
    WdnRuntime* runtime,
    WdnHandle resource_handle,
    const char* event_type,
    const uint8_t* data,
    size_t data_length,
    WdnError* out_error);

// WDN_ERROR_INVALID_STATE when the queue has not drained within the timeout.
WDN_API WdnErrorCode wdn_event_wait_idle(
    WdnRuntime* runtime,
    uint32_t timeout_ms,
    WdnError* out_error);

WDN_API WdnErrorCode wdn_event_stats(
    const WdnRuntime* runtime,
    WdnEventStats* out_stats,
    WdnError* out_error);

// ----------------------------------------------------------------------------
// Memory
// ----------------------------------------------------------------------------

// Wipes and releases the buffer contents; the struct itself belongs to the caller.
WDN_API void wdn_buffer_release(WdnBuffer* buffer);

WDN_API void wdn_string_free(char* str);

WDN_API void wdn_error_free(WdnError* error);

#ifdef __cplusplus
}
#endif

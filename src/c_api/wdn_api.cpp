/**
 * @file wdn_api.cpp
 * @brief C API over WardenRuntime
 */

#include "warden/c_api/wdn_api.h"
#include "warden/c_api/wdn_native.hpp"
#include "wdn_internal.hpp"
#include "warden/core/constants.hpp"
#include "warden/crypto/sodium_interop.hpp"
#include "warden/events/event_payload.hpp"
#include "warden/models/compiled_script.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace warden;
using namespace warden::configuration;
using namespace warden::security;
using namespace warden::storage;
using warden::crypto::SodiumInterop;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace wdn::internal {

WdnErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? WDN_SUCCESS
               : WDN_ERROR_SODIUM_FAILURE;
}

void fill_error(WdnError* out_error, const WdnErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

WdnErrorCode fill_error_from_failure(WdnError* out_error, const WardenFailure& failure) {
    WdnErrorCode code = WDN_ERROR_BACKEND;

    switch (failure.type) {
        case FailureType::InvalidHandle:
            code = WDN_ERROR_INVALID_HANDLE;
            break;
        case FailureType::StorageUnavailable:
            code = WDN_ERROR_STORAGE_UNAVAILABLE;
            break;
        case FailureType::NotFound:
            code = WDN_ERROR_NOT_FOUND;
            break;
        case FailureType::AccessDenied:
            code = WDN_ERROR_ACCESS_DENIED;
            break;
        case FailureType::DuplicateItem:
            code = WDN_ERROR_DUPLICATE_ITEM;
            break;
        case FailureType::InvalidArgument:
            code = WDN_ERROR_INVALID_ARGUMENT;
            break;
        case FailureType::BackendError:
            code = WDN_ERROR_BACKEND;
            break;
    }

    if (out_error) {
        fill_error(out_error, code, failure.message);
    }
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, WdnError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, WdnError* out_error) {
    if (!handle) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, "Output handle pointer is null");
        return false;
    }
    return true;
}

WdnErrorCode validate_runtime(const WdnRuntime* runtime, WdnError* out_error) {
    if (!runtime || !runtime->runtime) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, "Runtime handle is null");
        return WDN_ERROR_NULL_POINTER;
    }
    if (runtime->runtime->IsShutDown()) {
        fill_error(out_error, WDN_ERROR_INVALID_STATE, "Runtime has been shut down");
        return WDN_ERROR_INVALID_STATE;
    }
    return WDN_SUCCESS;
}

bool validate_string_param(const char* value, const char* name, WdnError* out_error) {
    if (!value) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, std::string(name) + " is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, WdnBuffer* out_buffer, WdnError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }
    if (input.empty()) {
        out_buffer->data = nullptr;
        out_buffer->length = 0;
        return true;
    }

    auto* data = new(std::nothrow) uint8_t[input.size()];
    if (!data) {
        fill_error(out_error, WDN_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, input.data(), input.size());
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

Result<AccessControlPolicy, WardenFailure> policy_from_c(const WdnAccessPolicy& policy) {
    const int level = static_cast<int>(policy.accessibility);
    const auto accessibility = level >= 0 && level <= UINT8_MAX
                                   ? AccessControlPolicy::AccessibilityFromIndex(static_cast<uint8_t>(level))
                                   : std::nullopt;
    if (!accessibility.has_value()) {
        return Result<AccessControlPolicy, WardenFailure>::Err(
            WardenFailure::InvalidArgument("Unknown accessibility level " + std::to_string(level)));
    }
    return Result<AccessControlPolicy, WardenFailure>::Ok(
        AccessControlPolicy::Custom()
            .WithBiometry(policy.require_biometry)
            .WithUserPresence(policy.require_user_presence)
            .WithPasscodeFallback(policy.allow_passcode_fallback)
            .WithAccessibility(*accessibility));
}

WdnAccessPolicy policy_to_c(const AccessControlPolicy& policy) {
    WdnAccessPolicy out{};
    out.require_biometry = policy.RequiresBiometry();
    out.require_user_presence = policy.RequiresUserPresence();
    out.allow_passcode_fallback = policy.AllowsPasscodeFallback();
    out.accessibility = static_cast<WdnAccessibility>(policy.GetAccessibility());
    return out;
}

} // namespace wdn::internal

using namespace wdn::internal;

namespace {

Result<std::shared_ptr<SecureStorage>, WardenFailure> storage_of(const WdnRuntime* runtime) {
    return runtime->runtime->Storage();
}

bool validate_script_kind(const WdnScriptKind kind, WdnError* out_error) {
    if (kind != WDN_SCRIPT && kind != WDN_COVENANT) {
        fill_error(out_error, WDN_ERROR_INVALID_ARGUMENT, "Unknown script kind");
        return false;
    }
    return true;
}

models::ScriptKind script_kind_from_c(const WdnScriptKind kind) {
    return kind == WDN_COVENANT ? models::ScriptKind::Covenant : models::ScriptKind::Script;
}

template<typename T>
WdnErrorCode store_handle(Result<T, WardenFailure> result, WdnHandle* out_handle, WdnError* out_error) {
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    *out_handle = std::move(result).Unwrap();
    return WDN_SUCCESS;
}

WdnErrorCode check_unit(const Result<Unit, WardenFailure>& result, WdnError* out_error) {
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return WDN_SUCCESS;
}

} // anonymous namespace

extern "C" {

// ----------------------------------------------------------------------------
// Version & Errors
// ----------------------------------------------------------------------------

const char* wdn_version(void) {
    return "1.0.0";
}

const char* wdn_error_string(const WdnErrorCode code) {
    switch (code) {
        case WDN_SUCCESS: return "Success";
        case WDN_ERROR_INVALID_HANDLE: return "Invalid handle";
        case WDN_ERROR_STORAGE_UNAVAILABLE: return "Secure storage unavailable";
        case WDN_ERROR_NOT_FOUND: return "Not found";
        case WDN_ERROR_ACCESS_DENIED: return "Access denied";
        case WDN_ERROR_DUPLICATE_ITEM: return "Duplicate item";
        case WDN_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case WDN_ERROR_BACKEND: return "Backend error";
        case WDN_ERROR_NULL_POINTER: return "Null pointer";
        case WDN_ERROR_BUFFER_TOO_SMALL: return "Buffer too small";
        case WDN_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case WDN_ERROR_SODIUM_FAILURE: return "Sodium failure";
        case WDN_ERROR_INVALID_STATE: return "Invalid state";
        default: return "Unknown error";
    }
}

// ----------------------------------------------------------------------------
// Runtime
// ----------------------------------------------------------------------------

void wdn_runtime_options_default(WdnRuntimeOptions* out_options) {
    if (!out_options) {
        return;
    }
    const auto defaults = StorageConfig::Default();
    out_options->service = nullptr;
    out_options->backend = WDN_BACKEND_AUTO;
    out_options->allow_headless_fallback = defaults.allow_headless_fallback;
    out_options->strict_access_control = defaults.strict_access_control;
    out_options->storage_optional = false;
}

WdnErrorCode wdn_runtime_create(
    const WdnRuntimeOptions* options,
    WdnRuntime** out_runtime,
    WdnError* out_error) {
    if (const auto err = EnsureInitialized(); err != WDN_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_runtime, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    *out_runtime = nullptr;

    WdnRuntimeOptions effective{};
    wdn_runtime_options_default(&effective);
    if (options) {
        effective = *options;
    }
    if (effective.backend < WDN_BACKEND_AUTO || effective.backend > WDN_BACKEND_VAULT) {
        fill_error(out_error, WDN_ERROR_INVALID_ARGUMENT, "Unknown storage backend");
        return WDN_ERROR_INVALID_ARGUMENT;
    }

    RuntimeConfig config = RuntimeConfig::Default();
    if (effective.service) {
        config.storage.service = effective.service;
    }
    config.storage.backend = static_cast<BackendKind>(effective.backend);
    config.storage.allow_headless_fallback = effective.allow_headless_fallback;
    config.storage.strict_access_control = effective.strict_access_control;
    config.require_storage = !effective.storage_optional;

    auto created = runtime::WardenRuntime::Create(std::move(config));
    if (created.IsErr()) {
        return fill_error_from_failure(out_error, created.UnwrapErr());
    }

    auto* handle = new(std::nothrow) WdnRuntime{};
    if (!handle) {
        fill_error(out_error, WDN_ERROR_OUT_OF_MEMORY, "Failed to allocate runtime handle");
        return WDN_ERROR_OUT_OF_MEMORY;
    }
    handle->runtime = std::move(created).Unwrap();
    *out_runtime = handle;
    return WDN_SUCCESS;
}

void wdn_runtime_destroy(WdnRuntime* runtime) {
    if (!runtime) {
        return;
    }
    if (runtime->runtime) {
        runtime->runtime->Shutdown();
    }
    delete runtime;
}

WdnErrorCode wdn_runtime_resource_counts(
    const WdnRuntime* runtime,
    WdnResourceCounts* out_counts,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_counts, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    const auto counts = runtime->runtime->Resources().Counts();
    out_counts->wallets = counts.wallets;
    out_counts->private_keys = counts.private_keys;
    out_counts->public_keys = counts.public_keys;
    out_counts->scripts = counts.scripts;
    out_counts->covenants = counts.covenants;
    return WDN_SUCCESS;
}

// ----------------------------------------------------------------------------
// Access-control policy
// ----------------------------------------------------------------------------

WdnErrorCode wdn_policy_preset(
    const WdnPolicyPreset preset,
    WdnAccessPolicy* out_policy,
    WdnError* out_error) {
    if (!validate_output_handle(out_policy, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    switch (preset) {
        case WDN_POLICY_LOW:
            *out_policy = policy_to_c(AccessControlPolicy::LowSecurity());
            return WDN_SUCCESS;
        case WDN_POLICY_STANDARD:
            *out_policy = policy_to_c(AccessControlPolicy::StandardSecurity());
            return WDN_SUCCESS;
        case WDN_POLICY_HIGH:
            *out_policy = policy_to_c(AccessControlPolicy::HighSecurity());
            return WDN_SUCCESS;
        case WDN_POLICY_CUSTOM:
            *out_policy = policy_to_c(AccessControlPolicy::Custom());
            return WDN_SUCCESS;
    }
    fill_error(out_error, WDN_ERROR_INVALID_ARGUMENT, "Unknown policy preset");
    return WDN_ERROR_INVALID_ARGUMENT;
}

WdnErrorCode wdn_policy_describe(
    const WdnAccessPolicy* policy,
    char** out_description,
    WdnError* out_error) {
    if (!policy) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, "Policy is null");
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_description, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto converted = policy_from_c(*policy);
    if (converted.IsErr()) {
        return fill_error_from_failure(out_error, converted.UnwrapErr());
    }
    const std::string description = converted.Unwrap().Describe();
#ifdef _WIN32
    *out_description = _strdup(description.c_str());
#else
    *out_description = strdup(description.c_str());
#endif
    if (!*out_description) {
        fill_error(out_error, WDN_ERROR_OUT_OF_MEMORY, "Failed to allocate description");
        return WDN_ERROR_OUT_OF_MEMORY;
    }
    return WDN_SUCCESS;
}

// ----------------------------------------------------------------------------
// Secure storage
// ----------------------------------------------------------------------------

WdnErrorCode wdn_storage_store(
    WdnRuntime* runtime,
    const char* key,
    const uint8_t* value,
    const size_t value_length,
    const WdnAccessPolicy* policy,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_string_param(key, "key", out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(value, value_length, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }

    AccessControlPolicy effective = AccessControlPolicy::Default();
    if (policy) {
        auto converted = policy_from_c(*policy);
        if (converted.IsErr()) {
            return fill_error_from_failure(out_error, converted.UnwrapErr());
        }
        effective = converted.Unwrap();
    }

    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    const std::span<const uint8_t> bytes = value_length > 0
                                               ? std::span<const uint8_t>(value, value_length)
                                               : std::span<const uint8_t>();
    return check_unit(storage.Unwrap()->Store(key, bytes, effective), out_error);
}

WdnErrorCode wdn_storage_retrieve(
    WdnRuntime* runtime,
    const char* key,
    WdnBuffer* out_value,
    bool* out_found,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_string_param(key, "key", out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_value, out_error) || !validate_output_handle(out_found, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    out_value->data = nullptr;
    out_value->length = 0;
    *out_found = false;

    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    auto retrieved = storage.Unwrap()->Retrieve(key);
    if (retrieved.IsErr()) {
        return fill_error_from_failure(out_error, retrieved.UnwrapErr());
    }
    auto value = std::move(retrieved).Unwrap();
    if (!value.has_value()) {
        return WDN_SUCCESS;
    }
    const bool copied = copy_to_buffer(*value, out_value, out_error);
    SodiumInterop::SecureWipe(std::span<uint8_t>(*value));
    if (!copied) {
        return WDN_ERROR_OUT_OF_MEMORY;
    }
    *out_found = true;
    return WDN_SUCCESS;
}

WdnErrorCode wdn_storage_remove(
    WdnRuntime* runtime,
    const char* key,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_string_param(key, "key", out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    return check_unit(storage.Unwrap()->Remove(key), out_error);
}

WdnErrorCode wdn_storage_exists(
    WdnRuntime* runtime,
    const char* key,
    bool* out_exists,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_string_param(key, "key", out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_exists, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    auto exists = storage.Unwrap()->Exists(key);
    if (exists.IsErr()) {
        return fill_error_from_failure(out_error, exists.UnwrapErr());
    }
    *out_exists = exists.Unwrap();
    return WDN_SUCCESS;
}

WdnErrorCode wdn_storage_list(
    WdnRuntime* runtime,
    WdnBuffer* out_keys,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_keys, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    auto listed = storage.Unwrap()->List();
    if (listed.IsErr()) {
        return fill_error_from_failure(out_error, listed.UnwrapErr());
    }

    std::string joined;
    for (const auto& key : listed.Unwrap()) {
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined += key;
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(joined.data());
    if (!copy_to_buffer(std::span(bytes, joined.size()), out_keys, out_error)) {
        return WDN_ERROR_OUT_OF_MEMORY;
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_storage_clear(
    WdnRuntime* runtime,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    return check_unit(storage.Unwrap()->Clear(), out_error);
}

WdnErrorCode wdn_storage_metadata(
    WdnRuntime* runtime,
    const char* key,
    WdnStorageMetadata* out_metadata,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_string_param(key, "key", out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_metadata, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    auto metadata = storage.Unwrap()->GetMetadata(key);
    if (metadata.IsErr()) {
        return fill_error_from_failure(out_error, metadata.UnwrapErr());
    }
    const auto& found = metadata.Unwrap();
    *out_metadata = WdnStorageMetadata{};
    out_metadata->created_ms = found.created_ms;
    out_metadata->modified_ms = found.modified_ms;
    out_metadata->size = found.size;
    out_metadata->has_policy = found.policy.has_value();
    if (found.policy.has_value()) {
        out_metadata->policy = policy_to_c(*found.policy);
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_storage_info(
    WdnRuntime* runtime,
    WdnStorageInfo* out_info,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_info, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    auto info = storage.Unwrap()->GetInfo();
    if (info.IsErr()) {
        return fill_error_from_failure(out_error, info.UnwrapErr());
    }
    const auto& found = info.Unwrap();
    *out_info = WdnStorageInfo{};
    const size_t name_length = std::min(found.backend_name.size(), sizeof(out_info->backend_name) - 1);
    std::memcpy(out_info->backend_name, found.backend_name.data(), name_length);
    out_info->backend_name[name_length] = '\0';
    out_info->available = found.available;
    out_info->item_count = found.item_count;
    out_info->using_fallback = found.using_fallback;
    out_info->persistent = found.persistent;
    return WDN_SUCCESS;
}

WdnErrorCode wdn_storage_test(
    WdnRuntime* runtime,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    auto storage = storage_of(runtime);
    if (storage.IsErr()) {
        return fill_error_from_failure(out_error, storage.UnwrapErr());
    }
    return check_unit(storage.Unwrap()->Test(), out_error);
}

// ----------------------------------------------------------------------------
// Keys
// ----------------------------------------------------------------------------

WdnErrorCode wdn_private_key_generate(
    WdnRuntime* runtime,
    WdnHandle* out_handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    return store_handle(runtime->runtime->Resources().GeneratePrivateKey(), out_handle, out_error);
}

WdnErrorCode wdn_private_key_import(
    WdnRuntime* runtime,
    const uint8_t* scalar,
    const size_t scalar_length,
    WdnHandle* out_handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(scalar, scalar_length, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (scalar_length == 0) {
        fill_error(out_error, WDN_ERROR_INVALID_ARGUMENT, "Private key scalar is empty");
        return WDN_ERROR_INVALID_ARGUMENT;
    }
    return store_handle(
        runtime->runtime->Resources().ImportPrivateKey(std::span(scalar, scalar_length)), out_handle, out_error);
}

WdnErrorCode wdn_private_key_derive_public(
    WdnRuntime* runtime,
    const WdnHandle private_key,
    WdnHandle* out_public_key,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_public_key, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    return store_handle(runtime->runtime->Resources().DerivePublicKey(private_key), out_public_key, out_error);
}

WdnErrorCode wdn_private_key_destroy(
    WdnRuntime* runtime,
    const WdnHandle handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    return check_unit(runtime->runtime->Resources().DestroyPrivateKey(handle), out_error);
}

WdnErrorCode wdn_public_key_import(
    WdnRuntime* runtime,
    const uint8_t* point,
    const size_t point_length,
    WdnHandle* out_handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(point, point_length, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (point_length == 0) {
        fill_error(out_error, WDN_ERROR_INVALID_ARGUMENT, "Public key point is empty");
        return WDN_ERROR_INVALID_ARGUMENT;
    }
    return store_handle(
        runtime->runtime->Resources().ImportPublicKey(std::span(point, point_length)), out_handle, out_error);
}

WdnErrorCode wdn_public_key_export(
    WdnRuntime* runtime,
    const WdnHandle handle,
    WdnBuffer* out_point,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_point, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto exported = runtime->runtime->Resources().ExportPublicKey(handle);
    if (exported.IsErr()) {
        return fill_error_from_failure(out_error, exported.UnwrapErr());
    }
    if (!copy_to_buffer(exported.Unwrap(), out_point, out_error)) {
        return WDN_ERROR_OUT_OF_MEMORY;
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_public_key_destroy(
    WdnRuntime* runtime,
    const WdnHandle handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    return check_unit(runtime->runtime->Resources().DestroyPublicKey(handle), out_error);
}

// ----------------------------------------------------------------------------
// Scripts and covenants
// ----------------------------------------------------------------------------

WdnErrorCode wdn_script_load(
    WdnRuntime* runtime,
    const WdnScriptKind kind,
    const uint8_t* image,
    const size_t image_length,
    WdnHandle* out_handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_script_kind(kind, out_error)) {
        return WDN_ERROR_INVALID_ARGUMENT;
    }
    if (!validate_buffer_param(image, image_length, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    const std::span<const uint8_t> bytes = image_length > 0
                                               ? std::span<const uint8_t>(image, image_length)
                                               : std::span<const uint8_t>();
    return store_handle(
        runtime->runtime->Resources().LoadScript(script_kind_from_c(kind), bytes), out_handle, out_error);
}

WdnErrorCode wdn_script_size(
    WdnRuntime* runtime,
    const WdnScriptKind kind,
    const WdnHandle handle,
    size_t* out_size,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_script_kind(kind, out_error)) {
        return WDN_ERROR_INVALID_ARGUMENT;
    }
    if (!validate_output_handle(out_size, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto size = runtime->runtime->Resources().ScriptSize(script_kind_from_c(kind), handle);
    if (size.IsErr()) {
        return fill_error_from_failure(out_error, size.UnwrapErr());
    }
    *out_size = size.Unwrap();
    return WDN_SUCCESS;
}

WdnErrorCode wdn_script_export(
    WdnRuntime* runtime,
    const WdnScriptKind kind,
    const WdnHandle handle,
    WdnBuffer* out_image,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_script_kind(kind, out_error)) {
        return WDN_ERROR_INVALID_ARGUMENT;
    }
    if (!validate_output_handle(out_image, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    auto image = runtime->runtime->Resources().ScriptImage(script_kind_from_c(kind), handle);
    if (image.IsErr()) {
        return fill_error_from_failure(out_error, image.UnwrapErr());
    }
    if (!copy_to_buffer(image.Unwrap(), out_image, out_error)) {
        return WDN_ERROR_OUT_OF_MEMORY;
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_script_destroy(
    WdnRuntime* runtime,
    const WdnScriptKind kind,
    const WdnHandle handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_script_kind(kind, out_error)) {
        return WDN_ERROR_INVALID_ARGUMENT;
    }
    return check_unit(runtime->runtime->Resources().DestroyScript(script_kind_from_c(kind), handle), out_error);
}

// ----------------------------------------------------------------------------
// Wallets
// ----------------------------------------------------------------------------

WdnErrorCode wdn_wallet_destroy(
    WdnRuntime* runtime,
    const WdnHandle handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    return check_unit(runtime->runtime->Resources().DestroyWallet(handle), out_error);
}

} // extern "C"

WdnErrorCode wdn_wallet_attach(
    WdnRuntime* runtime,
    std::shared_ptr<interfaces::IWalletEngine> engine,
    WdnHandle* out_handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_handle, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!engine) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, "Wallet engine must not be null");
        return WDN_ERROR_NULL_POINTER;
    }
    return store_handle(runtime->runtime->Resources().AddWallet(std::move(engine)), out_handle, out_error);
}

extern "C" {

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------

WdnErrorCode wdn_event_set_callback(
    WdnRuntime* runtime,
    const WdnHandle resource_handle,
    const WdnEventCallback callback,
    void* user_data,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!callback) {
        fill_error(out_error, WDN_ERROR_NULL_POINTER, std::string(ErrorMessages::NULL_CALLBACK));
        return WDN_ERROR_NULL_POINTER;
    }
    auto registered = runtime->runtime->Resources().RegisterWalletCallback(
        resource_handle,
        [callback, user_data](const events::EventPayload& payload) {
            const auto data = payload.Data();
            WdnEvent event{};
            event.event_type = payload.EventType().c_str();
            event.resource_handle = payload.ResourceHandle();
            event.data = data.empty() ? nullptr : data.data();
            event.data_length = data.size();
            event.timestamp_ms = payload.TimestampMs();
            callback(&event, user_data);
        });
    if (registered.IsErr()) {
        if (registered.UnwrapErr().Is(FailureType::InvalidHandle)) {
            return fill_error_from_failure(out_error, registered.UnwrapErr());
        }
        fill_error(out_error, WDN_ERROR_INVALID_STATE, registered.UnwrapErr().message);
        return WDN_ERROR_INVALID_STATE;
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_event_remove_callback(
    WdnRuntime* runtime,
    const WdnHandle resource_handle,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    runtime->runtime->Events().Unregister(resource_handle);
    return WDN_SUCCESS;
}

WdnErrorCode wdn_event_emit(
    WdnRuntime* runtime,
    const WdnHandle resource_handle,
    const char* event_type,
    const uint8_t* data,
    const size_t data_length,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_string_param(event_type, "event_type", out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(data, data_length, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    std::vector<uint8_t> body;
    if (data_length > 0) {
        body.assign(data, data + data_length);
    }
    auto emitted = runtime->runtime->Events().Emit(resource_handle, event_type, std::move(body));
    if (emitted.IsErr()) {
        fill_error(out_error, WDN_ERROR_INVALID_STATE, emitted.UnwrapErr().message);
        return WDN_ERROR_INVALID_STATE;
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_event_wait_idle(
    WdnRuntime* runtime,
    const uint32_t timeout_ms,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!runtime->runtime->Events().WaitUntilIdle(std::chrono::milliseconds(timeout_ms))) {
        fill_error(out_error, WDN_ERROR_INVALID_STATE, "Event queue did not drain before the timeout");
        return WDN_ERROR_INVALID_STATE;
    }
    return WDN_SUCCESS;
}

WdnErrorCode wdn_event_stats(
    const WdnRuntime* runtime,
    WdnEventStats* out_stats,
    WdnError* out_error) {
    if (const auto err = validate_runtime(runtime, out_error); err != WDN_SUCCESS) {
        return err;
    }
    if (!validate_output_handle(out_stats, out_error)) {
        return WDN_ERROR_NULL_POINTER;
    }
    const auto stats = runtime->runtime->Events().Stats();
    out_stats->registered_count = stats.registered_count;
    out_stats->queued_count = stats.queued_count;
    out_stats->emitted_total = stats.emitted_total;
    out_stats->delivered_total = stats.delivered_total;
    out_stats->dropped_total = stats.dropped_total;
    out_stats->callback_failures = stats.callback_failures;
    return WDN_SUCCESS;
}

// ----------------------------------------------------------------------------
// Memory
// ----------------------------------------------------------------------------

void wdn_buffer_release(WdnBuffer* buffer) {
    if (buffer && buffer->data) {
        SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void wdn_string_free(char* str) {
    free(str);
}

void wdn_error_free(WdnError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

} // extern "C"

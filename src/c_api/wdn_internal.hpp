/**
 * @file wdn_internal.hpp
 * @brief Internal shared types and helpers for the warden C API
 *
 * This header is NOT part of the public API.
 */

#ifndef WDN_INTERNAL_HPP
#define WDN_INTERNAL_HPP

#include "warden/c_api/wdn_api.h"
#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/runtime/warden_runtime.hpp"
#include "warden/security/access_control_policy.hpp"
#include <memory>
#include <span>
#include <string>

/**
 * @brief Opaque handle wrapping a WardenRuntime instance
 */
struct WdnRuntime {
    std::unique_ptr<warden::runtime::WardenRuntime> runtime;
};

namespace wdn::internal {

using warden::Result;
using warden::WardenFailure;

/**
 * @brief Ensure libsodium is initialized
 * @return WDN_SUCCESS if initialized, error code otherwise
 */
WdnErrorCode EnsureInitialized();

/**
 * @brief Fill an error structure with code and message
 */
void fill_error(WdnError* out_error, WdnErrorCode code, const std::string& message);

/**
 * @brief Convert a WardenFailure to an error code and fill the error struct
 * @return The corresponding WdnErrorCode
 */
WdnErrorCode fill_error_from_failure(WdnError* out_error, const WardenFailure& failure);

/**
 * @brief Validate a buffer parameter (data pointer vs length)
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_buffer_param(const uint8_t* data, size_t length, WdnError* out_error);

/**
 * @brief Validate an output handle pointer is not null
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_output_handle(const void* handle, WdnError* out_error);

/**
 * @brief Validate a runtime pointer and that it has not been shut down
 * @return WDN_SUCCESS, or the failure code (also written to out_error)
 */
WdnErrorCode validate_runtime(const WdnRuntime* runtime, WdnError* out_error);

/**
 * @brief Validate a NUL-terminated string argument
 */
bool validate_string_param(const char* value, const char* name, WdnError* out_error);

/**
 * @brief Copy data to an output buffer (allocates memory)
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, WdnBuffer* out_buffer, WdnError* out_error);

Result<warden::security::AccessControlPolicy, WardenFailure> policy_from_c(const WdnAccessPolicy& policy);

WdnAccessPolicy policy_to_c(const warden::security::AccessControlPolicy& policy);

} // namespace wdn::internal

#endif // WDN_INTERNAL_HPP

#pragma once

#include "warden/security/access_control_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace warden::storage {

struct StoreOptions {
    security::AccessControlPolicy policy = security::AccessControlPolicy::Default();
    std::optional<std::string> label;
    std::optional<std::string> comment;
};

/// Timestamps are milliseconds since the Unix epoch; zero when the backend does not record them.
struct StorageMetadata {
    int64_t created_ms = 0;
    int64_t modified_ms = 0;
    size_t size = 0;
    std::optional<security::AccessControlPolicy> policy;
};

struct StorageInfo {
    std::string backend_name;
    bool available = false;
    size_t item_count = 0;
    bool using_fallback = false;
    bool persistent = false;
};

/// What a backend can enforce on its own, independent of any policy it stores.
struct BackendCapabilities {
    bool enforces_biometry = false;
    bool enforces_user_presence = false;
    bool persistent = false;
};

} // namespace warden::storage

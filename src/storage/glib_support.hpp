#pragma once

#include "warden/core/failures.hpp"
#include "warden/storage/secret_service_backend.hpp"

#include <gio/gio.h>

#include <charconv>
#include "warden/core/format.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace warden::storage::glib {

struct ErrorDeleter {
    void operator()(GError* error) const noexcept { g_error_free(error); }
};
struct VariantDeleter {
    void operator()(GVariant* variant) const noexcept { g_variant_unref(variant); }
};
struct ObjectDeleter {
    void operator()(gpointer object) const noexcept { g_object_unref(object); }
};
struct HashTableDeleter {
    void operator()(GHashTable* table) const noexcept { g_hash_table_unref(table); }
};
struct FreeDeleter {
    void operator()(gchar* text) const noexcept { g_free(text); }
};

using ErrorPtr = std::unique_ptr<GError, ErrorDeleter>;
using VariantPtr = std::unique_ptr<GVariant, VariantDeleter>;
using HashTablePtr = std::unique_ptr<GHashTable, HashTableDeleter>;
using StringPtr = std::unique_ptr<gchar, FreeDeleter>;

/// Takes ownership of @p raw and classifies it by its D-Bus error name.
inline WardenFailure FailureFromGError(GError* raw, const std::string_view context) {
    const ErrorPtr error(raw);
    if (!error) {
        return WardenFailure::BackendError(compat::format("{}: unknown GLib failure", context));
    }
    std::string message = compat::format("{}: {}", context, error->message);
    if (g_error_matches(error.get(), G_IO_ERROR, G_IO_ERROR_TIMED_OUT) ||
        g_error_matches(error.get(), G_IO_ERROR, G_IO_ERROR_CLOSED) ||
        g_error_matches(error.get(), G_IO_ERROR, G_IO_ERROR_CONNECTION_REFUSED)) {
        return WardenFailure::StorageUnavailable(std::move(message));
    }
    StringPtr name(g_dbus_error_is_remote_error(error.get())
        ? g_dbus_error_get_remote_error(error.get())
        : g_dbus_error_encode_gerror(error.get()));
    return SecretServiceBackend::ClassifyError(name ? std::string_view(name.get()) : std::string_view{},
        std::move(message));
}

inline int64_t SecondsToMs(const guint64 seconds) noexcept {
    return static_cast<int64_t>(seconds) * 1000;
}

/// Plaintext size recorded as an item attribute at write time; 0 when absent or malformed.
inline size_t ParseSizeAttribute(const std::string_view text) noexcept {
    size_t size = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), size);
    if (error != std::errc() || end != text.data() + text.size()) {
        return 0;
    }
    return size;
}

} // namespace warden::storage::glib

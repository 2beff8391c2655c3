#include "warden/storage/secret_service_backend.hpp"
#include "warden/core/constants.hpp"
#include "warden/debug/log.hpp"
#include "glib_support.hpp"

#include <array>
#include "warden/core/format.hpp"
#include <string_view>
#include <utility>

namespace warden::storage {

namespace {

    constexpr std::string_view LOG_COMPONENT = "secret-service";

    constexpr const char* BUS_NAME = "org.freedesktop.secrets";
    constexpr const char* SERVICE_PATH = "/org/freedesktop/secrets";
    constexpr const char* DEFAULT_COLLECTION = "/org/freedesktop/secrets/aliases/default";
    constexpr const char* SERVICE_INTERFACE = "org.freedesktop.Secret.Service";
    constexpr const char* COLLECTION_INTERFACE = "org.freedesktop.Secret.Collection";
    constexpr const char* ITEM_INTERFACE = "org.freedesktop.Secret.Item";
    constexpr const char* SESSION_INTERFACE = "org.freedesktop.Secret.Session";
    constexpr const char* PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";
    constexpr const char* PROPERTY_LABEL = "org.freedesktop.Secret.Item.Label";
    constexpr const char* PROPERTY_ATTRIBUTES = "org.freedesktop.Secret.Item.Attributes";
    constexpr const char* PLAIN_ALGORITHM = "plain";
    constexpr const char* CONTENT_TYPE = "application/octet-stream";
    constexpr std::string_view NO_PROMPT = "/";
    constexpr gint CALL_TIMEOUT_MS = 5000;

    constexpr std::array<std::string_view, 7> UNAVAILABLE_ERRORS = {
        "org.freedesktop.DBus.Error.ServiceUnknown",
        "org.freedesktop.DBus.Error.NameHasNoOwner",
        "org.freedesktop.DBus.Error.NoServer",
        "org.freedesktop.DBus.Error.NoReply",
        "org.freedesktop.DBus.Error.Disconnected",
        "org.freedesktop.DBus.Error.Timeout",
        "org.freedesktop.DBus.Error.TimedOut",
    };

    constexpr std::array<std::string_view, 4> ACCESS_DENIED_ERRORS = {
        "org.freedesktop.Secret.Error.IsLocked",
        "org.freedesktop.DBus.Error.AccessDenied",
        "org.freedesktop.DBus.Error.AuthFailed",
        "org.freedesktop.DBus.Error.InteractiveAuthorizationRequired",
    };

    constexpr std::array<std::string_view, 2> NOT_FOUND_ERRORS = {
        "org.freedesktop.Secret.Error.NoSuchObject",
        "org.freedesktop.DBus.Error.UnknownObject",
    };

    template<size_t N>
    bool Contains(const std::array<std::string_view, N>& names, const std::string_view name) {
        for (const auto candidate : names) {
            if (candidate == name) {
                return true;
            }
        }
        return false;
    }

    GVariant* BytesVariant(std::span<const uint8_t> bytes) {
        static constexpr uint8_t EMPTY = 0;
        return g_variant_new_fixed_array(G_VARIANT_TYPE_BYTE,
            bytes.empty() ? &EMPTY : bytes.data(), bytes.size(), sizeof(uint8_t));
    }

    struct ItemPaths {
        std::vector<std::string> unlocked;
        std::vector<std::string> locked;
    };

    void CollectPaths(GVariantIter* iter, std::vector<std::string>& out) {
        const gchar* path = nullptr;
        while (g_variant_iter_next(iter, "&o", &path)) {
            out.emplace_back(path);
        }
        g_variant_iter_free(iter);
    }

    WardenFailure PromptRequired(const std::string_view operation) {
        return WardenFailure::AccessDenied(
            compat::format("Secret Service requires an interactive prompt to {}", operation));
    }

} // anonymous namespace

// ============================================================================
// Connection: session bus plus an open "plain" transfer session
// ============================================================================

class SecretServiceBackend::Connection {
public:
    Connection(GDBusConnection* bus, std::string session_path)
        : bus_(bus), session_path_(std::move(session_path)) {}

    ~Connection() {
        GError* raw = nullptr;
        GVariant* reply = g_dbus_connection_call_sync(bus_, BUS_NAME, session_path_.c_str(),
            SESSION_INTERFACE, "Close", nullptr, nullptr, G_DBUS_CALL_FLAGS_NONE,
            CALL_TIMEOUT_MS, nullptr, &raw);
        if (reply != nullptr) {
            g_variant_unref(reply);
        } else {
            const auto failure = glib::FailureFromGError(raw, "Session.Close");
            WARDEN_LOG_DEBUG(LOG_COMPONENT, "{}", failure.message);
        }
        g_object_unref(bus_);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] const std::string& SessionPath() const noexcept { return session_path_; }

    /// @p parameters is a floating reference and is consumed.
    Result<glib::VariantPtr, WardenFailure> Call(
        const std::string& object_path,
        const char* interface_name,
        const char* method,
        GVariant* parameters,
        const char* reply_type) const {
        GError* raw = nullptr;
        GVariant* reply = g_dbus_connection_call_sync(bus_, BUS_NAME, object_path.c_str(),
            interface_name, method, parameters,
            reply_type != nullptr ? G_VARIANT_TYPE(reply_type) : nullptr,
            G_DBUS_CALL_FLAGS_NONE, CALL_TIMEOUT_MS, nullptr, &raw);
        if (reply == nullptr) {
            return Result<glib::VariantPtr, WardenFailure>::Err(
                glib::FailureFromGError(raw, compat::format("{}.{}", interface_name, method)));
        }
        return Result<glib::VariantPtr, WardenFailure>::Ok(glib::VariantPtr(reply));
    }

    /// Returns the unwrapped value of an org.freedesktop.Secret.Item property.
    Result<glib::VariantPtr, WardenFailure> GetItemProperty(const std::string& item, const char* property) const {
        auto reply = Call(item, PROPERTIES_INTERFACE, "Get",
            g_variant_new("(ss)", ITEM_INTERFACE, property), "(v)");
        if (reply.IsErr()) {
            return reply;
        }
        GVariant* value = nullptr;
        g_variant_get(reply.Unwrap().get(), "(v)", &value);
        return Result<glib::VariantPtr, WardenFailure>::Ok(glib::VariantPtr(value));
    }

    Result<ItemPaths, WardenFailure> Search(GVariant* attributes) const {
        auto reply = Call(SERVICE_PATH, SERVICE_INTERFACE, "SearchItems",
            g_variant_new("(@a{ss})", attributes), "(aoao)");
        if (reply.IsErr()) {
            return Result<ItemPaths, WardenFailure>::Err(std::move(reply).UnwrapErr());
        }
        ItemPaths paths;
        GVariantIter* unlocked = nullptr;
        GVariantIter* locked = nullptr;
        g_variant_get(reply.Unwrap().get(), "(aoao)", &unlocked, &locked);
        CollectPaths(unlocked, paths.unlocked);
        CollectPaths(locked, paths.locked);
        return Result<ItemPaths, WardenFailure>::Ok(std::move(paths));
    }

    Result<Unit, WardenFailure> Unlock(const std::vector<std::string>& objects) const {
        GVariantBuilder builder;
        g_variant_builder_init(&builder, G_VARIANT_TYPE("ao"));
        for (const auto& object : objects) {
            g_variant_builder_add(&builder, "o", object.c_str());
        }
        auto reply = Call(SERVICE_PATH, SERVICE_INTERFACE, "Unlock",
            g_variant_new("(ao)", &builder), "(aoo)");
        if (reply.IsErr()) {
            return Result<Unit, WardenFailure>::Err(std::move(reply).UnwrapErr());
        }
        GVariantIter* unlocked = nullptr;
        const gchar* prompt = nullptr;
        g_variant_get(reply.Unwrap().get(), "(ao&o)", &unlocked, &prompt);
        g_variant_iter_free(unlocked);
        if (NO_PROMPT != prompt) {
            return Result<Unit, WardenFailure>::Err(PromptRequired("unlock the collection"));
        }
        return Result<Unit, WardenFailure>::Ok(unit);
    }

private:
    GDBusConnection* bus_;
    std::string session_path_;
};

// ============================================================================
// Backend
// ============================================================================

namespace {

    GVariant* SearchAttributes(const std::string& service, const std::string_view* account) {
        GVariantBuilder builder;
        g_variant_builder_init(&builder, G_VARIANT_TYPE("a{ss}"));
        g_variant_builder_add(&builder, "{ss}",
            std::string(StorageConstants::ATTR_SERVICE).c_str(), service.c_str());
        g_variant_builder_add(&builder, "{ss}",
            std::string(StorageConstants::ATTR_APPLICATION).c_str(),
            std::string(StorageConstants::APPLICATION_ATTRIBUTE).c_str());
        if (account != nullptr) {
            g_variant_builder_add(&builder, "{ss}",
                std::string(StorageConstants::ATTR_ACCOUNT).c_str(), std::string(*account).c_str());
        }
        return g_variant_builder_end(&builder);
    }

    /// Item path without unlocking; properties stay readable on locked items.
    Result<std::string, WardenFailure> LocateItem(
        const SecretServiceBackend::Connection& connection,
        const std::string& service,
        const std::string_view account) {
        using R = Result<std::string, WardenFailure>;
        auto found = connection.Search(SearchAttributes(service, &account));
        if (found.IsErr()) {
            return R::Err(std::move(found).UnwrapErr());
        }
        ItemPaths paths = std::move(found).Unwrap();
        if (!paths.unlocked.empty()) {
            return R::Ok(std::move(paths.unlocked.front()));
        }
        if (!paths.locked.empty()) {
            return R::Ok(std::move(paths.locked.front()));
        }
        return R::Err(WardenFailure::NotFound(compat::format("No secret for '{}'", account)));
    }

    Result<std::string, WardenFailure> ResolveItem(
        const SecretServiceBackend::Connection& connection,
        const std::string& service,
        const std::string_view account) {
        using R = Result<std::string, WardenFailure>;
        auto found = connection.Search(SearchAttributes(service, &account));
        if (found.IsErr()) {
            return R::Err(std::move(found).UnwrapErr());
        }
        ItemPaths paths = std::move(found).Unwrap();
        if (!paths.unlocked.empty()) {
            return R::Ok(std::move(paths.unlocked.front()));
        }
        if (paths.locked.empty()) {
            return R::Err(WardenFailure::NotFound(compat::format("No secret for '{}'", account)));
        }
        WARDEN_TRY_ERR(R, connection.Unlock({paths.locked.front()}));
        return R::Ok(std::move(paths.locked.front()));
    }

} // anonymous namespace

SecretServiceBackend::SecretServiceBackend(std::string service)
    : service_(std::move(service)) {}

SecretServiceBackend::~SecretServiceBackend() = default;

std::string_view SecretServiceBackend::Name() const noexcept {
    return "secret-service";
}

BackendCapabilities SecretServiceBackend::Capabilities() const noexcept {
    return BackendCapabilities{
        .enforces_biometry = false,
        .enforces_user_presence = false,
        .persistent = true,
    };
}

WardenFailure SecretServiceBackend::ClassifyError(const std::string_view dbus_error_name, std::string message) {
    if (Contains(UNAVAILABLE_ERRORS, dbus_error_name) ||
        dbus_error_name.starts_with("org.freedesktop.DBus.Error.Spawn")) {
        return WardenFailure::StorageUnavailable(std::move(message));
    }
    if (Contains(ACCESS_DENIED_ERRORS, dbus_error_name)) {
        return WardenFailure::AccessDenied(std::move(message));
    }
    if (Contains(NOT_FOUND_ERRORS, dbus_error_name)) {
        return WardenFailure::NotFound(std::move(message));
    }
    if (dbus_error_name == "org.freedesktop.Secret.Error.AlreadyExists") {
        return WardenFailure::DuplicateItem(std::move(message));
    }
    return WardenFailure::BackendError(std::move(message));
}

Result<std::shared_ptr<SecretServiceBackend::Connection>, WardenFailure> SecretServiceBackend::Connect() {
    using R = Result<std::shared_ptr<Connection>, WardenFailure>;
    std::lock_guard guard(connect_lock_);
    if (connection_) {
        return R::Ok(connection_);
    }

    GError* raw = nullptr;
    GDBusConnection* bus = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &raw);
    if (bus == nullptr) {
        const glib::ErrorPtr error(raw);
        return R::Err(WardenFailure::StorageUnavailable(compat::format("No D-Bus session bus: {}",
            error ? error->message : "unknown error")));
    }

    GVariant* reply = g_dbus_connection_call_sync(bus, BUS_NAME, SERVICE_PATH, SERVICE_INTERFACE,
        "OpenSession", g_variant_new("(sv)", PLAIN_ALGORITHM, g_variant_new_string("")),
        G_VARIANT_TYPE("(vo)"), G_DBUS_CALL_FLAGS_NONE, CALL_TIMEOUT_MS, nullptr, &raw);
    if (reply == nullptr) {
        g_object_unref(bus);
        return R::Err(glib::FailureFromGError(raw, "Service.OpenSession"));
    }
    const glib::VariantPtr owned_reply(reply);
    GVariant* output = nullptr;
    const gchar* session_path = nullptr;
    g_variant_get(reply, "(v&o)", &output, &session_path);
    g_variant_unref(output);

    connection_ = std::make_shared<Connection>(bus, session_path);
    WARDEN_LOG_DEBUG(LOG_COMPONENT, "Opened session {}", connection_->SessionPath());
    return R::Ok(connection_);
}

Result<Unit, WardenFailure> SecretServiceBackend::Probe() {
    auto connection = Connect();
    if (connection.IsErr()) {
        return Result<Unit, WardenFailure>::Err(std::move(connection).UnwrapErr());
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> SecretServiceBackend::Write(
    const std::string_view account,
    std::span<const uint8_t> secret,
    const StoreOptions& options) {
    using R = Result<Unit, WardenFailure>;
    auto connected = Connect();
    if (connected.IsErr()) {
        return R::Err(std::move(connected).UnwrapErr());
    }
    const auto connection = std::move(connected).Unwrap();
    WARDEN_TRY_ERR(R, connection->Unlock({DEFAULT_COLLECTION}));

    const std::string account_text(account);
    const std::string label = options.label.value_or(
        compat::format("{}{}", StorageConstants::LABEL_PREFIX, account));
    const std::string policy = options.policy.Encode();
    const std::string size = std::to_string(secret.size());

    GVariantBuilder attributes;
    g_variant_builder_init(&attributes, G_VARIANT_TYPE("a{ss}"));
    g_variant_builder_add(&attributes, "{ss}",
        std::string(StorageConstants::ATTR_SERVICE).c_str(), service_.c_str());
    g_variant_builder_add(&attributes, "{ss}",
        std::string(StorageConstants::ATTR_ACCOUNT).c_str(), account_text.c_str());
    g_variant_builder_add(&attributes, "{ss}",
        std::string(StorageConstants::ATTR_APPLICATION).c_str(),
        std::string(StorageConstants::APPLICATION_ATTRIBUTE).c_str());
    g_variant_builder_add(&attributes, "{ss}",
        std::string(StorageConstants::ATTR_POLICY).c_str(), policy.c_str());
    g_variant_builder_add(&attributes, "{ss}",
        std::string(StorageConstants::ATTR_SIZE).c_str(), size.c_str());

    GVariantBuilder properties;
    g_variant_builder_init(&properties, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&properties, "{sv}", PROPERTY_LABEL, g_variant_new_string(label.c_str()));
    g_variant_builder_add(&properties, "{sv}", PROPERTY_ATTRIBUTES, g_variant_builder_end(&attributes));

    GVariant* secret_struct = g_variant_new("(o@ay@ays)",
        connection->SessionPath().c_str(),
        BytesVariant({}),
        BytesVariant(secret),
        CONTENT_TYPE);

    auto reply = connection->Call(DEFAULT_COLLECTION, COLLECTION_INTERFACE, "CreateItem",
        g_variant_new("(a{sv}@(oayays)b)", &properties, secret_struct, TRUE), "(oo)");
    if (reply.IsErr()) {
        return R::Err(std::move(reply).UnwrapErr());
    }
    const gchar* item = nullptr;
    const gchar* prompt = nullptr;
    g_variant_get(reply.Unwrap().get(), "(&o&o)", &item, &prompt);
    if (NO_PROMPT != prompt) {
        return R::Err(PromptRequired("create an item"));
    }
    WARDEN_LOG_DEBUG(LOG_COMPONENT, "Created item {} for '{}'", item, account);
    return R::Ok(unit);
}

Result<std::vector<uint8_t>, WardenFailure> SecretServiceBackend::Read(const std::string_view account) {
    using R = Result<std::vector<uint8_t>, WardenFailure>;
    auto connected = Connect();
    if (connected.IsErr()) {
        return R::Err(std::move(connected).UnwrapErr());
    }
    const auto connection = std::move(connected).Unwrap();
    auto item = ResolveItem(*connection, service_, account);
    if (item.IsErr()) {
        return R::Err(std::move(item).UnwrapErr());
    }

    auto reply = connection->Call(item.Unwrap(), ITEM_INTERFACE, "GetSecret",
        g_variant_new("(o)", connection->SessionPath().c_str()), "((oayays))");
    if (reply.IsErr()) {
        return R::Err(std::move(reply).UnwrapErr());
    }
    const glib::VariantPtr secret_struct(g_variant_get_child_value(reply.Unwrap().get(), 0));
    const glib::VariantPtr value(g_variant_get_child_value(secret_struct.get(), 2));
    gsize length = 0;
    const auto* bytes = static_cast<const uint8_t*>(
        g_variant_get_fixed_array(value.get(), &length, sizeof(uint8_t)));
    return R::Ok(std::vector<uint8_t>(bytes, bytes + length));
}

Result<Unit, WardenFailure> SecretServiceBackend::Delete(const std::string_view account) {
    using R = Result<Unit, WardenFailure>;
    auto connected = Connect();
    if (connected.IsErr()) {
        return R::Err(std::move(connected).UnwrapErr());
    }
    const auto connection = std::move(connected).Unwrap();
    auto item = ResolveItem(*connection, service_, account);
    if (item.IsErr()) {
        return R::Err(std::move(item).UnwrapErr());
    }
    auto reply = connection->Call(item.Unwrap(), ITEM_INTERFACE, "Delete", nullptr, "(o)");
    if (reply.IsErr()) {
        return R::Err(std::move(reply).UnwrapErr());
    }
    const gchar* prompt = nullptr;
    g_variant_get(reply.Unwrap().get(), "(&o)", &prompt);
    if (NO_PROMPT != prompt) {
        return R::Err(PromptRequired("delete an item"));
    }
    return R::Ok(unit);
}

Result<std::vector<std::string>, WardenFailure> SecretServiceBackend::ListAccounts() {
    using R = Result<std::vector<std::string>, WardenFailure>;
    auto connected = Connect();
    if (connected.IsErr()) {
        return R::Err(std::move(connected).UnwrapErr());
    }
    const auto connection = std::move(connected).Unwrap();
    auto found = connection->Search(SearchAttributes(service_, nullptr));
    if (found.IsErr()) {
        return R::Err(std::move(found).UnwrapErr());
    }
    ItemPaths paths = std::move(found).Unwrap();
    paths.unlocked.insert(paths.unlocked.end(), paths.locked.begin(), paths.locked.end());

    const std::string account_key(StorageConstants::ATTR_ACCOUNT);
    std::vector<std::string> accounts;
    accounts.reserve(paths.unlocked.size());
    for (const auto& item : paths.unlocked) {
        auto attributes = connection->GetItemProperty(item, "Attributes");
        if (attributes.IsErr()) {
            return R::Err(std::move(attributes).UnwrapErr());
        }
        const gchar* account = nullptr;
        if (g_variant_lookup(attributes.Unwrap().get(), account_key.c_str(), "&s", &account)) {
            accounts.emplace_back(account);
        }
    }
    return R::Ok(std::move(accounts));
}

Result<StorageMetadata, WardenFailure> SecretServiceBackend::ReadMetadata(const std::string_view account) {
    using R = Result<StorageMetadata, WardenFailure>;
    auto connected = Connect();
    if (connected.IsErr()) {
        return R::Err(std::move(connected).UnwrapErr());
    }
    const auto connection = std::move(connected).Unwrap();
    auto resolved = LocateItem(*connection, service_, account);
    if (resolved.IsErr()) {
        return R::Err(std::move(resolved).UnwrapErr());
    }
    const std::string item = std::move(resolved).Unwrap();

    StorageMetadata metadata;
    auto created = connection->GetItemProperty(item, "Created");
    if (created.IsErr()) {
        return R::Err(std::move(created).UnwrapErr());
    }
    metadata.created_ms = glib::SecondsToMs(g_variant_get_uint64(created.Unwrap().get()));
    auto modified = connection->GetItemProperty(item, "Modified");
    if (modified.IsErr()) {
        return R::Err(std::move(modified).UnwrapErr());
    }
    metadata.modified_ms = glib::SecondsToMs(g_variant_get_uint64(modified.Unwrap().get()));

    auto attributes = connection->GetItemProperty(item, "Attributes");
    if (attributes.IsErr()) {
        return R::Err(std::move(attributes).UnwrapErr());
    }
    const gchar* size = nullptr;
    if (g_variant_lookup(attributes.Unwrap().get(),
            std::string(StorageConstants::ATTR_SIZE).c_str(), "&s", &size)) {
        metadata.size = glib::ParseSizeAttribute(size);
    }
    const gchar* encoded = nullptr;
    if (g_variant_lookup(attributes.Unwrap().get(),
            std::string(StorageConstants::ATTR_POLICY).c_str(), "&s", &encoded)) {
        auto policy = security::AccessControlPolicy::Decode(encoded);
        if (policy.IsOk()) {
            metadata.policy = std::move(policy).Unwrap();
        } else {
            WARDEN_LOG_WARN(LOG_COMPONENT, "Ignoring policy attribute of '{}': {}",
                account, policy.UnwrapErr().message);
        }
    }

    return R::Ok(std::move(metadata));
}

} // namespace warden::storage

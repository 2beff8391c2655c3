#include "warden/storage/libsecret_backend.hpp"
#include "warden/core/constants.hpp"
#include "warden/debug/log.hpp"
#include "glib_support.hpp"

#include <libsecret/secret.h>

#include "warden/core/format.hpp"
#include <optional>

namespace warden::storage {

namespace {

    constexpr std::string_view LOG_COMPONENT = "libsecret";
    constexpr const char* CONTENT_TYPE = "application/octet-stream";

    const SecretSchema* WardenSchema() {
        static const SecretSchema schema = {
            "org.warden.Secret",
            SECRET_SCHEMA_NONE,
            {
                {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {"application", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {"policy", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {"size", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
            },
        };
        return &schema;
    }

    struct SecretValueDeleter {
        void operator()(SecretValue* value) const noexcept { secret_value_unref(value); }
    };
    using SecretValuePtr = std::unique_ptr<SecretValue, SecretValueDeleter>;

    struct ListDeleter {
        void operator()(GList* list) const noexcept { g_list_free_full(list, g_object_unref); }
    };
    using ItemListPtr = std::unique_ptr<GList, ListDeleter>;

    /// Attribute table whose strings outlive the GHashTable that points into them.
    class Attributes {
    public:
        Attributes(const std::string& service, std::optional<std::string_view> account)
            : service_(service)
            , application_(StorageConstants::APPLICATION_ATTRIBUTE)
            , table_(g_hash_table_new(g_str_hash, g_str_equal)) {
            g_hash_table_insert(table_.get(), const_cast<char*>("service"), service_.data());
            g_hash_table_insert(table_.get(), const_cast<char*>("application"), application_.data());
            if (account.has_value()) {
                account_ = std::string(*account);
                g_hash_table_insert(table_.get(), const_cast<char*>("account"), account_.data());
            }
        }

        void SetPolicy(std::string encoded) {
            policy_ = std::move(encoded);
            g_hash_table_insert(table_.get(), const_cast<char*>("policy"), policy_.data());
        }

        void SetSize(const size_t size) {
            size_ = std::to_string(size);
            g_hash_table_insert(table_.get(), const_cast<char*>("size"), size_.data());
        }

        [[nodiscard]] GHashTable* Get() const noexcept { return table_.get(); }

    private:
        std::string service_;
        std::string application_;
        std::string account_;
        std::string policy_;
        std::string size_;
        glib::HashTablePtr table_;
    };

    WardenFailure FromLibSecretError(GError* raw, const std::string_view context) {
        if (raw != nullptr && raw->domain == SECRET_ERROR) {
            const glib::ErrorPtr error(raw);
            std::string message = compat::format("{}: {}", context, error->message);
            switch (error->code) {
                case SECRET_ERROR_IS_LOCKED:
                    return WardenFailure::AccessDenied(std::move(message));
                case SECRET_ERROR_NO_SUCH_OBJECT:
                    return WardenFailure::NotFound(std::move(message));
                case SECRET_ERROR_ALREADY_EXISTS:
                    return WardenFailure::DuplicateItem(std::move(message));
                default:
                    return WardenFailure::BackendError(std::move(message));
            }
        }
        return glib::FailureFromGError(raw, context);
    }

    Result<ItemListPtr, WardenFailure> Search(const Attributes& attributes, const SecretSearchFlags flags) {
        GError* raw = nullptr;
        GList* items = secret_password_searchv_sync(
            WardenSchema(), attributes.Get(), flags, nullptr, &raw);
        if (raw != nullptr) {
            if (items != nullptr) {
                g_list_free_full(items, g_object_unref);
            }
            return Result<ItemListPtr, WardenFailure>::Err(FromLibSecretError(raw, "secret_password_search"));
        }
        return Result<ItemListPtr, WardenFailure>::Ok(ItemListPtr(items));
    }

    std::optional<std::string> LookupAttribute(SecretRetrievable* item, const char* name) {
        const glib::HashTablePtr attributes(secret_retrievable_get_attributes(item));
        if (!attributes) {
            return std::nullopt;
        }
        const auto* value = static_cast<const gchar*>(g_hash_table_lookup(attributes.get(), name));
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

} // anonymous namespace

LibSecretBackend::LibSecretBackend(std::string service)
    : service_(std::move(service)) {}

std::string_view LibSecretBackend::Name() const noexcept {
    return "libsecret";
}

BackendCapabilities LibSecretBackend::Capabilities() const noexcept {
    return BackendCapabilities{
        .enforces_biometry = false,
        .enforces_user_presence = false,
        .persistent = true,
    };
}

Result<Unit, WardenFailure> LibSecretBackend::Probe() {
    const Attributes attributes(service_, std::nullopt);
    auto found = Search(attributes, SECRET_SEARCH_NONE);
    if (found.IsErr()) {
        auto failure = std::move(found).UnwrapErr();
        if (failure.Is(FailureType::BackendError)) {
            failure = WardenFailure::StorageUnavailable(std::move(failure.message));
        }
        return Result<Unit, WardenFailure>::Err(std::move(failure));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<Unit, WardenFailure> LibSecretBackend::Write(
    const std::string_view account,
    std::span<const uint8_t> secret,
    const StoreOptions& options) {
    Attributes attributes(service_, account);
    attributes.SetPolicy(options.policy.Encode());
    attributes.SetSize(secret.size());
    const std::string label = options.label.value_or(
        compat::format("{}{}", StorageConstants::LABEL_PREFIX, account));

    static constexpr gchar EMPTY[] = "";
    const SecretValuePtr value(secret_value_new(
        secret.empty() ? EMPTY : reinterpret_cast<const gchar*>(secret.data()),
        static_cast<gssize>(secret.size()),
        CONTENT_TYPE));

    GError* raw = nullptr;
    const gboolean stored = secret_password_storev_binary_sync(WardenSchema(), attributes.Get(),
        SECRET_COLLECTION_DEFAULT, label.c_str(), value.get(), nullptr, &raw);
    if (!stored) {
        return Result<Unit, WardenFailure>::Err(FromLibSecretError(raw, "secret_password_store"));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, WardenFailure> LibSecretBackend::Read(const std::string_view account) {
    using R = Result<std::vector<uint8_t>, WardenFailure>;
    const Attributes attributes(service_, account);
    GError* raw = nullptr;
    const SecretValuePtr value(secret_password_lookupv_binary_sync(
        WardenSchema(), attributes.Get(), nullptr, &raw));
    if (raw != nullptr) {
        return R::Err(FromLibSecretError(raw, "secret_password_lookup"));
    }
    if (!value) {
        return R::Err(WardenFailure::NotFound(compat::format("No secret for '{}'", account)));
    }
    gsize length = 0;
    const auto* bytes = reinterpret_cast<const uint8_t*>(secret_value_get(value.get(), &length));
    return R::Ok(std::vector<uint8_t>(bytes, bytes + length));
}

Result<Unit, WardenFailure> LibSecretBackend::Delete(const std::string_view account) {
    const Attributes attributes(service_, account);
    GError* raw = nullptr;
    const gboolean removed = secret_password_clearv_sync(WardenSchema(), attributes.Get(), nullptr, &raw);
    if (raw != nullptr) {
        return Result<Unit, WardenFailure>::Err(FromLibSecretError(raw, "secret_password_clear"));
    }
    if (!removed) {
        return Result<Unit, WardenFailure>::Err(
            WardenFailure::NotFound(compat::format("No secret for '{}'", account)));
    }
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<std::vector<std::string>, WardenFailure> LibSecretBackend::ListAccounts() {
    using R = Result<std::vector<std::string>, WardenFailure>;
    const Attributes attributes(service_, std::nullopt);
    auto found = Search(attributes, SECRET_SEARCH_ALL);
    if (found.IsErr()) {
        return R::Err(std::move(found).UnwrapErr());
    }
    std::vector<std::string> accounts;
    for (GList* node = found.Unwrap().get(); node != nullptr; node = node->next) {
        if (auto account = LookupAttribute(SECRET_RETRIEVABLE(node->data), "account")) {
            accounts.push_back(std::move(*account));
        }
    }
    return R::Ok(std::move(accounts));
}

Result<StorageMetadata, WardenFailure> LibSecretBackend::ReadMetadata(const std::string_view account) {
    using R = Result<StorageMetadata, WardenFailure>;
    const Attributes attributes(service_, account);
    // Attributes and timestamps only; neither unlocks the collection nor loads the secret.
    auto found = Search(attributes, SECRET_SEARCH_NONE);
    if (found.IsErr()) {
        return R::Err(std::move(found).UnwrapErr());
    }
    GList* items = found.Unwrap().get();
    if (items == nullptr) {
        return R::Err(WardenFailure::NotFound(compat::format("No secret for '{}'", account)));
    }
    auto* item = SECRET_RETRIEVABLE(items->data);

    StorageMetadata metadata;
    metadata.created_ms = glib::SecondsToMs(secret_retrievable_get_created(item));
    metadata.modified_ms = glib::SecondsToMs(secret_retrievable_get_modified(item));
    if (const auto size = LookupAttribute(item, "size")) {
        metadata.size = glib::ParseSizeAttribute(*size);
    }
    if (const auto encoded = LookupAttribute(item, "policy")) {
        auto policy = security::AccessControlPolicy::Decode(*encoded);
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

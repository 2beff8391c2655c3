#include "warden/handles/resource_registry.hpp"
#include "warden/core/constants.hpp"
#include "warden/debug/log.hpp"
#include "warden/events/wallet_event_emitter.hpp"

#include "warden/core/format.hpp"

namespace warden::handles {

namespace {

    constexpr std::string_view LOG_COMPONENT = "registry";

    WardenFailure UnknownHandle(const std::string_view kind, const Handle handle) {
        return WardenFailure::InvalidHandle(
            compat::format("{}{} {}", ErrorMessages::UNKNOWN_HANDLE, kind, handle));
    }

    Result<Unit, WardenFailure> UnitOrUnknown(const bool removed, const std::string_view kind, const Handle handle) {
        if (!removed) {
            return Result<Unit, WardenFailure>::Err(UnknownHandle(kind, handle));
        }
        return Result<Unit, WardenFailure>::Ok(unit);
    }

} // anonymous namespace

ResourceRegistry::ResourceRegistry(events::EventBridge& bridge)
    : bridge_(bridge) {}

ResourceRegistry::~ResourceRegistry() {
    DestroyAll();
}

// ============================================================================
// Wallets
// ============================================================================

Result<Handle, WardenFailure> ResourceRegistry::AddWallet(std::shared_ptr<interfaces::IWalletEngine> engine) {
    if (!engine) {
        return Result<Handle, WardenFailure>::Err(
            WardenFailure::InvalidArgument("Wallet engine must not be null"));
    }
    const Handle handle = wallets_.Create(engine);
    engine->AttachEvents(std::make_shared<events::WalletEventEmitter>(bridge_, handle));
    WARDEN_LOG_INFO(LOG_COMPONENT, "Wallet '{}' registered as handle {}", engine->Name(), handle);
    return Result<Handle, WardenFailure>::Ok(handle);
}

Result<std::shared_ptr<interfaces::IWalletEngine>, WardenFailure> ResourceRegistry::GetWallet(const Handle handle) const {
    using R = Result<std::shared_ptr<interfaces::IWalletEngine>, WardenFailure>;
    auto engine = wallets_.Get(handle);
    if (!engine.has_value()) {
        return R::Err(UnknownHandle("wallet", handle));
    }
    return R::Ok(std::move(*engine));
}

Result<Unit, WardenFailure> ResourceRegistry::DestroyWallet(const Handle handle) {
    auto engine = wallets_.Destroy(handle);
    if (!engine.has_value()) {
        return Result<Unit, WardenFailure>::Err(UnknownHandle("wallet", handle));
    }
    (*engine)->Shutdown();
    bridge_.Unregister(handle);
    WARDEN_LOG_INFO(LOG_COMPONENT, "Wallet handle {} destroyed", handle);
    return Result<Unit, WardenFailure>::Ok(unit);
}

Result<events::CallbackId, WardenFailure> ResourceRegistry::RegisterWalletCallback(
    const Handle handle,
    events::EventCallback callback) {
    using R = Result<events::CallbackId, WardenFailure>;
    auto registered = wallets_.With(handle, [this, handle, &callback](const std::shared_ptr<interfaces::IWalletEngine>&) {
        return bridge_.Register(handle, std::move(callback));
    });
    if (!registered.has_value()) {
        return R::Err(UnknownHandle("wallet", handle));
    }
    return std::move(*registered);
}

// ============================================================================
// Keys
// ============================================================================

Result<Handle, WardenFailure> ResourceRegistry::GeneratePrivateKey() {
    return models::PrivateKey::Generate().Map([this](models::PrivateKey key) {
        return private_keys_.Create(std::move(key));
    });
}

Result<Handle, WardenFailure> ResourceRegistry::ImportPrivateKey(std::span<const uint8_t> scalar) {
    return models::PrivateKey::FromBytes(scalar).Map([this](models::PrivateKey key) {
        return private_keys_.Create(std::move(key));
    });
}

Result<Unit, WardenFailure> ResourceRegistry::DestroyPrivateKey(const Handle handle) {
    return UnitOrUnknown(private_keys_.Destroy(handle).has_value(), "private key", handle);
}

Result<Handle, WardenFailure> ResourceRegistry::DerivePublicKey(const Handle private_key) {
    auto derived = private_keys_.With(private_key, [](const models::PrivateKey& key) {
        return key.DerivePublicKey();
    });
    if (!derived.has_value()) {
        return Result<Handle, WardenFailure>::Err(UnknownHandle("private key", private_key));
    }
    return std::move(*derived).Map([this](models::PublicKey key) {
        return public_keys_.Create(std::move(key));
    });
}

Result<Handle, WardenFailure> ResourceRegistry::ImportPublicKey(std::span<const uint8_t> point) {
    return models::PublicKey::FromBytes(point).Map([this](models::PublicKey key) {
        return public_keys_.Create(std::move(key));
    });
}

Result<std::vector<uint8_t>, WardenFailure> ResourceRegistry::ExportPublicKey(const Handle handle) const {
    auto bytes = public_keys_.With(handle, [](const models::PublicKey& key) {
        return std::vector<uint8_t>(key.Bytes().begin(), key.Bytes().end());
    });
    if (!bytes.has_value()) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(UnknownHandle("public key", handle));
    }
    return Result<std::vector<uint8_t>, WardenFailure>::Ok(std::move(*bytes));
}

Result<Unit, WardenFailure> ResourceRegistry::DestroyPublicKey(const Handle handle) {
    return UnitOrUnknown(public_keys_.Destroy(handle).has_value(), "public key", handle);
}

// ============================================================================
// Scripts and covenants
// ============================================================================

HandleTable<models::CompiledScript>& ResourceRegistry::ScriptTable(const models::ScriptKind kind) noexcept {
    return kind == models::ScriptKind::Script ? scripts_ : covenants_;
}

const HandleTable<models::CompiledScript>& ResourceRegistry::ScriptTable(const models::ScriptKind kind) const noexcept {
    return kind == models::ScriptKind::Script ? scripts_ : covenants_;
}

Result<Handle, WardenFailure> ResourceRegistry::LoadScript(const models::ScriptKind kind, std::span<const uint8_t> image) {
    return models::CompiledScript::FromBytes(kind, image).Map([this, kind](models::CompiledScript script) {
        return ScriptTable(kind).Create(std::move(script));
    });
}

Result<size_t, WardenFailure> ResourceRegistry::ScriptSize(const models::ScriptKind kind, const Handle handle) const {
    auto size = ScriptTable(kind).With(handle, [](const models::CompiledScript& script) {
        return script.Size();
    });
    if (!size.has_value()) {
        return Result<size_t, WardenFailure>::Err(UnknownHandle(models::CompiledScript::KindName(kind), handle));
    }
    return Result<size_t, WardenFailure>::Ok(*size);
}

Result<std::vector<uint8_t>, WardenFailure> ResourceRegistry::ScriptImage(const models::ScriptKind kind, const Handle handle) const {
    auto image = ScriptTable(kind).With(handle, [](const models::CompiledScript& script) {
        return std::vector<uint8_t>(script.Image().begin(), script.Image().end());
    });
    if (!image.has_value()) {
        return Result<std::vector<uint8_t>, WardenFailure>::Err(
            UnknownHandle(models::CompiledScript::KindName(kind), handle));
    }
    return Result<std::vector<uint8_t>, WardenFailure>::Ok(std::move(*image));
}

Result<Unit, WardenFailure> ResourceRegistry::DestroyScript(const models::ScriptKind kind, const Handle handle) {
    return UnitOrUnknown(ScriptTable(kind).Destroy(handle).has_value(),
        models::CompiledScript::KindName(kind), handle);
}

// ============================================================================
// Bulk
// ============================================================================

RegistryCounts ResourceRegistry::Counts() const {
    return RegistryCounts{
        .wallets = wallets_.Count(),
        .private_keys = private_keys_.Count(),
        .public_keys = public_keys_.Count(),
        .scripts = scripts_.Count(),
        .covenants = covenants_.Count(),
    };
}

void ResourceRegistry::DestroyAll() {
    for (auto& [handle, engine] : wallets_.Drain()) {
        engine->Shutdown();
        bridge_.Unregister(handle);
    }
    private_keys_.Drain();
    public_keys_.Drain();
    scripts_.Drain();
    covenants_.Drain();
}

} // namespace warden::handles

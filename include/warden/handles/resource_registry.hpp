#pragma once

#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/events/event_bridge.hpp"
#include "warden/handles/handle_table.hpp"
#include "warden/interfaces/i_wallet_engine.hpp"
#include "warden/models/compiled_script.hpp"
#include "warden/models/private_key.hpp"
#include "warden/models/public_key.hpp"

#include <memory>
#include <span>
#include <vector>

namespace warden::handles {

struct RegistryCounts {
    size_t wallets = 0;
    size_t private_keys = 0;
    size_t public_keys = 0;
    size_t scripts = 0;
    size_t covenants = 0;
};

/**
 * @brief Owner of every resource the host can address, one HandleTable per kind
 *
 * Lookups on unknown handles fail with InvalidHandle. Each kind has its own
 * counter and lock, so a handle number is only meaningful together with its
 * kind. Event callbacks attach to wallets only; destroying a wallet shuts its
 * engine down and then releases the wallet's event callback.
 */
class ResourceRegistry {
public:
    explicit ResourceRegistry(events::EventBridge& bridge);
    ~ResourceRegistry();

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // ========================================================================
    // Wallets
    // ========================================================================

    Result<Handle, WardenFailure> AddWallet(std::shared_ptr<interfaces::IWalletEngine> engine);
    Result<std::shared_ptr<interfaces::IWalletEngine>, WardenFailure> GetWallet(Handle handle) const;
    Result<Unit, WardenFailure> DestroyWallet(Handle handle);

    /**
     * @brief Register the host callback for a live wallet
     *
     * Fails with InvalidHandle for unknown or destroyed wallets. The
     * registration happens under the wallet table lock, so a concurrent
     * DestroyWallet either rejects it or releases it.
     */
    Result<events::CallbackId, WardenFailure> RegisterWalletCallback(Handle handle, events::EventCallback callback);

    // ========================================================================
    // Keys
    // ========================================================================

    Result<Handle, WardenFailure> GeneratePrivateKey();
    Result<Handle, WardenFailure> ImportPrivateKey(std::span<const uint8_t> scalar);
    Result<Unit, WardenFailure> DestroyPrivateKey(Handle handle);

    /// Derives the public key of @p private_key and stores it as a new public-key handle.
    Result<Handle, WardenFailure> DerivePublicKey(Handle private_key);
    Result<Handle, WardenFailure> ImportPublicKey(std::span<const uint8_t> point);
    Result<std::vector<uint8_t>, WardenFailure> ExportPublicKey(Handle handle) const;
    Result<Unit, WardenFailure> DestroyPublicKey(Handle handle);

    // ========================================================================
    // Scripts and covenants
    // ========================================================================

    Result<Handle, WardenFailure> LoadScript(models::ScriptKind kind, std::span<const uint8_t> image);
    Result<size_t, WardenFailure> ScriptSize(models::ScriptKind kind, Handle handle) const;
    Result<std::vector<uint8_t>, WardenFailure> ScriptImage(models::ScriptKind kind, Handle handle) const;
    Result<Unit, WardenFailure> DestroyScript(models::ScriptKind kind, Handle handle);

    [[nodiscard]] RegistryCounts Counts() const;

    /// Tears down every remaining resource; wallets are shut down first.
    void DestroyAll();

private:
    HandleTable<models::CompiledScript>& ScriptTable(models::ScriptKind kind) noexcept;
    const HandleTable<models::CompiledScript>& ScriptTable(models::ScriptKind kind) const noexcept;

    events::EventBridge& bridge_;
    HandleTable<std::shared_ptr<interfaces::IWalletEngine>> wallets_;
    HandleTable<models::PrivateKey> private_keys_;
    HandleTable<models::PublicKey> public_keys_;
    HandleTable<models::CompiledScript> scripts_;
    HandleTable<models::CompiledScript> covenants_;
};

} // namespace warden::handles

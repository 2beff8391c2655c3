#pragma once

#include "warden/core/failures.hpp"
#include "warden/core/result.hpp"
#include "warden/events/event_bridge.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace warden::events {

struct TransactionReceived {
    uint64_t tx_id = 0;
    uint64_t amount = 0;
    std::string source_address;
    std::string message;
};

struct TransactionBroadcast {
    uint64_t tx_id = 0;
    uint64_t amount = 0;
    std::string destination;
};

struct TransactionMined {
    uint64_t tx_id = 0;
    uint64_t block_height = 0;
    std::string block_hash;
    uint32_t confirmations = 0;
};

struct TransactionCancelled {
    uint64_t tx_id = 0;
    std::string reason;
};

using TransactionEvent = std::variant<TransactionReceived, TransactionBroadcast, TransactionMined, TransactionCancelled>;

struct BalanceEvent {
    uint64_t available = 0;
    uint64_t pending_incoming = 0;
    uint64_t pending_outgoing = 0;
    uint64_t total = 0;
};

struct NodeConnected {
    std::string base_node_address;
    uint32_t peer_count = 0;
};

struct NodeDisconnected {
    std::string reason;
};

struct NodeSyncing {
    uint64_t current_block = 0;
    uint64_t target_block = 0;
};

using ConnectivityEvent = std::variant<NodeConnected, NodeDisconnected, NodeSyncing>;

struct SyncProgressEvent {
    uint64_t current = 0;
    uint64_t total = 0;
};

/**
 * @brief Turns typed wallet-engine notifications into bridge events for one wallet handle
 *
 * Bodies are serialized warden.proto.events messages. Lifecycle, error and
 * sync-failure notifications take the direct path; everything else is queued.
 */
class WalletEventEmitter {
public:
    WalletEventEmitter(EventBridge& bridge, Handle wallet_handle);

    Result<Unit, WardenFailure> OnTransaction(const TransactionEvent& event);
    Result<Unit, WardenFailure> OnBalance(const BalanceEvent& event);
    Result<Unit, WardenFailure> OnConnectivity(const ConnectivityEvent& event);
    Result<Unit, WardenFailure> OnSyncProgress(const SyncProgressEvent& event);
    Result<Unit, WardenFailure> OnSyncCompleted(uint64_t duration_ms);
    Result<Unit, WardenFailure> OnSyncFailed(std::string_view error);
    Result<Unit, WardenFailure> OnBaseNodeConnected(std::string_view address);
    Result<Unit, WardenFailure> OnBaseNodeDisconnected(std::string_view address);
    Result<Unit, WardenFailure> OnWalletStarted();
    Result<Unit, WardenFailure> OnWalletStopped();
    Result<Unit, WardenFailure> OnError(std::string_view error, const std::map<std::string, std::string>& context = {});

    [[nodiscard]] Handle WalletHandle() const noexcept { return wallet_handle_; }

    /// Whole percent of @p current over @p total, clamped to 100; 0 when total is 0.
    [[nodiscard]] static uint32_t SyncPercent(uint64_t current, uint64_t total) noexcept;

private:
    EventBridge& bridge_;
    Handle wallet_handle_;
};

} // namespace warden::events

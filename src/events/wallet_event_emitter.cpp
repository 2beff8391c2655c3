#include "warden/events/wallet_event_emitter.hpp"
#include "warden/core/constants.hpp"
#include "events/wallet_events.pb.h"

#include <chrono>
#include <vector>

namespace warden::events {

namespace proto = warden::proto::events;

namespace {

    template<typename... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template<typename... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    std::vector<uint8_t> Serialize(const google::protobuf::MessageLite& message) {
        const std::string bytes = message.SerializeAsString();
        return {bytes.begin(), bytes.end()};
    }

    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

} // anonymous namespace

WalletEventEmitter::WalletEventEmitter(EventBridge& bridge, const Handle wallet_handle)
    : bridge_(bridge)
    , wallet_handle_(wallet_handle) {}

// ============================================================================
// Queued events
// ============================================================================

Result<Unit, WardenFailure> WalletEventEmitter::OnTransaction(const TransactionEvent& event) {
    return std::visit(Overloaded{
        [this](const TransactionReceived& tx) {
            proto::TransactionReceived body;
            body.set_tx_id(tx.tx_id);
            body.set_amount(tx.amount);
            body.set_source_address(tx.source_address);
            body.set_message(tx.message);
            body.set_status("pending");
            body.set_is_inbound(true);
            body.set_confirmations(0);
            return bridge_.Emit(wallet_handle_, EventConstants::TX_RECEIVED, Serialize(body));
        },
        [this](const TransactionBroadcast& tx) {
            proto::TransactionBroadcast body;
            body.set_tx_id(tx.tx_id);
            body.set_amount(tx.amount);
            body.set_destination(tx.destination);
            body.set_status("broadcast");
            body.set_is_inbound(false);
            body.set_confirmations(0);
            return bridge_.Emit(wallet_handle_, EventConstants::TX_BROADCAST, Serialize(body));
        },
        [this](const TransactionMined& tx) {
            proto::TransactionMined body;
            body.set_tx_id(tx.tx_id);
            body.set_block_height(tx.block_height);
            body.set_block_hash(tx.block_hash);
            body.set_confirmations(tx.confirmations);
            body.set_status("mined_confirmed");
            return bridge_.Emit(wallet_handle_, EventConstants::TX_MINED, Serialize(body));
        },
        [this](const TransactionCancelled& tx) {
            proto::TransactionCancelled body;
            body.set_tx_id(tx.tx_id);
            body.set_reason(tx.reason);
            body.set_status("cancelled");
            body.set_cancelled_at_ms(NowMs());
            return bridge_.Emit(wallet_handle_, EventConstants::TX_CANCELLED, Serialize(body));
        }
    }, event);
}

Result<Unit, WardenFailure> WalletEventEmitter::OnBalance(const BalanceEvent& event) {
    proto::BalanceUpdated body;
    body.set_available(event.available);
    body.set_pending_incoming(event.pending_incoming);
    body.set_pending_outgoing(event.pending_outgoing);
    body.set_total(event.total);
    return bridge_.Emit(wallet_handle_, EventConstants::BALANCE_UPDATED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnConnectivity(const ConnectivityEvent& event) {
    proto::ConnectivityChanged body;
    std::visit(Overloaded{
        [&body](const NodeConnected& connected) {
            body.set_status(proto::ConnectivityChanged::STATUS_ONLINE);
            body.set_base_node_address(connected.base_node_address);
            body.set_peer_count(connected.peer_count);
        },
        [&body](const NodeDisconnected& disconnected) {
            body.set_status(proto::ConnectivityChanged::STATUS_OFFLINE);
            body.set_reason(disconnected.reason);
        },
        [&body](const NodeSyncing& syncing) {
            body.set_status(proto::ConnectivityChanged::STATUS_SYNCING);
            body.set_current_block(syncing.current_block);
            body.set_target_block(syncing.target_block);
        }
    }, event);
    return bridge_.Emit(wallet_handle_, EventConstants::CONNECTIVITY_CHANGED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnSyncProgress(const SyncProgressEvent& event) {
    proto::SyncProgress body;
    body.set_current(event.current);
    body.set_total(event.total);
    body.set_percent(SyncPercent(event.current, event.total));
    if (event.current > 0 && event.total > event.current) {
        body.set_estimated_blocks_remaining(event.total - event.current);
    }
    return bridge_.Emit(wallet_handle_, EventConstants::SYNC_PROGRESS, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnSyncCompleted(const uint64_t duration_ms) {
    proto::SyncCompleted body;
    body.set_duration_ms(duration_ms);
    return bridge_.Emit(wallet_handle_, EventConstants::SYNC_COMPLETED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnBaseNodeConnected(const std::string_view address) {
    proto::BaseNodeStatus body;
    body.set_address(std::string(address));
    return bridge_.Emit(wallet_handle_, EventConstants::BASE_NODE_CONNECTED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnBaseNodeDisconnected(const std::string_view address) {
    proto::BaseNodeStatus body;
    body.set_address(std::string(address));
    return bridge_.Emit(wallet_handle_, EventConstants::BASE_NODE_DISCONNECTED, Serialize(body));
}

// ============================================================================
// Direct events
// ============================================================================

Result<Unit, WardenFailure> WalletEventEmitter::OnSyncFailed(const std::string_view error) {
    proto::SyncFailed body;
    body.set_error(std::string(error));
    return bridge_.EmitDirect(wallet_handle_, EventConstants::SYNC_FAILED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnWalletStarted() {
    proto::WalletLifecycle body;
    body.set_state(proto::WalletLifecycle::STATE_STARTED);
    return bridge_.EmitDirect(wallet_handle_, EventConstants::WALLET_STARTED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnWalletStopped() {
    proto::WalletLifecycle body;
    body.set_state(proto::WalletLifecycle::STATE_STOPPED);
    return bridge_.EmitDirect(wallet_handle_, EventConstants::WALLET_STOPPED, Serialize(body));
}

Result<Unit, WardenFailure> WalletEventEmitter::OnError(
    const std::string_view error,
    const std::map<std::string, std::string>& context) {
    proto::WalletError body;
    body.set_error(std::string(error));
    for (const auto& [key, value] : context) {
        (*body.mutable_context())[key] = value;
    }
    return bridge_.EmitDirect(wallet_handle_, EventConstants::WALLET_ERROR, Serialize(body));
}

uint32_t WalletEventEmitter::SyncPercent(const uint64_t current, const uint64_t total) noexcept {
    if (total == 0) {
        return 0;
    }
    if (current >= total) {
        return 100;
    }
    return static_cast<uint32_t>((static_cast<long double>(current) * 100.0L) / static_cast<long double>(total));
}

} // namespace warden::events

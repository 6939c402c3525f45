#include "TransferTypes.h"
#include "Config.h"
#include "Constants.h"

namespace PeerBeam {

Result<TransferOptions> TransferOptions::fromConfig(const Config& config) {
    TransferOptions options;

    int intervalMs = config.getInt("progress_interval_ms", config::DEFAULT_PROGRESS_INTERVAL_MS);
    if (intervalMs <= 0) {
        return Error{ErrorCode::ConfigError, "progress_interval_ms must be positive"};
    }
    options.progressInterval = std::chrono::milliseconds(intervalMs);

    int timeoutSec = config.getInt("peer_key_timeout_sec", config::DEFAULT_PEER_KEY_TIMEOUT_SEC);
    if (timeoutSec < 0) {
        return Error{ErrorCode::ConfigError, "peer_key_timeout_sec must not be negative"};
    }
    options.peerKeyTimeout = std::chrono::seconds(timeoutSec);

    return options;
}

const char* toString(SenderState state) {
    switch (state) {
        case SenderState::INIT: return "INIT";
        case SenderState::KEY_READY: return "KEY_READY";
        case SenderState::HASHING: return "HASHING";
        case SenderState::META_SENT: return "META_SENT";
        case SenderState::AWAITING_PEER_KEY: return "AWAITING_PEER_KEY";
        case SenderState::KEY_DERIVED: return "KEY_DERIVED";
        case SenderState::STREAMING: return "STREAMING";
        case SenderState::DONE: return "DONE";
        case SenderState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

const char* toString(ReceiverState state) {
    switch (state) {
        case ReceiverState::INIT: return "INIT";
        case ReceiverState::KEY_READY: return "KEY_READY";
        case ReceiverState::AWAITING_META: return "AWAITING_META";
        case ReceiverState::META_RECEIVED: return "META_RECEIVED";
        case ReceiverState::KEY_DERIVED: return "KEY_DERIVED";
        case ReceiverState::RECEIVING: return "RECEIVING";
        case ReceiverState::AWAITING_BODY: return "AWAITING_BODY";
        case ReceiverState::VERIFYING: return "VERIFYING";
        case ReceiverState::COMPLETE: return "COMPLETE";
        case ReceiverState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace PeerBeam

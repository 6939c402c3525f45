#pragma once

#include "ChunkCodec.h"
#include "Crypto.h"
#include "EventBus.h"
#include "ITransport.h"
#include "Logger.h"
#include "Result.h"
#include "ThroughputMeter.h"
#include "TransferTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PeerBeam {

/**
 * @brief Initiator side of a transfer session
 *
 * INIT -> KEY_READY -> HASHING -> META_SENT -> AWAITING_PEER_KEY
 *      -> KEY_DERIVED -> STREAMING -> DONE, with FAILED reachable from any
 * non-terminal state.
 *
 * The sender installs itself as the transport's frame and close handler for
 * its lifetime; the transport must outlive it. Everything runs on the thread
 * that drives the transport.
 */
class TransferSender {
public:
    TransferSender(ITransport& transport,
                   TransferOptions options = {},
                   EventBus* eventBus = nullptr,
                   ThroughputMeter::ClockFn clock = nullptr);
    ~TransferSender();

    TransferSender(const TransferSender&) = delete;
    TransferSender& operator=(const TransferSender&) = delete;

    /**
     * @brief Read @p path, announce it and wait for the receiver's key
     * @return FileNotFound / FileReadError / CryptoUnavailable / SendFailed /
     *         ChannelClosed; the session is FAILED in every error case except
     *         InvalidState (start called twice)
     */
    Result<void> start(const std::string& path);

    /// Same, for content already in memory
    Result<void> start(const std::string& name, std::vector<uint8_t> content);

    void handleFrame(const Frame& frame);
    void handleClose(const std::string& reason);

    /**
     * @brief Fail with PeerKeyTimeout if the receiver's key is overdue
     * @return true if this call failed the session
     */
    bool checkTimeout(ThroughputMeter::Clock::time_point now);
    bool checkTimeout();

    SenderState state() const { return state_; }
    bool isFinished() const { return state_ == SenderState::DONE || state_ == SenderState::FAILED; }
    const std::optional<Error>& lastError() const { return lastError_; }

    /// Empty until the receiver's key arrived
    const std::string& fingerprint() const { return fingerprint_; }
    const FileMetadata& metadata() const { return meta_; }
    uint64_t bytesSent() const { return bytesSent_; }
    size_t chunksSent() const { return chunksSent_; }

private:
    void onExchangeKey(const PublicJwk& peerKey);
    void stream();

    void setState(SenderState state);
    void setStatus(const std::string& status);
    void publishProgress(const ProgressUpdate& update);
    void fail(Error error);

    ITransport& transport_;
    TransferOptions options_;
    EventBus* eventBus_;
    ThroughputMeter::ClockFn clock_;
    Logger& logger_{Logger::instance()};

    SenderState state_{SenderState::INIT};
    KeyPair keyPair_;
    PublicJwk ownPublicKey_;
    std::optional<SharedKey> sharedKey_;
    std::vector<uint8_t> content_;
    FileMetadata meta_;
    ThroughputMeter::Clock::time_point awaitingSince_{};

    uint64_t bytesSent_{0};
    size_t chunksSent_{0};
    std::string fingerprint_;
    std::optional<Error> lastError_;
};

} // namespace PeerBeam

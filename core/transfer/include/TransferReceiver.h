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
 * @brief Responder side of a transfer session
 *
 * INIT -> KEY_READY -> AWAITING_META -> META_RECEIVED -> KEY_DERIVED
 *      -> RECEIVING (<-> AWAITING_BODY) -> VERIFYING -> COMPLETE,
 * with FAILED absorbing.
 *
 * Purely reactive: after start() every transition is driven by an inbound
 * frame. Frames that cannot corrupt reassembly are logged and dropped; frames
 * that break header/body pairing fail the session. Progress is published
 * after every chunk.
 */
class TransferReceiver {
public:
    explicit TransferReceiver(ITransport& transport,
                              EventBus* eventBus = nullptr,
                              ThroughputMeter::ClockFn clock = nullptr);
    ~TransferReceiver();

    TransferReceiver(const TransferReceiver&) = delete;
    TransferReceiver& operator=(const TransferReceiver&) = delete;

    /// Generate the key pair and wait for `meta`
    Result<void> start();

    void handleFrame(const Frame& frame);
    void handleClose(const std::string& reason);

    ReceiverState state() const { return state_; }
    bool isFinished() const { return state_ == ReceiverState::COMPLETE || state_ == ReceiverState::FAILED; }
    const std::optional<Error>& lastError() const { return lastError_; }
    const std::string& fingerprint() const { return fingerprint_; }

    /// Set once `meta` was accepted
    const std::optional<FileMetadata>& metadata() const { return metadata_; }
    uint64_t bytesReceived() const { return bytesReceived_; }
    size_t chunksReceived() const { return chunksReceived_; }

    /// The verified file, or nullptr unless COMPLETE
    const std::vector<uint8_t>* output() const;

    /**
     * @brief Write the verified file to directory/<sanitized meta.name>
     * @return The written path; InvalidState unless COMPLETE, FileWriteError on I/O failure
     */
    Result<std::string> saveTo(const std::string& directory) const;

private:
    void onMeta(const FileMetadata& meta);
    void onChunkHeader(const ChunkHeader& header);
    void onBody(const std::vector<uint8_t>& ciphertext);
    void onEnd();

    void setState(ReceiverState state);
    void setStatus(const std::string& status);
    void publishProgress(const ProgressUpdate& update);
    void fail(Error error);

    ITransport& transport_;
    EventBus* eventBus_;
    ThroughputMeter::ClockFn clock_;
    Logger& logger_{Logger::instance()};

    ReceiverState state_{ReceiverState::INIT};
    KeyPair keyPair_;
    PublicJwk ownPublicKey_;
    std::optional<SharedKey> sharedKey_;
    std::optional<FileMetadata> metadata_;
    std::optional<ChunkHeader> pendingHeader_;
    std::optional<ThroughputMeter> meter_;
    std::vector<uint8_t> assembled_;

    uint64_t bytesReceived_{0};
    size_t chunksReceived_{0};
    std::string fingerprint_;
    std::optional<Error> lastError_;
};

} // namespace PeerBeam

#include "TransferReceiver.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include "TransferEvents.h"

#include <openssl/crypto.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace PeerBeam {

namespace {

constexpr const char* kComponent = "TransferReceiver";

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string formatMegabytes(uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / 1024.0 / 1024.0);
    return buf;
}

} // namespace

TransferReceiver::TransferReceiver(ITransport& transport, EventBus* eventBus, ThroughputMeter::ClockFn clock)
    : transport_(transport)
    , eventBus_(eventBus)
    , clock_(std::move(clock)) {
    transport_.setFrameHandler([this](const Frame& frame) { handleFrame(frame); });
    transport_.setCloseHandler([this](const std::string& reason) { handleClose(reason); });
}

TransferReceiver::~TransferReceiver() {
    transport_.setFrameHandler(nullptr);
    transport_.setCloseHandler(nullptr);
    if (!assembled_.empty()) {
        OPENSSL_cleanse(assembled_.data(), assembled_.size());
    }
}

Result<void> TransferReceiver::start() {
    if (state_ != ReceiverState::INIT) {
        return Err(ErrorCode::InvalidState, "Receiver already started");
    }
    if (!transport_.isOpen()) {
        fail(Error{ErrorCode::ChannelClosed, "Transport is not open"});
        return *lastError_;
    }

    try {
        keyPair_ = Crypto::generateKeyPair();
        ownPublicKey_ = Crypto::exportPublicKey(keyPair_);
    } catch (const CryptoError& e) {
        fail(Error{ErrorCode::CryptoUnavailable, e.what()});
        return *lastError_;
    }
    setState(ReceiverState::KEY_READY);

    setState(ReceiverState::AWAITING_META);
    setStatus("Waiting for metadata...");
    return Ok();
}

void TransferReceiver::handleFrame(const Frame& frame) {
    if (isFinished()) {
        return;
    }
    if (state_ == ReceiverState::INIT || state_ == ReceiverState::KEY_READY) {
        LOG_WARN_COMP("Dropping frame received before start()", kComponent);
        return;
    }

    if (frame.type == FrameType::Binary) {
        if (state_ != ReceiverState::AWAITING_BODY) {
            LOG_WARN_COMP("Dropping binary frame of " + std::to_string(frame.data.size()) +
                          " bytes with no pending chunk header", kComponent);
            return;
        }
        onBody(frame.data);
        return;
    }

    auto decoded = ChunkCodec::decode(frame.text);
    if (!decoded) {
        const DecodeError& err = decoded.error();
        if (err.code == ErrorCode::MalformedKey && err.type == "meta" &&
            state_ == ReceiverState::AWAITING_META) {
            fail(err.toError());
            return;
        }
        LOG_WARN_COMP("Dropping text frame: " + err.message, kComponent);
        return;
    }

    const WireMessage& message = decoded.value();
    if (const auto* meta = std::get_if<FileMetadata>(&message)) {
        if (state_ != ReceiverState::AWAITING_META) {
            LOG_WARN_COMP("Ignoring duplicate meta in state " + std::string(toString(state_)), kComponent);
            return;
        }
        onMeta(*meta);
    } else if (const auto* header = std::get_if<ChunkHeader>(&message)) {
        if (state_ == ReceiverState::AWAITING_BODY) {
            fail(Error{ErrorCode::UnexpectedFrame, "Second chunk header before the pending body"});
            return;
        }
        if (state_ != ReceiverState::RECEIVING) {
            LOG_WARN_COMP("Ignoring chunk header in state " + std::string(toString(state_)), kComponent);
            return;
        }
        onChunkHeader(*header);
    } else if (std::holds_alternative<EndMessage>(message)) {
        if (state_ == ReceiverState::AWAITING_BODY) {
            fail(Error{ErrorCode::UnexpectedFrame, "End of stream while a chunk body is pending"});
            return;
        }
        if (state_ != ReceiverState::RECEIVING) {
            LOG_WARN_COMP("Ignoring end in state " + std::string(toString(state_)), kComponent);
            return;
        }
        onEnd();
    } else {
        LOG_WARN_COMP(std::string("Ignoring '") + ChunkCodec::typeName(message) + "' on the receiving side", kComponent);
    }
}

void TransferReceiver::handleClose(const std::string& reason) {
    if (isFinished()) {
        return;
    }
    fail(Error{ErrorCode::ChannelClosed, "Channel closed during " + std::string(toString(state_)) + ": " + reason});
}

void TransferReceiver::onMeta(const FileMetadata& meta) {
    metadata_ = meta;
    setState(ReceiverState::META_RECEIVED);

    try {
        PublicKeyHandle sender = Crypto::importPublicKey(meta.senderPublicKey);
        sharedKey_ = Crypto::deriveSharedKey(keyPair_, sender);
        fingerprint_ = Crypto::sessionFingerprint(ownPublicKey_, meta.senderPublicKey);
    } catch (const MalformedKeyError& e) {
        fail(Error{ErrorCode::MalformedKey, e.what()});
        return;
    } catch (const CryptoError& e) {
        fail(Error{ErrorCode::CryptoUnavailable, e.what()});
        return;
    }
    keyPair_.pkey.reset();

    if (!transport_.sendText(ChunkCodec::encodeExchangeKey(ownPublicKey_))) {
        fail(Error{ErrorCode::SendFailed, "Failed to send exchange key"});
        return;
    }
    setState(ReceiverState::KEY_DERIVED);

    logger_.log(LogLevel::INFO, "Receiving " + meta.name + " (" + std::to_string(meta.size) +
                " bytes), session fingerprint " + fingerprint_, kComponent);
    if (eventBus_) {
        eventBus_->publish(events::FINGERPRINT, fingerprint_);
    }

    meter_.emplace(meta.size, std::chrono::milliseconds(0), clock_);
    meter_->start();

    setState(ReceiverState::RECEIVING);
    setStatus("Receiving: " + meta.name + " (" + formatMegabytes(meta.size) + ")");
}

void TransferReceiver::onChunkHeader(const ChunkHeader& header) {
    if (header.cipherLength < config::GCM_TAG_SIZE ||
        header.cipherLength > config::CHUNK_SIZE + config::GCM_TAG_SIZE) {
        fail(Error{ErrorCode::UnexpectedFrame,
                   "Chunk length " + std::to_string(header.cipherLength) + " is out of range"});
        return;
    }
    pendingHeader_ = header;
    setState(ReceiverState::AWAITING_BODY);
}

void TransferReceiver::onBody(const std::vector<uint8_t>& ciphertext) {
    ChunkHeader header = *pendingHeader_;
    pendingHeader_.reset();

    if (ciphertext.size() != header.cipherLength) {
        fail(Error{ErrorCode::UnexpectedFrame,
                   "Chunk body is " + std::to_string(ciphertext.size()) + " bytes, header announced " +
                   std::to_string(header.cipherLength)});
        return;
    }

    std::vector<uint8_t> plaintext;
    try {
        plaintext = Crypto::decrypt(*sharedKey_, header.iv, ciphertext);
    } catch (const AuthenticationError& e) {
        fail(Error{ErrorCode::AuthenticationFailed, std::string("chunk ") + std::to_string(chunksReceived_) + ": " + e.what()});
        return;
    } catch (const CryptoError& e) {
        fail(Error{ErrorCode::CryptoUnavailable, e.what()});
        return;
    }

    if (bytesReceived_ + plaintext.size() > metadata_->size) {
        fail(Error{ErrorCode::IntegrityMismatch, "Received more data than the announced " +
                   std::to_string(metadata_->size) + " bytes"});
        return;
    }

    assembled_.insert(assembled_.end(), plaintext.begin(), plaintext.end());
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    bytesReceived_ += plaintext.size();
    ++chunksReceived_;
    LOG_DEBUG_COMP_IF("Chunk " + std::to_string(chunksReceived_) + " received (" +
                      std::to_string(bytesReceived_) + "/" + std::to_string(metadata_->size) + ")", kComponent);

    if (auto update = meter_->record(bytesReceived_)) {
        publishProgress(*update);
    }
    setState(ReceiverState::RECEIVING);
}

void TransferReceiver::onEnd() {
    setState(ReceiverState::VERIFYING);

    if (bytesReceived_ != metadata_->size) {
        fail(Error{ErrorCode::IntegrityMismatch, "Received " + std::to_string(bytesReceived_) +
                   " of " + std::to_string(metadata_->size) + " bytes"});
        return;
    }

    std::string actual;
    try {
        SCOPED_TIMER_COMP("Verifying " + std::to_string(assembled_.size()) + " bytes", kComponent);
        actual = Crypto::digest(assembled_);
    } catch (const CryptoError& e) {
        fail(Error{ErrorCode::CryptoUnavailable, e.what()});
        return;
    }

    if (!equalsIgnoreCase(actual, metadata_->hash)) {
        fail(Error{ErrorCode::IntegrityMismatch, "Content hash " + actual + " does not match " + metadata_->hash});
        return;
    }

    sharedKey_.reset();
    publishProgress(meter_->finish());
    setState(ReceiverState::COMPLETE);
    setStatus("Completed. Integrity OK (encrypted)");
    logger_.log(LogLevel::INFO, "Received " + metadata_->name + " intact in " +
                std::to_string(chunksReceived_) + " chunks", kComponent);
    if (eventBus_) {
        eventBus_->publish(events::COMPLETE, TransferSummary{metadata_->name, metadata_->size, actual});
    }
}

const std::vector<uint8_t>* TransferReceiver::output() const {
    return state_ == ReceiverState::COMPLETE ? &assembled_ : nullptr;
}

Result<std::string> TransferReceiver::saveTo(const std::string& directory) const {
    if (state_ != ReceiverState::COMPLETE) {
        return Err<std::string>(ErrorCode::InvalidState, "Transfer is not complete");
    }

    std::filesystem::path target = std::filesystem::path(directory) / PathUtils::sanitizeFileName(metadata_->name);
    try {
        PathUtils::ensureDirectory(directory);
    } catch (const std::runtime_error& e) {
        logger_.log(LogLevel::ERROR, e.what(), kComponent);
        return Err<std::string>(ErrorCode::FileWriteError, e.what());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        logger_.log(LogLevel::ERROR, "Cannot open " + target.string() + " for writing", kComponent);
        return Err<std::string>(ErrorCode::FileWriteError, "Cannot open " + target.string());
    }
    out.write(reinterpret_cast<const char*>(assembled_.data()), static_cast<std::streamsize>(assembled_.size()));
    out.close();
    if (!out) {
        logger_.log(LogLevel::ERROR, "Failed writing " + target.string(), kComponent);
        return Err<std::string>(ErrorCode::FileWriteError, "Failed writing " + target.string());
    }

    logger_.log(LogLevel::INFO, "Saved " + target.string(), kComponent);
    return target.string();
}

void TransferReceiver::setState(ReceiverState state) {
    LOG_DEBUG_COMP_IF(std::string(toString(state_)) + " -> " + toString(state), kComponent);
    state_ = state;
    if (eventBus_) {
        eventBus_->publish(events::STATE, state);
    }
}

void TransferReceiver::setStatus(const std::string& status) {
    if (eventBus_) {
        eventBus_->publish(events::STATUS, status);
    }
}

void TransferReceiver::publishProgress(const ProgressUpdate& update) {
    if (eventBus_) {
        eventBus_->publish(events::PROGRESS, update);
    }
}

void TransferReceiver::fail(Error error) {
    if (isFinished()) {
        return;
    }
    logger_.log(LogLevel::ERROR, "Transfer failed in " + std::string(toString(state_)) + ": " + error.toString(), kComponent);

    if (!assembled_.empty()) {
        OPENSSL_cleanse(assembled_.data(), assembled_.size());
    }
    assembled_.clear();
    assembled_.shrink_to_fit();
    pendingHeader_.reset();
    sharedKey_.reset();
    keyPair_.pkey.reset();

    lastError_ = error;
    setState(ReceiverState::FAILED);
    setStatus(error.toString());
    if (eventBus_) {
        eventBus_->publish(events::FAILED, error);
    }
}

} // namespace PeerBeam

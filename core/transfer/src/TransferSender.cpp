#include "TransferSender.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "TransferEvents.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace PeerBeam {

namespace {
constexpr const char* kComponent = "TransferSender";
}

TransferSender::TransferSender(ITransport& transport,
                               TransferOptions options,
                               EventBus* eventBus,
                               ThroughputMeter::ClockFn clock)
    : transport_(transport)
    , options_(options)
    , eventBus_(eventBus)
    , clock_(clock ? std::move(clock) : ThroughputMeter::ClockFn([] { return ThroughputMeter::Clock::now(); })) {
    transport_.setFrameHandler([this](const Frame& frame) { handleFrame(frame); });
    transport_.setCloseHandler([this](const std::string& reason) { handleClose(reason); });
}

TransferSender::~TransferSender() {
    transport_.setFrameHandler(nullptr);
    transport_.setCloseHandler(nullptr);
}

Result<void> TransferSender::start(const std::string& path) {
    if (state_ != SenderState::INIT) {
        return Err(ErrorCode::InvalidState, "Sender already started");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        fail(Error{ErrorCode::FileNotFound, "No such file: " + path});
        return *lastError_;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        fail(Error{ErrorCode::FileReadError, "Cannot open " + path});
        return *lastError_;
    }
    std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        fail(Error{ErrorCode::FileReadError, "Failed reading " + path});
        return *lastError_;
    }

    return start(std::filesystem::path(path).filename().string(), std::move(content));
}

Result<void> TransferSender::start(const std::string& name, std::vector<uint8_t> content) {
    if (state_ != SenderState::INIT) {
        return Err(ErrorCode::InvalidState, "Sender already started");
    }
    if (!transport_.isOpen()) {
        fail(Error{ErrorCode::ChannelClosed, "Transport is not open"});
        return *lastError_;
    }

    try {
        keyPair_ = Crypto::generateKeyPair();
        ownPublicKey_ = Crypto::exportPublicKey(keyPair_);
        setState(SenderState::KEY_READY);

        setState(SenderState::HASHING);
        setStatus("Calculating file hash (SHA-256)...");
        content_ = std::move(content);
        SCOPED_TIMER_COMP("Hashing " + std::to_string(content_.size()) + " bytes", kComponent);
        meta_.hash = Crypto::digest(content_);
    } catch (const CryptoError& e) {
        fail(Error{ErrorCode::CryptoUnavailable, e.what()});
        return *lastError_;
    }

    meta_.name = name;
    meta_.size = content_.size();
    meta_.senderPublicKey = ownPublicKey_;

    if (!transport_.sendText(ChunkCodec::encodeMeta(meta_))) {
        fail(Error{ErrorCode::SendFailed, "Failed to send metadata"});
        return *lastError_;
    }
    setState(SenderState::META_SENT);
    logger_.log(LogLevel::INFO, "Announced " + meta_.name + " (" + std::to_string(meta_.size) + " bytes)", kComponent);

    awaitingSince_ = clock_();
    setState(SenderState::AWAITING_PEER_KEY);
    setStatus("Waiting for receiver's E2E key...");
    return Ok();
}

void TransferSender::handleFrame(const Frame& frame) {
    if (isFinished()) {
        return;
    }

    if (frame.type == FrameType::Binary) {
        LOG_WARN_COMP("Dropping binary frame of " + std::to_string(frame.data.size()) + " bytes", kComponent);
        return;
    }

    auto decoded = ChunkCodec::decode(frame.text);
    if (!decoded) {
        const DecodeError& err = decoded.error();
        if (err.code == ErrorCode::MalformedKey && err.type == "ekey" &&
            state_ == SenderState::AWAITING_PEER_KEY) {
            fail(err.toError());
            return;
        }
        LOG_WARN_COMP("Dropping text frame: " + err.message, kComponent);
        return;
    }

    const auto* ekey = std::get_if<ExchangeKeyMessage>(&decoded.value());
    if (ekey == nullptr || state_ != SenderState::AWAITING_PEER_KEY) {
        LOG_WARN_COMP(std::string("Ignoring '") + ChunkCodec::typeName(decoded.value()) +
                      "' in state " + toString(state_), kComponent);
        return;
    }
    onExchangeKey(ekey->pub);
}

void TransferSender::handleClose(const std::string& reason) {
    if (isFinished()) {
        return;
    }
    fail(Error{ErrorCode::ChannelClosed, "Channel closed during " + std::string(toString(state_)) + ": " + reason});
}

bool TransferSender::checkTimeout(ThroughputMeter::Clock::time_point now) {
    if (state_ != SenderState::AWAITING_PEER_KEY || options_.peerKeyTimeout.count() <= 0) {
        return false;
    }
    if (now - awaitingSince_ < options_.peerKeyTimeout) {
        return false;
    }
    fail(Error{ErrorCode::PeerKeyTimeout,
               "No exchange key after " + std::to_string(options_.peerKeyTimeout.count()) + "s"});
    return true;
}

bool TransferSender::checkTimeout() {
    return checkTimeout(clock_());
}

void TransferSender::onExchangeKey(const PublicJwk& peerKey) {
    try {
        PublicKeyHandle peer = Crypto::importPublicKey(peerKey);
        sharedKey_ = Crypto::deriveSharedKey(keyPair_, peer);
        fingerprint_ = Crypto::sessionFingerprint(ownPublicKey_, peerKey);
    } catch (const MalformedKeyError& e) {
        fail(Error{ErrorCode::MalformedKey, e.what()});
        return;
    } catch (const CryptoError& e) {
        fail(Error{ErrorCode::CryptoUnavailable, e.what()});
        return;
    }
    keyPair_.pkey.reset();

    setState(SenderState::KEY_DERIVED);
    logger_.log(LogLevel::INFO, "Session fingerprint " + fingerprint_, kComponent);
    if (eventBus_) {
        eventBus_->publish(events::FINGERPRINT, fingerprint_);
    }

    stream();
}

void TransferSender::stream() {
    setState(SenderState::STREAMING);
    setStatus("Sending (encrypted)...");

    ThroughputMeter meter(content_.size(), options_.progressInterval, clock_);
    meter.start();

    size_t offset = 0;
    while (offset < content_.size()) {
        size_t length = std::min(config::CHUNK_SIZE, content_.size() - offset);

        // Encrypt first: a header must never go out without its body
        EncryptedChunk chunk;
        try {
            chunk = Crypto::encrypt(*sharedKey_, content_.data() + offset, length);
        } catch (const CryptoError& e) {
            fail(Error{ErrorCode::CryptoUnavailable, e.what()});
            return;
        }

        ChunkHeader header;
        header.iv = chunk.iv;
        header.cipherLength = chunk.ciphertext.size();

        if (!transport_.sendText(ChunkCodec::encodeChunkHeader(header))) {
            fail(Error{ErrorCode::SendFailed, "Failed to send chunk header " + std::to_string(chunksSent_)});
            return;
        }
        if (!transport_.sendBinary(chunk.ciphertext)) {
            fail(Error{ErrorCode::SendFailed, "Failed to send chunk body " + std::to_string(chunksSent_)});
            return;
        }

        offset += length;
        bytesSent_ = offset;
        ++chunksSent_;
        LOG_DEBUG_COMP_IF("Chunk " + std::to_string(chunksSent_) + " sent (" +
                          std::to_string(length) + " bytes)", kComponent);

        if (auto update = meter.record(bytesSent_)) {
            publishProgress(*update);
        }
        if (isFinished()) {
            return;
        }
    }

    if (!transport_.sendText(ChunkCodec::encodeEnd())) {
        fail(Error{ErrorCode::SendFailed, "Failed to send end of stream"});
        return;
    }
    publishProgress(meter.finish());

    content_.clear();
    content_.shrink_to_fit();
    sharedKey_.reset();

    setState(SenderState::DONE);
    setStatus("Completed (encrypted).");
    logger_.log(LogLevel::INFO, "Sent " + meta_.name + " in " + std::to_string(chunksSent_) + " chunks", kComponent);
    if (eventBus_) {
        eventBus_->publish(events::COMPLETE, TransferSummary{meta_.name, meta_.size, meta_.hash});
    }
}

void TransferSender::setState(SenderState state) {
    LOG_DEBUG_COMP_IF(std::string(toString(state_)) + " -> " + toString(state), kComponent);
    state_ = state;
    if (eventBus_) {
        eventBus_->publish(events::STATE, state);
    }
}

void TransferSender::setStatus(const std::string& status) {
    if (eventBus_) {
        eventBus_->publish(events::STATUS, status);
    }
}

void TransferSender::publishProgress(const ProgressUpdate& update) {
    if (eventBus_) {
        eventBus_->publish(events::PROGRESS, update);
    }
}

void TransferSender::fail(Error error) {
    if (isFinished()) {
        return;
    }
    logger_.log(LogLevel::ERROR, "Transfer failed in " + std::string(toString(state_)) + ": " + error.toString(), kComponent);

    content_.clear();
    content_.shrink_to_fit();
    sharedKey_.reset();
    keyPair_.pkey.reset();

    lastError_ = error;
    setState(SenderState::FAILED);
    setStatus(error.toString());
    if (eventBus_) {
        eventBus_->publish(events::FAILED, error);
    }
}

} // namespace PeerBeam

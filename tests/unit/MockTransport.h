#pragma once

/**
 * @file MockTransport.h
 * @brief Transport doubles for sender/receiver tests
 */

#include "ChunkCodec.h"
#include "ITransport.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace PeerBeam::mocks {

/**
 * @brief Records everything sent; the test delivers inbound frames by hand
 */
class RecordingTransport : public ITransport {
public:
    std::vector<Frame> sent;
    bool open = true;
    int failSendsAfter = -1;   // number of successful sends before failing, -1 = never

    bool sendText(const std::string& text) override { return record(Frame::makeText(text)); }
    bool sendBinary(const std::vector<uint8_t>& data) override { return record(Frame::makeBinary(data)); }
    bool isOpen() const override { return open; }

    void close() override { peerClosed("closed locally"); }

    void setFrameHandler(FrameHandler handler) override { frameHandler_ = std::move(handler); }
    void setCloseHandler(CloseHandler handler) override { closeHandler_ = std::move(handler); }

    bool hasFrameHandler() const { return static_cast<bool>(frameHandler_); }

    void deliver(const Frame& frame) {
        FrameHandler handler = frameHandler_;
        if (handler) {
            handler(frame);
        }
    }

    void deliverText(const std::string& text) { deliver(Frame::makeText(text)); }
    void deliverBinary(const std::vector<uint8_t>& data) { deliver(Frame::makeBinary(data)); }

    void peerClosed(const std::string& reason = "closed by peer") {
        if (!open) {
            return;
        }
        open = false;
        CloseHandler handler = closeHandler_;
        if (handler) {
            handler(reason);
        }
    }

    /// Sent text frames whose "type" is @p type
    size_t countSent(const std::string& type) const {
        size_t count = 0;
        for (const auto& frame : sent) {
            if (frame.type != FrameType::Text) {
                continue;
            }
            auto decoded = ChunkCodec::decode(frame.text);
            if (decoded && type == ChunkCodec::typeName(decoded.value())) {
                ++count;
            }
        }
        return count;
    }

    size_t countBinary() const {
        size_t count = 0;
        for (const auto& frame : sent) {
            if (frame.type == FrameType::Binary) {
                ++count;
            }
        }
        return count;
    }

private:
    bool record(Frame frame) {
        if (!open) {
            return false;
        }
        if (failSendsAfter >= 0 && static_cast<int>(sent.size()) >= failSendsAfter) {
            return false;
        }
        sent.push_back(std::move(frame));
        return true;
    }

    FrameHandler frameHandler_;
    CloseHandler closeHandler_;
};

/**
 * @brief Wraps another transport and rewrites outgoing frames
 *
 * The mutator sees every frame before it is forwarded, with its zero-based
 * send index.
 */
class TamperingTransport : public ITransport {
public:
    using Mutator = std::function<void(Frame& frame, size_t index)>;

    TamperingTransport(ITransport& inner, Mutator mutator)
        : inner_(inner), mutator_(std::move(mutator)) {}

    bool sendText(const std::string& text) override { return forward(Frame::makeText(text)); }
    bool sendBinary(const std::vector<uint8_t>& data) override { return forward(Frame::makeBinary(data)); }
    bool isOpen() const override { return inner_.isOpen(); }
    void close() override { inner_.close(); }
    void setFrameHandler(FrameHandler handler) override { inner_.setFrameHandler(std::move(handler)); }
    void setCloseHandler(CloseHandler handler) override { inner_.setCloseHandler(std::move(handler)); }

private:
    bool forward(Frame frame) {
        if (mutator_) {
            mutator_(frame, index_);
        }
        ++index_;
        return frame.type == FrameType::Text ? inner_.sendText(frame.text) : inner_.sendBinary(frame.data);
    }

    ITransport& inner_;
    Mutator mutator_;
    size_t index_ = 0;
};

} // namespace PeerBeam::mocks

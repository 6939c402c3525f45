#pragma once

#include "ITransport.h"

#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace PeerBeam {

/**
 * @brief In-memory transport endpoint connected back-to-back with a peer
 *
 * Sends append to the peer's inbox; nothing is delivered until the owner
 * calls pump(), so a test or event loop controls exactly when frames
 * arrive. Not thread-safe: both endpoints belong to one event loop.
 */
class LoopbackTransport : public ITransport {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackTransport>, std::shared_ptr<LoopbackTransport>>;

    static Pair createPair(const std::string& firstName = "A", const std::string& secondName = "B");

    explicit LoopbackTransport(std::string name);

    bool sendText(const std::string& text) override;
    bool sendBinary(const std::vector<uint8_t>& data) override;
    bool isOpen() const override { return open_; }
    void close() override;
    void setFrameHandler(FrameHandler handler) override { frameHandler_ = std::move(handler); }
    void setCloseHandler(CloseHandler handler) override { closeHandler_ = std::move(handler); }

    /**
     * @brief Deliver up to @p maxFrames queued frames to the frame handler
     *
     * Stops early if the endpoint closes or has no handler. Frames queued by
     * the handler itself are delivered in the same call.
     * @return Number of frames delivered
     */
    size_t pump(size_t maxFrames = std::numeric_limits<size_t>::max());

    size_t pendingFrames() const { return inbox_.size(); }
    const std::string& name() const { return name_; }

    /// Pump both endpoints until neither has deliverable frames
    static size_t pumpAll(LoopbackTransport& a, LoopbackTransport& b);

private:
    bool enqueueToPeer(Frame frame);
    void markClosed(const std::string& reason);

    std::string name_;
    std::weak_ptr<LoopbackTransport> peer_;
    std::deque<Frame> inbox_;
    bool open_{true};
    FrameHandler frameHandler_;
    CloseHandler closeHandler_;
};

} // namespace PeerBeam

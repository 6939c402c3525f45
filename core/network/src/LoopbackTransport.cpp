#include "LoopbackTransport.h"
#include "LoggerMacros.h"

namespace PeerBeam {

LoopbackTransport::Pair LoopbackTransport::createPair(const std::string& firstName,
                                                      const std::string& secondName) {
    auto first = std::make_shared<LoopbackTransport>(firstName);
    auto second = std::make_shared<LoopbackTransport>(secondName);
    first->peer_ = second;
    second->peer_ = first;
    return {first, second};
}

LoopbackTransport::LoopbackTransport(std::string name) : name_(std::move(name)) {}

bool LoopbackTransport::sendText(const std::string& text) {
    return enqueueToPeer(Frame::makeText(text));
}

bool LoopbackTransport::sendBinary(const std::vector<uint8_t>& data) {
    return enqueueToPeer(Frame::makeBinary(data));
}

bool LoopbackTransport::enqueueToPeer(Frame frame) {
    if (!open_) {
        LOG_WARN_COMP("Send on closed endpoint " + name_, "LoopbackTransport");
        return false;
    }
    auto peer = peer_.lock();
    if (!peer || !peer->open_) {
        LOG_WARN_COMP("Peer of " + name_ + " is gone", "LoopbackTransport");
        return false;
    }
    peer->inbox_.push_back(std::move(frame));
    return true;
}

void LoopbackTransport::close() {
    if (!open_) {
        return;
    }
    LOG_DEBUG_COMP_IF("Closing endpoint " + name_, "LoopbackTransport");

    auto peer = peer_.lock();
    markClosed("closed locally");
    if (peer) {
        peer->markClosed("closed by peer");
    }
}

void LoopbackTransport::markClosed(const std::string& reason) {
    if (!open_) {
        return;
    }
    open_ = false;
    inbox_.clear();

    // Copy first: the handler may detach itself
    CloseHandler handler = closeHandler_;
    if (handler) {
        handler(reason);
    }
}

size_t LoopbackTransport::pump(size_t maxFrames) {
    size_t delivered = 0;
    while (delivered < maxFrames && open_ && frameHandler_ && !inbox_.empty()) {
        Frame frame = std::move(inbox_.front());
        inbox_.pop_front();

        FrameHandler handler = frameHandler_;
        handler(frame);
        ++delivered;
    }
    return delivered;
}

size_t LoopbackTransport::pumpAll(LoopbackTransport& a, LoopbackTransport& b) {
    size_t total = 0;
    for (;;) {
        size_t delivered = a.pump() + b.pump();
        if (delivered == 0) {
            break;
        }
        total += delivered;
    }
    return total;
}

} // namespace PeerBeam

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace PeerBeam {

enum class FrameType {
    Text,
    Binary
};

struct Frame {
    FrameType type{FrameType::Text};
    std::string text;            // Text frames
    std::vector<uint8_t> data;   // Binary frames

    static Frame makeText(std::string text) {
        Frame frame;
        frame.type = FrameType::Text;
        frame.text = std::move(text);
        return frame;
    }

    static Frame makeBinary(std::vector<uint8_t> data) {
        Frame frame;
        frame.type = FrameType::Binary;
        frame.data = std::move(data);
        return frame;
    }
};

/**
 * @brief Ordered, reliable, bidirectional message channel
 *
 * Implementations deliver every frame sent while open exactly once and in
 * send order, as either text or binary. Handlers are invoked on the thread
 * that drives the transport (pump()/poll()).
 */
class ITransport {
public:
    using FrameHandler = std::function<void(const Frame&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~ITransport() = default;

    /**
     * @brief Send a UTF-8 text frame.
     * @return false if the channel is closed or the write failed.
     */
    virtual bool sendText(const std::string& text) = 0;

    /**
     * @brief Send a binary frame.
     * @return false if the channel is closed or the write failed.
     */
    virtual bool sendBinary(const std::vector<uint8_t>& data) = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Close the channel. The close handler fires once.
     */
    virtual void close() = 0;

    /// Pass nullptr to detach.
    virtual void setFrameHandler(FrameHandler handler) = 0;
    virtual void setCloseHandler(CloseHandler handler) = 0;
};

} // namespace PeerBeam

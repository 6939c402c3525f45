#pragma once

#include "ITransport.h"
#include "Result.h"
#include "SocketGuard.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace PeerBeam {

/**
 * @brief ITransport over a connected TCP stream
 *
 * Stream encoding of one frame:
 *   [1 byte type: 0x01 text, 0x02 binary][4 byte big-endian length][payload]
 *
 * Single-threaded: the owner calls poll() from its event loop, which reads
 * what is available and dispatches every complete frame. Sends block until
 * the kernel accepted the whole frame.
 */
class TcpFrameTransport : public ITransport {
public:
    static constexpr uint8_t TEXT_FRAME = 0x01;
    static constexpr uint8_t BINARY_FRAME = 0x02;
    static constexpr size_t HEADER_SIZE = 5;

    explicit TcpFrameTransport(SocketGuard socket, std::string peerName = "peer");
    ~TcpFrameTransport() override;

    TcpFrameTransport(const TcpFrameTransport&) = delete;
    TcpFrameTransport& operator=(const TcpFrameTransport&) = delete;

    /**
     * @brief Connect to host:port (IPv4 literal or resolvable name)
     * @return ConnectionFailed on resolution or connect errors
     */
    static Result<std::unique_ptr<TcpFrameTransport>> connectTo(const std::string& host, int port);

    /**
     * @brief Listen on @p port and accept exactly one peer
     * @param timeoutMs Accept timeout, negative waits forever
     */
    static Result<std::unique_ptr<TcpFrameTransport>> listenAndAccept(int port, int timeoutMs = -1);

    bool sendText(const std::string& text) override;
    bool sendBinary(const std::vector<uint8_t>& data) override;
    bool isOpen() const override { return open_; }
    void close() override;
    void setFrameHandler(FrameHandler handler) override { frameHandler_ = std::move(handler); }
    void setCloseHandler(CloseHandler handler) override { closeHandler_ = std::move(handler); }

    /**
     * @brief Wait up to @p timeoutMs for input and dispatch complete frames
     *
     * EOF, socket errors and oversized or unknown frames close the transport
     * and fire the close handler.
     * @return Number of frames dispatched
     */
    size_t poll(int timeoutMs);

    const std::string& peerName() const { return peerName_; }

private:
    bool sendFrame(uint8_t type, const uint8_t* payload, size_t length);
    bool writeAll(const uint8_t* data, size_t length);
    size_t dispatchBuffered();
    void shutdown(const std::string& reason);

    SocketGuard socket_;
    std::string peerName_;
    std::vector<uint8_t> buffer_;
    bool open_{true};
    FrameHandler frameHandler_;
    CloseHandler closeHandler_;
};

/**
 * @brief Listening socket that hands out TcpFrameTransport connections
 */
class TcpListener {
public:
    /// @param port 0 picks an ephemeral port; see port()
    static Result<std::unique_ptr<TcpListener>> bind(int port);

    int port() const { return port_; }

    /**
     * @brief Accept one connection
     * @param timeoutMs Negative waits forever
     * @return ConnectionFailed on timeout or accept error
     */
    Result<std::unique_ptr<TcpFrameTransport>> accept(int timeoutMs);

private:
    TcpListener(SocketGuard socket, int port) : socket_(std::move(socket)), port_(port) {}

    SocketGuard socket_;
    int port_;
};

} // namespace PeerBeam

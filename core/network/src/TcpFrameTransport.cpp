#include "TcpFrameTransport.h"
#include "Constants.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstring>

namespace PeerBeam {

namespace {

constexpr const char* kComponent = "TcpFrameTransport";

std::string lastSystemError() {
    return std::string(strerror(errno));
}

} // namespace

TcpFrameTransport::TcpFrameTransport(SocketGuard socket, std::string peerName)
    : socket_(std::move(socket)), peerName_(std::move(peerName)) {
    open_ = static_cast<bool>(socket_);
}

TcpFrameTransport::~TcpFrameTransport() {
    // No handlers on teardown; the owner is already going away
    frameHandler_ = nullptr;
    closeHandler_ = nullptr;
    socket_.reset();
}

Result<std::unique_ptr<TcpFrameTransport>> TcpFrameTransport::connectTo(const std::string& host, int port) {
    auto& logger = Logger::instance();
    logger.log(LogLevel::INFO, "Connecting to " + host + ":" + std::to_string(port), kComponent);

    if (port <= 0 || port > 65535) {
        return Error{ErrorCode::InvalidArgument, "Invalid port " + std::to_string(port)};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* resolved = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &resolved);
        if (rc != 0 || resolved == nullptr) {
            logger.log(LogLevel::ERROR, "Cannot resolve " + host + ": " + gai_strerror(rc), kComponent);
            return Error{ErrorCode::ConnectionFailed, "Cannot resolve " + host};
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(resolved->ai_addr)->sin_addr;
        freeaddrinfo(resolved);
    }

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        logger.log(LogLevel::ERROR, "Failed to create socket: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to create socket"};
    }

    if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = lastSystemError();
        logger.log(LogLevel::ERROR, "Failed to connect to " + host + ": " + reason, kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to connect to " + host + ": " + reason};
    }

    logger.log(LogLevel::INFO, "Connected to " + host + ":" + std::to_string(port), kComponent);
    return std::make_unique<TcpFrameTransport>(std::move(sock), host + ":" + std::to_string(port));
}

Result<std::unique_ptr<TcpFrameTransport>> TcpFrameTransport::listenAndAccept(int port, int timeoutMs) {
    auto listener = TcpListener::bind(port);
    if (!listener) {
        return listener.error();
    }
    return listener.value()->accept(timeoutMs);
}

bool TcpFrameTransport::sendText(const std::string& text) {
    return sendFrame(TEXT_FRAME, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool TcpFrameTransport::sendBinary(const std::vector<uint8_t>& data) {
    return sendFrame(BINARY_FRAME, data.data(), data.size());
}

bool TcpFrameTransport::sendFrame(uint8_t type, const uint8_t* payload, size_t length) {
    if (!open_) {
        LOG_WARN_COMP("Send on closed connection to " + peerName_, kComponent);
        return false;
    }
    if (length > config::MAX_FRAME_PAYLOAD) {
        LOG_ERROR_COMP("Frame of " + std::to_string(length) + " bytes exceeds the frame limit", kComponent);
        return false;
    }

    uint8_t header[HEADER_SIZE];
    header[0] = type;
    uint32_t len = htonl(static_cast<uint32_t>(length));
    std::memcpy(header + 1, &len, sizeof(len));

    if (!writeAll(header, sizeof(header)) || (length > 0 && !writeAll(payload, length))) {
        Logger::instance().log(LogLevel::ERROR, "Failed to send frame to " + peerName_ + ": " + lastSystemError(), kComponent);
        shutdown("send failed");
        return false;
    }
    return true;
}

bool TcpFrameTransport::writeAll(const uint8_t* data, size_t length) {
    size_t sent = 0;
    while (sent < length) {
        ssize_t n = ::send(socket_.get(), data + sent, length - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

size_t TcpFrameTransport::poll(int timeoutMs) {
    if (!open_) {
        return 0;
    }

    pollfd pfd{};
    pfd.fd = socket_.get();
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready < 0) {
        if (errno == EINTR) {
            return 0;
        }
        shutdown("poll failed: " + lastSystemError());
        return 0;
    }
    if (ready == 0) {
        return 0;
    }

    uint8_t chunk[64 * 1024];
    ssize_t n = ::recv(socket_.get(), chunk, sizeof(chunk), 0);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return 0;
        }
        shutdown("receive failed: " + lastSystemError());
        return 0;
    }
    if (n == 0) {
        // Frames already buffered still count; the peer may close right after `end`
        size_t dispatched = dispatchBuffered();
        shutdown("closed by peer");
        return dispatched;
    }

    buffer_.insert(buffer_.end(), chunk, chunk + n);
    return dispatchBuffered();
}

size_t TcpFrameTransport::dispatchBuffered() {
    size_t dispatched = 0;
    size_t offset = 0;

    while (open_ && buffer_.size() - offset >= HEADER_SIZE) {
        uint8_t type = buffer_[offset];
        uint32_t len = 0;
        std::memcpy(&len, buffer_.data() + offset + 1, sizeof(len));
        len = ntohl(len);

        if (type != TEXT_FRAME && type != BINARY_FRAME) {
            shutdown("unknown frame type " + std::to_string(type));
            break;
        }
        if (len > config::MAX_FRAME_PAYLOAD) {
            shutdown("frame of " + std::to_string(len) + " bytes exceeds the frame limit");
            break;
        }
        if (buffer_.size() - offset - HEADER_SIZE < len) {
            break;
        }

        const uint8_t* payload = buffer_.data() + offset + HEADER_SIZE;
        Frame frame = type == TEXT_FRAME
            ? Frame::makeText(std::string(reinterpret_cast<const char*>(payload), len))
            : Frame::makeBinary(std::vector<uint8_t>(payload, payload + len));
        offset += HEADER_SIZE + len;

        FrameHandler handler = frameHandler_;
        if (handler) {
            handler(frame);
            ++dispatched;
        }
    }

    if (open_) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return dispatched;
}

void TcpFrameTransport::close() {
    shutdown("closed locally");
}

void TcpFrameTransport::shutdown(const std::string& reason) {
    if (!open_) {
        return;
    }
    open_ = false;
    buffer_.clear();
    if (socket_) {
        ::shutdown(socket_.get(), SHUT_RDWR);
        socket_.reset();
    }
    LOG_INFO_COMP_IF("Connection to " + peerName_ + " " + reason, kComponent);

    CloseHandler handler = closeHandler_;
    if (handler) {
        handler(reason);
    }
}

// ==================== TcpListener ====================

Result<std::unique_ptr<TcpListener>> TcpListener::bind(int port) {
    auto& logger = Logger::instance();
    logger.log(LogLevel::INFO, "Starting TCP listener on port " + std::to_string(port), kComponent);

    if (port < 0 || port > 65535) {
        return Error{ErrorCode::InvalidArgument, "Invalid port " + std::to_string(port)};
    }

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        logger.log(LogLevel::ERROR, "Failed to create TCP server socket: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to create server socket"};
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        logger.log(LogLevel::ERROR, "Failed to set socket options: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to set socket options"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = lastSystemError();
        logger.log(LogLevel::ERROR, "Failed to bind TCP server socket to port " + std::to_string(port) + ": " + reason, kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to bind port " + std::to_string(port) + ": " + reason};
    }

    if (::listen(sock.get(), 1) < 0) {
        logger.log(LogLevel::ERROR, "Failed to listen on TCP server socket: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to listen"};
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) < 0) {
        logger.log(LogLevel::ERROR, "getsockname failed: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "Failed to read bound port"};
    }
    int actualPort = ntohs(bound.sin_port);

    logger.log(LogLevel::INFO, "TCP server listening on port " + std::to_string(actualPort), kComponent);
    return std::unique_ptr<TcpListener>(new TcpListener(std::move(sock), actualPort));
}

Result<std::unique_ptr<TcpFrameTransport>> TcpListener::accept(int timeoutMs) {
    auto& logger = Logger::instance();

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(socket_.get(), &readfds);

    timeval tv{};
    timeval* timeout = nullptr;
    if (timeoutMs >= 0) {
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        timeout = &tv;
    }

    int activity = select(socket_.get() + 1, &readfds, nullptr, nullptr, timeout);
    if (activity < 0) {
        logger.log(LogLevel::ERROR, "select() failed: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "select failed"};
    }
    if (activity == 0) {
        return Error{ErrorCode::ConnectionFailed, "No peer connected within " + std::to_string(timeoutMs) + "ms"};
    }

    sockaddr_in clientAddr{};
    socklen_t clientLen = sizeof(clientAddr);
    SocketGuard client(::accept(socket_.get(), reinterpret_cast<sockaddr*>(&clientAddr), &clientLen));
    if (!client) {
        logger.log(LogLevel::ERROR, "accept() failed: " + lastSystemError(), kComponent);
        return Error{ErrorCode::ConnectionFailed, "accept failed"};
    }

    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &clientAddr.sin_addr, ip, sizeof(ip));
    std::string peer = std::string(ip) + ":" + std::to_string(ntohs(clientAddr.sin_port));
    logger.log(LogLevel::INFO, "New connection from " + peer, kComponent);

    return std::make_unique<TcpFrameTransport>(std::move(client), peer);
}

} // namespace PeerBeam

#pragma once

#include "Crypto.h"
#include "Result.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace PeerBeam {

class Config;

/**
 * @brief What the sender announces in `meta`; immutable once sent
 */
struct FileMetadata {
    std::string name;
    uint64_t size{0};
    std::string hash;            // lower-case hex SHA-256 of the full plaintext
    PublicJwk senderPublicKey;
};

/**
 * @brief Precedes exactly one binary ciphertext frame
 */
struct ChunkHeader {
    std::array<uint8_t, 12> iv{};
    uint64_t cipherLength{0};
};

struct ProgressUpdate {
    double percent{0.0};                 // 0-100, never decreasing within a session
    double bytesPerSecond{0.0};
    std::optional<double> etaSeconds;    // absent while speed is unknown
    uint64_t bytesTransferred{0};
    uint64_t totalBytes{0};
};

struct TransferSummary {
    std::string name;
    uint64_t size{0};
    std::string hash;
};

/**
 * @brief Per-session tunables shared by sender and receiver
 */
struct TransferOptions {
    std::chrono::milliseconds progressInterval{500};
    std::chrono::seconds peerKeyTimeout{0};   // 0 waits forever

    /**
     * @brief Build from `progress_interval_ms` and `peer_key_timeout_sec`
     * @return ConfigError if either value is out of range
     */
    static Result<TransferOptions> fromConfig(const Config& config);
};

enum class SenderState {
    INIT,
    KEY_READY,
    HASHING,
    META_SENT,
    AWAITING_PEER_KEY,
    KEY_DERIVED,
    STREAMING,
    DONE,
    FAILED
};

enum class ReceiverState {
    INIT,
    KEY_READY,
    AWAITING_META,
    META_RECEIVED,
    KEY_DERIVED,
    RECEIVING,
    AWAITING_BODY,
    VERIFYING,
    COMPLETE,
    FAILED
};

const char* toString(SenderState state);
const char* toString(ReceiverState state);

} // namespace PeerBeam

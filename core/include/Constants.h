#pragma once

/**
 * @file Constants.h
 * @brief Centralized protocol and configuration constants for PeerBeam
 *
 * Wire-visible values live here so sender and receiver can never disagree.
 */

#include <cstddef>
#include <cstdint>

namespace PeerBeam::config {

// =============================================================================
// Transfer Protocol
// =============================================================================

/// Plaintext bytes per chunk; the final chunk may be shorter
constexpr std::size_t CHUNK_SIZE = 64 * 1024;  // 64KB

/// AES-GCM IV length carried in every chunk header (bytes)
constexpr std::size_t GCM_IV_SIZE = 12;

/// AES-GCM authentication tag appended to every ciphertext (bytes)
constexpr std::size_t GCM_TAG_SIZE = 16;

/// Hex-encoded SHA-256 digest length
constexpr std::size_t DIGEST_HEX_LENGTH = 64;

// =============================================================================
// Progress Reporting
// =============================================================================

/// Minimum wall-clock gap between sender progress reports (milliseconds)
constexpr int DEFAULT_PROGRESS_INTERVAL_MS = 500;

/// Await-peer-key timeout; 0 waits forever (seconds)
constexpr int DEFAULT_PEER_KEY_TIMEOUT_SEC = 0;

// =============================================================================
// Transport
// =============================================================================

/// Default TCP port for the CLI receiver
constexpr int DEFAULT_LISTEN_PORT = 47800;

/// Largest frame payload accepted from a TCP peer (bytes)
constexpr std::uint32_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;  // 16MB

/// Poll timeout used by the CLI event loop (milliseconds)
constexpr int POLL_INTERVAL_MS = 100;

// =============================================================================
// Logging
// =============================================================================

/// Maximum log file size before rotation (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

} // namespace PeerBeam::config

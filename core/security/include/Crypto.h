#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>
#include <openssl/evp.h>

namespace PeerBeam {

/**
 * @brief Base class of every failure raised by the crypto primitives
 */
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The platform cannot generate keys, agree on a secret or run AES-GCM. Fatal.
class CryptoUnavailableError : public CryptoError {
public:
    using CryptoError::CryptoError;
};

/// A peer-supplied public key is structurally invalid or not on P-256.
class MalformedKeyError : public CryptoError {
public:
    using CryptoError::CryptoError;
};

/// AES-GCM tag did not verify (tampered data, wrong key or wrong IV).
class AuthenticationError : public CryptoError {
public:
    using CryptoError::CryptoError;
};

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/**
 * @brief Ephemeral EC P-256 key agreement pair
 *
 * Created once per transfer session and never persisted. The private half
 * stays inside the EVP_PKEY.
 */
struct KeyPair {
    EvpPkeyPtr pkey;
};

/**
 * @brief Imported peer public key, usable only for key agreement
 */
struct PublicKeyHandle {
    EvpPkeyPtr pkey;
};

/**
 * @brief Public key in JSON Web Key form: {"kty":"EC","crv":"P-256","x":..,"y":..}
 *
 * x and y are the unpadded base64url encodings of the 32-byte affine
 * coordinates, which is what browsers emit for an ECDH key.
 */
struct PublicJwk {
    std::string kty{"EC"};
    std::string crv{"P-256"};
    std::string x;
    std::string y;

    Json::Value toJson() const;

    /**
     * @throws MalformedKeyError if @p value is not an object with string
     *         kty/crv/x/y members describing an EC P-256 key
     */
    static PublicJwk fromJson(const Json::Value& value);

    bool operator==(const PublicJwk& other) const {
        return kty == other.kty && crv == other.crv && x == other.x && y == other.y;
    }
};

/**
 * @brief 256-bit AES-GCM session key
 *
 * Only Crypto can read the key bytes; the bytes are wiped on destruction.
 */
class SharedKey {
public:
    SharedKey(const SharedKey&) = delete;
    SharedKey& operator=(const SharedKey&) = delete;
    SharedKey(SharedKey&& other) noexcept;
    SharedKey& operator=(SharedKey&& other) noexcept;
    ~SharedKey();

private:
    friend class Crypto;
    SharedKey() = default;

    std::array<uint8_t, 32> bytes_{};
};

struct EncryptedChunk {
    std::array<uint8_t, 12> iv{};
    std::vector<uint8_t> ciphertext;  // ciphertext || 16-byte tag
};

/**
 * @brief Stateless crypto primitives for the transfer protocol
 *
 * - ECDH over P-256 for key agreement
 * - SHA-256(shared bits) as the AES-256-GCM key
 * - AES-256-GCM per chunk with a fresh random 96-bit IV
 * - SHA-256 content digest, lower-case hex
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t GCM_IV_SIZE = 12;
    static constexpr size_t GCM_TAG_SIZE = 16;
    static constexpr size_t COORDINATE_SIZE = 32;

    /// @throws CryptoUnavailableError
    static KeyPair generateKeyPair();

    /// @throws CryptoUnavailableError
    static PublicJwk exportPublicKey(const KeyPair& keyPair);

    /// @throws MalformedKeyError
    static PublicKeyHandle importPublicKey(const PublicJwk& jwk);

    /**
     * @brief ECDH(ownPrivate, peerPublic) -> SHA-256 -> AES-256-GCM key
     *
     * Both sides compute the same key; it is never sent or verified in-band.
     * @throws CryptoUnavailableError
     */
    static SharedKey deriveSharedKey(const KeyPair& own, const PublicKeyHandle& peer);

    /// @throws CryptoUnavailableError
    static EncryptedChunk encrypt(const SharedKey& key, const uint8_t* data, size_t length);
    static EncryptedChunk encrypt(const SharedKey& key, const std::vector<uint8_t>& plaintext);

    /**
     * @throws AuthenticationError when the tag does not verify
     * @throws CryptoUnavailableError on cipher setup failure
     */
    static std::vector<uint8_t> decrypt(const SharedKey& key,
                                        const std::array<uint8_t, 12>& iv,
                                        const std::vector<uint8_t>& ciphertext);

    /// SHA-256, lower-case hex. @throws CryptoUnavailableError
    static std::string digest(const uint8_t* data, size_t length);
    static std::string digest(const std::vector<uint8_t>& data);

    /**
     * @brief Short authentication string over both public keys
     *
     * Order-independent, so both peers display the same value, e.g.
     * "3F9A-0C21-D4E7-88B0". Comparing it out of band detects a key
     * substituted on the signaling path.
     */
    static std::string sessionFingerprint(const PublicJwk& a, const PublicJwk& b);

    static std::string toHex(const uint8_t* data, size_t length);
    static std::string base64UrlEncode(const uint8_t* data, size_t length);

    /// @throws MalformedKeyError on characters outside the base64url alphabet
    static std::vector<uint8_t> base64UrlDecode(const std::string& text);
};

} // namespace PeerBeam

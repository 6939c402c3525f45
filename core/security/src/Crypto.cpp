#include "Crypto.h"
#include "Logger.h"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <algorithm>
#include <climits>
#include <iomanip>
#include <sstream>

namespace PeerBeam {

namespace {

struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

[[noreturn]] void failCipher(const std::string& what) {
    Logger::instance().log(LogLevel::ERROR, what, "Crypto");
    throw CryptoUnavailableError(what);
}

} // namespace

// ==================== AES-GCM AEAD ====================

EncryptedChunk Crypto::encrypt(const SharedKey& key, const uint8_t* data, size_t length) {
    if (length > static_cast<size_t>(INT_MAX) - GCM_TAG_SIZE) {
        throw CryptoError("Plaintext too large for a single GCM call");
    }

    EncryptedChunk out;
    if (RAND_bytes(out.iv.data(), static_cast<int>(out.iv.size())) != 1) {
        failCipher("Failed to generate GCM IV");
    }

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        failCipher("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        failCipher("Failed to initialize GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr) != 1) {
        failCipher("Failed to set GCM IV length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes_.data(), out.iv.data()) != 1) {
        failCipher("Failed to set GCM key/IV");
    }

    out.ciphertext.resize(length + GCM_TAG_SIZE);
    int len = 0;
    int ciphertextLen = 0;

    if (length > 0) {
        if (EVP_EncryptUpdate(ctx.get(), out.ciphertext.data(), &len, data, static_cast<int>(length)) != 1) {
            failCipher("GCM encryption failed");
        }
        ciphertextLen = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + ciphertextLen, &len) != 1) {
        failCipher("GCM finalization failed");
    }
    ciphertextLen += len;

    // Tag is appended, matching the WebCrypto ciphertext layout
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE,
                            out.ciphertext.data() + ciphertextLen) != 1) {
        failCipher("Failed to get GCM tag");
    }
    out.ciphertext.resize(ciphertextLen + GCM_TAG_SIZE);
    return out;
}

EncryptedChunk Crypto::encrypt(const SharedKey& key, const std::vector<uint8_t>& plaintext) {
    return encrypt(key, plaintext.data(), plaintext.size());
}

std::vector<uint8_t> Crypto::decrypt(const SharedKey& key,
                                     const std::array<uint8_t, 12>& iv,
                                     const std::vector<uint8_t>& ciphertext) {
    auto& logger = Logger::instance();

    if (ciphertext.size() < GCM_TAG_SIZE) {
        logger.log(LogLevel::WARN, "Ciphertext too short for GCM", "Crypto");
        throw AuthenticationError("Ciphertext shorter than the GCM tag");
    }
    if (ciphertext.size() > static_cast<size_t>(INT_MAX)) {
        throw AuthenticationError("Ciphertext too large");
    }

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        failCipher("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        failCipher("Failed to initialize GCM decryption");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr) != 1) {
        failCipher("Failed to set GCM IV length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes_.data(), iv.data()) != 1) {
        failCipher("Failed to set GCM key/IV");
    }

    size_t bodyLen = ciphertext.size() - GCM_TAG_SIZE;
    std::vector<uint8_t> plaintext(bodyLen);
    int len = 0;
    int plaintextLen = 0;

    if (bodyLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(), static_cast<int>(bodyLen)) != 1) {
            throw AuthenticationError("GCM decryption failed");
        }
        plaintextLen = len;
    }

    std::array<uint8_t, GCM_TAG_SIZE> tag{};
    std::copy(ciphertext.begin() + bodyLen, ciphertext.end(), tag.begin());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE, tag.data()) != 1) {
        failCipher("Failed to set GCM tag");
    }

    // Tag verification happens here
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &len) <= 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        logger.log(LogLevel::WARN, "GCM authentication failed", "Crypto");
        throw AuthenticationError("GCM tag mismatch");
    }
    plaintextLen += len;
    plaintext.resize(plaintextLen);
    return plaintext;
}

// ==================== Digest & encoding ====================

std::string Crypto::digest(const uint8_t* data, size_t length) {
    static const uint8_t empty = 0;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    if (EVP_Digest(length == 0 ? &empty : data, length, md, &mdLen, EVP_sha256(), nullptr) != 1) {
        Logger::instance().log(LogLevel::ERROR, "SHA-256 digest failed", "Crypto");
        throw CryptoUnavailableError("SHA-256 digest failed");
    }
    return toHex(md, mdLen);
}

std::string Crypto::digest(const std::vector<uint8_t>& data) {
    return digest(data.data(), data.size());
}

std::string Crypto::toHex(const uint8_t* data, size_t length) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Crypto::base64UrlEncode(const uint8_t* data, size_t length) {
    if (length == 0) {
        return "";
    }

    std::string out(4 * ((length + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(length));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);

    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

std::vector<uint8_t> Crypto::base64UrlDecode(const std::string& text) {
    std::string b64;
    b64.reserve(text.size() + 3);
    for (char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            b64 += c;
        } else if (c == '-') {
            b64 += '+';
        } else if (c == '_') {
            b64 += '/';
        } else {
            throw MalformedKeyError("Invalid base64url character");
        }
    }

    if (b64.size() % 4 == 1) {
        throw MalformedKeyError("Invalid base64url length");
    }
    size_t padding = (4 - b64.size() % 4) % 4;
    b64.append(padding, '=');

    std::vector<uint8_t> out(b64.size() / 4 * 3);
    if (b64.empty()) {
        return out;
    }
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()),
                                  static_cast<int>(b64.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        throw MalformedKeyError("Invalid base64url data");
    }
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace PeerBeam

/**
 * @file KeyAgreement.cpp
 * @brief Ephemeral P-256 key pairs, JWK conversion and ECDH session key derivation
 */

#include "Crypto.h"
#include "Logger.h"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/params.h>
#include <algorithm>
#include <cctype>

namespace PeerBeam {

namespace {

constexpr const char* kKeyType = "EC";
constexpr const char* kGroupName = "prime256v1";

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

std::string lastOpensslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "no OpenSSL error queued";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

[[noreturn]] void failUnavailable(const std::string& what) {
    std::string message = what + ": " + lastOpensslError();
    Logger::instance().log(LogLevel::ERROR, message, "Crypto");
    throw CryptoUnavailableError(message);
}

[[noreturn]] void failMalformed(const std::string& what) {
    ERR_clear_error();
    Logger::instance().log(LogLevel::WARN, "Rejected exchange key: " + what, "Crypto");
    throw MalformedKeyError(what);
}

std::string coordinateToBase64Url(const EVP_PKEY* pkey, const char* param) {
    BIGNUM* raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, param, &raw) != 1) {
        failUnavailable(std::string("Failed to read EC coordinate ") + param);
    }
    BignumPtr bn(raw);

    std::array<uint8_t, Crypto::COORDINATE_SIZE> buf{};
    if (BN_bn2binpad(bn.get(), buf.data(), static_cast<int>(buf.size())) != static_cast<int>(buf.size())) {
        failUnavailable("EC coordinate does not fit 32 bytes");
    }
    return Crypto::base64UrlEncode(buf.data(), buf.size());
}

} // namespace

// ==================== JWK ====================

Json::Value PublicJwk::toJson() const {
    Json::Value value(Json::objectValue);
    value["kty"] = kty;
    value["crv"] = crv;
    value["x"] = x;
    value["y"] = y;
    value["ext"] = true;
    value["key_ops"] = Json::Value(Json::arrayValue);
    return value;
}

PublicJwk PublicJwk::fromJson(const Json::Value& value) {
    if (!value.isObject()) {
        failMalformed("exchange key is not a JSON object");
    }

    PublicJwk jwk;
    for (const char* field : {"kty", "crv", "x", "y"}) {
        if (!value.isMember(field) || !value[field].isString()) {
            failMalformed(std::string("exchange key is missing string member '") + field + "'");
        }
    }
    jwk.kty = value["kty"].asString();
    jwk.crv = value["crv"].asString();
    jwk.x = value["x"].asString();
    jwk.y = value["y"].asString();

    if (jwk.kty != "EC" || jwk.crv != "P-256") {
        failMalformed("unsupported key type " + jwk.kty + "/" + jwk.crv);
    }
    return jwk;
}

// ==================== SharedKey ====================

SharedKey::SharedKey(SharedKey&& other) noexcept : bytes_(other.bytes_) {
    OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
}

SharedKey& SharedKey::operator=(SharedKey&& other) noexcept {
    if (this != &other) {
        bytes_ = other.bytes_;
        OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
    }
    return *this;
}

SharedKey::~SharedKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

// ==================== Key agreement ====================

KeyPair Crypto::generateKeyPair() {
    auto& logger = Logger::instance();
    logger.log(LogLevel::DEBUG, "Generating ephemeral P-256 key pair", "Crypto");

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, kKeyType, nullptr));
    if (!ctx) {
        failUnavailable("EC key generation context unavailable");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_group_name(ctx.get(), kGroupName) <= 0) {
        failUnavailable("Failed to initialise P-256 key generation");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_generate(ctx.get(), &raw) <= 0 || raw == nullptr) {
        failUnavailable("P-256 key generation failed");
    }
    return KeyPair{EvpPkeyPtr(raw)};
}

PublicJwk Crypto::exportPublicKey(const KeyPair& keyPair) {
    if (!keyPair.pkey) {
        throw CryptoUnavailableError("Cannot export an empty key pair");
    }

    PublicJwk jwk;
    jwk.x = coordinateToBase64Url(keyPair.pkey.get(), OSSL_PKEY_PARAM_EC_PUB_X);
    jwk.y = coordinateToBase64Url(keyPair.pkey.get(), OSSL_PKEY_PARAM_EC_PUB_Y);
    return jwk;
}

PublicKeyHandle Crypto::importPublicKey(const PublicJwk& jwk) {
    if (jwk.kty != "EC" || jwk.crv != "P-256") {
        failMalformed("unsupported key type " + jwk.kty + "/" + jwk.crv);
    }

    std::vector<uint8_t> x = base64UrlDecode(jwk.x);
    std::vector<uint8_t> y = base64UrlDecode(jwk.y);
    if (x.size() != COORDINATE_SIZE || y.size() != COORDINATE_SIZE) {
        failMalformed("EC coordinates must be 32 bytes each");
    }

    // Uncompressed SEC1 point: 0x04 || X || Y
    std::vector<uint8_t> point;
    point.reserve(1 + 2 * COORDINATE_SIZE);
    point.push_back(0x04);
    point.insert(point.end(), x.begin(), x.end());
    point.insert(point.end(), y.begin(), y.end());

    char group[] = "prime256v1";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group, 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size()),
        OSSL_PARAM_construct_end()
    };

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, kKeyType, nullptr));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        failUnavailable("EC key import unavailable");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) <= 0 || raw == nullptr) {
        failMalformed("coordinates are not a P-256 point");
    }
    EvpPkeyPtr pkey(raw);

    EvpPkeyCtxPtr check(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr));
    if (!check) {
        failUnavailable("EC key check context unavailable");
    }
    if (EVP_PKEY_public_check(check.get()) != 1) {
        failMalformed("point is not on the P-256 curve");
    }

    return PublicKeyHandle{std::move(pkey)};
}

SharedKey Crypto::deriveSharedKey(const KeyPair& own, const PublicKeyHandle& peer) {
    if (!own.pkey) {
        throw CryptoUnavailableError("Cannot derive from an empty key pair");
    }
    if (!peer.pkey) {
        throw MalformedKeyError("Peer public key was not imported");
    }

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(own.pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0) {
        failUnavailable("ECDH context unavailable");
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer.pkey.get()) <= 0) {
        failUnavailable("ECDH rejected peer key");
    }

    size_t secretLen = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secretLen) <= 0 || secretLen == 0) {
        failUnavailable("ECDH secret length query failed");
    }
    std::vector<uint8_t> secret(secretLen);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secretLen) <= 0) {
        OPENSSL_cleanse(secret.data(), secret.size());
        failUnavailable("ECDH derivation failed");
    }

    SharedKey key;
    unsigned int mdLen = 0;
    int ok = EVP_Digest(secret.data(), secretLen, key.bytes_.data(), &mdLen, EVP_sha256(), nullptr);
    OPENSSL_cleanse(secret.data(), secret.size());
    if (ok != 1 || mdLen != KEY_SIZE) {
        failUnavailable("Hashing ECDH secret failed");
    }

    Logger::instance().log(LogLevel::DEBUG, "Derived AES-256-GCM session key", "Crypto");
    return key;
}

std::string Crypto::sessionFingerprint(const PublicJwk& a, const PublicJwk& b) {
    std::string first = a.kty + ":" + a.crv + ":" + a.x + ":" + a.y;
    std::string second = b.kty + ":" + b.crv + ":" + b.x + ":" + b.y;
    if (second < first) {
        std::swap(first, second);
    }
    std::string material = first + "|" + second;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_Digest(material.data(), material.size(), md, &mdLen, EVP_sha256(), nullptr) != 1) {
        failUnavailable("Fingerprint digest failed");
    }

    std::string hex = toHex(md, 8);
    std::string formatted;
    for (size_t i = 0; i < hex.size(); ++i) {
        if (i > 0 && i % 4 == 0) {
            formatted += '-';
        }
        formatted += static_cast<char>(std::toupper(static_cast<unsigned char>(hex[i])));
    }
    return formatted;
}

} // namespace PeerBeam

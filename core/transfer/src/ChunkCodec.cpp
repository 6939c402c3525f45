#include "ChunkCodec.h"
#include "Constants.h"

#include <json/json.h>
#include <memory>

namespace PeerBeam {

namespace {

constexpr const char* kMeta = "meta";
constexpr const char* kExchangeKey = "ekey";
constexpr const char* kChunk = "chunk";
constexpr const char* kEnd = "end";

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

DecodeError unknown(const std::string& type, const std::string& message) {
    return DecodeError{ErrorCode::UnknownMessage, type, message};
}

Result<PublicJwk, DecodeError> readKey(const std::string& type, const Json::Value& value) {
    try {
        return PublicJwk::fromJson(value);
    } catch (const MalformedKeyError& e) {
        return DecodeError{ErrorCode::MalformedKey, type, e.what()};
    }
}

Result<WireMessage, DecodeError> decodeMeta(const Json::Value& root) {
    FileMetadata meta;

    if (!root["name"].isString()) {
        return unknown(kMeta, "meta.name must be a string");
    }
    meta.name = root["name"].asString();

    if (!root["size"].isUInt64()) {
        return unknown(kMeta, "meta.size must be a non-negative integer");
    }
    meta.size = root["size"].asUInt64();

    if (!root["hash"].isString()) {
        return unknown(kMeta, "meta.hash must be a string");
    }
    meta.hash = root["hash"].asString();

    const char* keyField = root.isMember("exchangePublicKey") ? "exchangePublicKey" : "ecdhPub";
    if (!root.isMember(keyField)) {
        return DecodeError{ErrorCode::MalformedKey, kMeta, "meta carries no exchange key"};
    }
    auto key = readKey(kMeta, root[keyField]);
    if (!key) {
        return key.error();
    }
    meta.senderPublicKey = std::move(key.value());
    return WireMessage{std::move(meta)};
}

Result<WireMessage, DecodeError> decodeExchangeKey(const Json::Value& root) {
    if (!root.isMember("pub")) {
        return DecodeError{ErrorCode::MalformedKey, kExchangeKey, "ekey carries no public key"};
    }
    auto key = readKey(kExchangeKey, root["pub"]);
    if (!key) {
        return key.error();
    }
    return WireMessage{ExchangeKeyMessage{std::move(key.value())}};
}

Result<WireMessage, DecodeError> decodeChunkHeader(const Json::Value& root) {
    ChunkHeader header;

    const Json::Value& iv = root["iv"];
    if (!iv.isArray() || iv.size() != header.iv.size()) {
        return unknown(kChunk, "chunk.iv must be an array of " +
                                   std::to_string(config::GCM_IV_SIZE) + " bytes");
    }
    for (Json::ArrayIndex i = 0; i < iv.size(); ++i) {
        if (!iv[i].isUInt() || iv[i].asUInt() > 0xFF) {
            return unknown(kChunk, "chunk.iv element " + std::to_string(i) + " is not a byte");
        }
        header.iv[i] = static_cast<uint8_t>(iv[i].asUInt());
    }

    if (!root["len"].isUInt64()) {
        return unknown(kChunk, "chunk.len must be a non-negative integer");
    }
    header.cipherLength = root["len"].asUInt64();
    return WireMessage{header};
}

} // namespace

std::string ChunkCodec::encodeMeta(const FileMetadata& meta) {
    Json::Value root(Json::objectValue);
    root["type"] = kMeta;
    root["name"] = meta.name;
    root["size"] = Json::UInt64(meta.size);
    root["hash"] = meta.hash;
    root["exchangePublicKey"] = meta.senderPublicKey.toJson();
    return writeCompact(root);
}

std::string ChunkCodec::encodeExchangeKey(const PublicJwk& pub) {
    Json::Value root(Json::objectValue);
    root["type"] = kExchangeKey;
    root["pub"] = pub.toJson();
    return writeCompact(root);
}

std::string ChunkCodec::encodeChunkHeader(const ChunkHeader& header) {
    Json::Value root(Json::objectValue);
    root["type"] = kChunk;
    Json::Value iv(Json::arrayValue);
    for (uint8_t byte : header.iv) {
        iv.append(Json::UInt(byte));
    }
    root["iv"] = iv;
    root["len"] = Json::UInt64(header.cipherLength);
    return writeCompact(root);
}

std::string ChunkCodec::encodeEnd() {
    Json::Value root(Json::objectValue);
    root["type"] = kEnd;
    return writeCompact(root);
}

Result<WireMessage, DecodeError> ChunkCodec::decode(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return unknown("", "text frame is not JSON: " + errors);
    }
    if (!root.isObject() || !root["type"].isString()) {
        return unknown("", "text frame has no string \"type\"");
    }

    const std::string type = root["type"].asString();
    if (type == kMeta) {
        return decodeMeta(root);
    }
    if (type == kExchangeKey) {
        return decodeExchangeKey(root);
    }
    if (type == kChunk) {
        return decodeChunkHeader(root);
    }
    if (type == kEnd) {
        return WireMessage{EndMessage{}};
    }
    return unknown(type, "unknown message type '" + type + "'");
}

const char* ChunkCodec::typeName(const WireMessage& message) {
    switch (message.index()) {
        case 0: return kMeta;
        case 1: return kExchangeKey;
        case 2: return kChunk;
        case 3: return kEnd;
    }
    return "unknown";
}

} // namespace PeerBeam

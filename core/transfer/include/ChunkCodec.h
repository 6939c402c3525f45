#pragma once

#include "Result.h"
#include "TransferTypes.h"

#include <string>
#include <variant>

namespace PeerBeam {

struct ExchangeKeyMessage {
    PublicJwk pub;
};

struct EndMessage {};

using WireMessage = std::variant<FileMetadata, ExchangeKeyMessage, ChunkHeader, EndMessage>;

/**
 * @brief Why a text frame could not be decoded
 *
 * `type` is the frame's "type" field when it was readable, so callers can
 * tell a malformed `meta` from a malformed `ekey`.
 */
struct DecodeError {
    ErrorCode code;
    std::string type;
    std::string message;

    Error toError() const { return Error{code, message}; }
};

/**
 * @brief Text-frame codec for the transfer protocol
 *
 * Wire format (one compact JSON object per text frame):
 *   {"type":"meta","name":..,"size":..,"hash":..,"exchangePublicKey":{JWK}}
 *   {"type":"ekey","pub":{JWK}}
 *   {"type":"chunk","iv":[12 bytes],"len":..}   followed by one binary frame
 *   {"type":"end"}
 *
 * `meta` from older peers may carry the key as "ecdhPub"; it is accepted on
 * decode and never written.
 */
class ChunkCodec {
public:
    static std::string encodeMeta(const FileMetadata& meta);
    static std::string encodeExchangeKey(const PublicJwk& pub);
    static std::string encodeChunkHeader(const ChunkHeader& header);
    static std::string encodeEnd();

    /**
     * @return The decoded message, or a DecodeError with
     *         - UnknownMessage: not JSON, no/unknown "type", or a bad field
     *         - MalformedKey: a meta/ekey whose JWK is structurally invalid
     */
    static Result<WireMessage, DecodeError> decode(const std::string& text);

    /// "meta", "ekey", "chunk" or "end"
    static const char* typeName(const WireMessage& message);
};

} // namespace PeerBeam

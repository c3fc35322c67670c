#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "ProtocolTypes.hpp"
#include "RpcError.hpp"

// JSON shape of the transcription channel. Audio travels as binary frames;
// everything else is a text frame with a "type" field.
namespace protocol {

nlohmann::json EncodeControlMessage(const ControlMessage& message);
nlohmann::json EncodeEndOfInput();
nlohmann::json EncodeModelSettings(const ModelSettings& settings);
ModelSettings DecodeModelSettings(const nlohmann::json& json);

nlohmann::json EncodeUnaryRequest(const std::string& method, const nlohmann::json& request);

enum class ServerFrameType {
    Result,
    Reply,
    Status,
    Unknown
};

struct ServerFrame {
    ServerFrameType type = ServerFrameType::Unknown;
    TranscriptResponse result;
    nlohmann::json reply;
    StatusCode statusCode = StatusCode::Unknown;
    std::string statusMessage;
};

// Text frame payload. Invalid UTF-8 in strings is replaced with U+FFFD
// instead of throwing.
std::string Serialize(const nlohmann::json& message);

// Throws RpcError(Internal) when the payload is not valid JSON or a known
// frame carries fields of the wrong type.
ServerFrame DecodeServerFrame(const std::string& payload);

} // namespace protocol

#include "ProtocolCodec.hpp"

using json = nlohmann::json;

const char* ModeToString(Mode mode) {
    switch (mode) {
        case Mode::Transcribe: return "transcribe";
        case Mode::Edit: return "edit";
    }
    return "transcribe";
}

bool ModeFromString(const std::string& name, Mode& mode) {
    if (name == "transcribe") {
        mode = Mode::Transcribe;
        return true;
    }
    if (name == "edit") {
        mode = Mode::Edit;
        return true;
    }
    return false;
}

const char* StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::Cancelled: return "cancelled";
        case StatusCode::Unauthenticated: return "unauthenticated";
        case StatusCode::Unavailable: return "unavailable";
        case StatusCode::InvalidArgument: return "invalid_argument";
        case StatusCode::NotFound: return "not_found";
        case StatusCode::Internal: return "internal";
        case StatusCode::Unknown: return "unknown";
    }
    return "unknown";
}

StatusCode StatusCodeFromString(const std::string& name) {
    if (name == "cancelled" || name == "canceled") return StatusCode::Cancelled;
    if (name == "unauthenticated") return StatusCode::Unauthenticated;
    if (name == "unavailable") return StatusCode::Unavailable;
    if (name == "invalid_argument") return StatusCode::InvalidArgument;
    if (name == "not_found") return StatusCode::NotFound;
    if (name == "internal") return StatusCode::Internal;
    return StatusCode::Unknown;
}

namespace protocol {

namespace {

template <typename T>
void SetIfPresent(json& target, const char* key, const std::optional<T>& value) {
    if (value) {
        target[key] = *value;
    }
}

template <typename T>
void ReadIfPresent(const json& source, const char* key, std::optional<T>& value) {
    auto it = source.find(key);
    if (it != source.end() && !it->is_null()) {
        value = it->get<T>();
    }
}

// Missing and null read as empty; any other non-string is a malformed frame.
std::string StringField(const json& source, const char* key) {
    if (!source.is_object()) {
        throw RpcError(StatusCode::Internal, std::string("Malformed server frame: no object around \"") + key + "\"");
    }
    auto it = source.find(key);
    if (it == source.end() || it->is_null()) {
        return std::string();
    }
    return it->get<std::string>();
}

json EncodeModeUpdate(const ModeUpdate& update) {
    return {
        {"type", "config"},
        {"context", {{"mode", ModeToString(update.mode)}}}
    };
}

json EncodeConfigSnapshot(const ConfigSnapshot& snapshot) {
    json message = {
        {"type", "config"},
        {"context", {
            {"windowTitle", snapshot.windowTitle},
            {"appName", snapshot.appName},
            {"contextText", snapshot.selectedText}
        }},
        {"vocabulary", snapshot.vocabulary}
    };

    json settings = EncodeModelSettings(snapshot.modelSettings);
    if (!settings.empty()) {
        message["llmSettings"] = std::move(settings);
    }
    return message;
}

} // namespace

json EncodeModelSettings(const ModelSettings& settings) {
    json out = json::object();
    SetIfPresent(out, "asrModel", settings.asrModel);
    SetIfPresent(out, "asrProvider", settings.asrProvider);
    SetIfPresent(out, "asrPrompt", settings.asrPrompt);
    SetIfPresent(out, "noSpeechThreshold", settings.noSpeechThreshold);
    SetIfPresent(out, "llmProvider", settings.llmProvider);
    SetIfPresent(out, "llmModel", settings.llmModel);
    SetIfPresent(out, "llmTemperature", settings.llmTemperature);
    SetIfPresent(out, "transcriptionPrompt", settings.transcriptionPrompt);
    SetIfPresent(out, "editingPrompt", settings.editingPrompt);
    return out;
}

ModelSettings DecodeModelSettings(const json& source) {
    ModelSettings settings;
    if (!source.is_object()) {
        return settings;
    }
    ReadIfPresent(source, "asrModel", settings.asrModel);
    ReadIfPresent(source, "asrProvider", settings.asrProvider);
    ReadIfPresent(source, "asrPrompt", settings.asrPrompt);
    ReadIfPresent(source, "noSpeechThreshold", settings.noSpeechThreshold);
    ReadIfPresent(source, "llmProvider", settings.llmProvider);
    ReadIfPresent(source, "llmModel", settings.llmModel);
    ReadIfPresent(source, "llmTemperature", settings.llmTemperature);
    ReadIfPresent(source, "transcriptionPrompt", settings.transcriptionPrompt);
    ReadIfPresent(source, "editingPrompt", settings.editingPrompt);
    return settings;
}

json EncodeControlMessage(const ControlMessage& message) {
    if (std::holds_alternative<ModeUpdate>(message)) {
        return EncodeModeUpdate(std::get<ModeUpdate>(message));
    }
    return EncodeConfigSnapshot(std::get<ConfigSnapshot>(message));
}

json EncodeEndOfInput() {
    return {{"type", "end"}};
}

json EncodeUnaryRequest(const std::string& method, const json& request) {
    return {
        {"method", method},
        {"request", request}
    };
}

std::string Serialize(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

ServerFrame DecodeServerFrame(const std::string& payload) {
    json message;
    try {
        message = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw RpcError(StatusCode::Internal, std::string("Malformed server frame: ") + e.what());
    }

    ServerFrame frame;
    if (!message.is_object()) {
        return frame;
    }

    try {
        std::string type = StringField(message, "type");
        if (type == "result") {
            frame.type = ServerFrameType::Result;
            frame.result.transcript = StringField(message, "transcript");
            auto error = message.find("error");
            if (error != message.end() && !error->is_null()) {
                TranscriptError transcriptError;
                transcriptError.code = StringField(*error, "code");
                transcriptError.message = StringField(*error, "message");
                frame.result.error = transcriptError;
            }
        } else if (type == "reply") {
            frame.type = ServerFrameType::Reply;
            auto response = message.find("response");
            if (response == message.end() || response->is_null()) {
                frame.reply = json::object();
            } else if (response->is_object()) {
                frame.reply = *response;
            } else {
                throw RpcError(StatusCode::Internal, "Malformed server frame: reply is not an object");
            }
        } else if (type == "status") {
            frame.type = ServerFrameType::Status;
            frame.statusCode = StatusCodeFromString(StringField(message, "code"));
            frame.statusMessage = StringField(message, "message");
        }
    } catch (const json::exception& e) {
        throw RpcError(StatusCode::Internal, std::string("Malformed server frame: ") + e.what());
    }
    return frame;
}

} // namespace protocol

#include "Protocol/ProtocolCodec.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

TEST(ProtocolCodecTest, ModeUpdateCarriesOnlyTheMode) {
    json encoded = protocol::EncodeControlMessage(ModeUpdate{Mode::Edit});

    json expected = {{"type", "config"}, {"context", {{"mode", "edit"}}}};
    EXPECT_EQ(encoded, expected);
    EXPECT_FALSE(encoded.contains("vocabulary"));
    EXPECT_FALSE(encoded.contains("llmSettings"));
    EXPECT_EQ(encoded["context"].size(), 1u);
}

TEST(ProtocolCodecTest, SnapshotWritesContextAndOnlySetSettings) {
    ConfigSnapshot snapshot;
    snapshot.windowTitle = "notes.txt - Editor";
    snapshot.appName = "Editor";
    snapshot.selectedText = "teh quick fox";
    snapshot.vocabulary = {"Kubernetes", "gRPC"};
    snapshot.modelSettings.llmModel = "llama-3";
    snapshot.modelSettings.llmTemperature = 0.2;

    json encoded = protocol::EncodeControlMessage(snapshot);

    EXPECT_EQ(encoded["type"], "config");
    EXPECT_EQ(encoded["context"]["windowTitle"], "notes.txt - Editor");
    EXPECT_EQ(encoded["context"]["appName"], "Editor");
    EXPECT_EQ(encoded["context"]["contextText"], "teh quick fox");
    EXPECT_FALSE(encoded["context"].contains("mode"));
    EXPECT_EQ(encoded["vocabulary"], json::array({"Kubernetes", "gRPC"}));

    ASSERT_TRUE(encoded.contains("llmSettings"));
    EXPECT_EQ(encoded["llmSettings"].size(), 2u);
    EXPECT_EQ(encoded["llmSettings"]["llmModel"], "llama-3");
    EXPECT_DOUBLE_EQ(encoded["llmSettings"]["llmTemperature"].get<double>(), 0.2);
}

TEST(ProtocolCodecTest, SnapshotWithoutSettingsOmitsThem) {
    json encoded = protocol::EncodeControlMessage(ConfigSnapshot{});
    EXPECT_FALSE(encoded.contains("llmSettings"));
}

TEST(ProtocolCodecTest, ModelSettingsDecodeIgnoresNullsAndUnknownKeys) {
    json source = {
        {"asrModel", "whisper-large"},
        {"noSpeechThreshold", 0.6},
        {"llmProvider", nullptr},
        {"somethingElse", 1}
    };

    ModelSettings settings = protocol::DecodeModelSettings(source);
    EXPECT_EQ(settings.asrModel, std::optional<std::string>("whisper-large"));
    EXPECT_EQ(settings.noSpeechThreshold, std::optional<double>(0.6));
    EXPECT_FALSE(settings.llmProvider.has_value());
    EXPECT_FALSE(settings.editingPrompt.has_value());
}

TEST(ProtocolCodecTest, EndOfInputAndUnaryRequest) {
    EXPECT_EQ(protocol::EncodeEndOfInput(), json({{"type", "end"}}));

    json request = protocol::EncodeUnaryRequest("DeleteInteraction", {{"id", "abc"}});
    EXPECT_EQ(request["method"], "DeleteInteraction");
    EXPECT_EQ(request["request"]["id"], "abc");
}

TEST(ProtocolCodecTest, DecodesResultWithError) {
    auto frame = protocol::DecodeServerFrame(
        R"({"type":"result","transcript":"","error":{"code":"NO_SPEECH","message":"nothing heard"}})");

    EXPECT_EQ(frame.type, protocol::ServerFrameType::Result);
    EXPECT_EQ(frame.result.transcript, "");
    ASSERT_TRUE(frame.result.error.has_value());
    EXPECT_EQ(frame.result.error->code, "NO_SPEECH");
    EXPECT_EQ(frame.result.error->message, "nothing heard");
}

TEST(ProtocolCodecTest, DecodesReplyAndStatus) {
    auto reply = protocol::DecodeServerFrame(R"({"type":"reply","response":{"ok":true}})");
    EXPECT_EQ(reply.type, protocol::ServerFrameType::Reply);
    EXPECT_TRUE(reply.reply["ok"].get<bool>());

    auto status = protocol::DecodeServerFrame(R"({"type":"status","code":"unauthenticated","message":"expired"})");
    EXPECT_EQ(status.type, protocol::ServerFrameType::Status);
    EXPECT_EQ(status.statusCode, StatusCode::Unauthenticated);
    EXPECT_EQ(status.statusMessage, "expired");
}

TEST(ProtocolCodecTest, UnknownFramesAndMalformedJson) {
    EXPECT_EQ(protocol::DecodeServerFrame(R"({"type":"progress"})").type, protocol::ServerFrameType::Unknown);
    EXPECT_EQ(protocol::DecodeServerFrame("[1,2]").type, protocol::ServerFrameType::Unknown);

    try {
        protocol::DecodeServerFrame("{not json");
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_EQ(e.Code(), StatusCode::Internal);
    }
}

TEST(ProtocolCodecTest, NullFieldsReadAsEmpty) {
    auto frame = protocol::DecodeServerFrame(R"({"type":"result","transcript":null,"error":null})");
    EXPECT_EQ(frame.type, protocol::ServerFrameType::Result);
    EXPECT_EQ(frame.result.transcript, "");
    EXPECT_FALSE(frame.result.error.has_value());

    auto reply = protocol::DecodeServerFrame(R"({"type":"reply","response":null})");
    EXPECT_TRUE(reply.reply.is_object());
    EXPECT_TRUE(reply.reply.empty());
}

TEST(ProtocolCodecTest, WrongFieldTypesAreMalformedFrames) {
    const char* payloads[] = {
        R"({"type":"result","transcript":42})",
        R"({"type":"result","transcript":"hi","error":{"code":7,"message":"x"}})",
        R"({"type":"result","transcript":"hi","error":"no speech"})",
        R"({"type":"status","code":13,"message":"boom"})",
        R"({"type":"reply","response":[1,2]})",
        R"({"type":5})"
    };
    for (const char* payload : payloads) {
        try {
            protocol::DecodeServerFrame(payload);
            FAIL() << "expected RpcError for " << payload;
        } catch (const RpcError& e) {
            EXPECT_EQ(e.Code(), StatusCode::Internal) << payload;
        }
    }
}

TEST(ProtocolCodecTest, SerializeReplacesInvalidUtf8) {
    ConfigSnapshot snapshot;
    snapshot.selectedText = "caf\xFF \xFE";
    json encoded = protocol::EncodeControlMessage(snapshot);

    std::string text;
    ASSERT_NO_THROW(text = protocol::Serialize(encoded));
    json parsed = json::parse(text);
    EXPECT_EQ(parsed["context"]["contextText"].get<std::string>(), "caf\xEF\xBF\xBD \xEF\xBF\xBD");

    EXPECT_EQ(protocol::Serialize(protocol::EncodeEndOfInput()), R"({"type":"end"})");
}

TEST(ProtocolCodecTest, ModeAndStatusNames) {
    Mode mode = Mode::Transcribe;
    EXPECT_TRUE(ModeFromString("edit", mode));
    EXPECT_EQ(mode, Mode::Edit);
    EXPECT_FALSE(ModeFromString("shout", mode));
    EXPECT_EQ(mode, Mode::Edit);
    EXPECT_STREQ(ModeToString(Mode::Transcribe), "transcribe");

    EXPECT_EQ(StatusCodeFromString("canceled"), StatusCode::Cancelled);
    EXPECT_EQ(StatusCodeFromString("bogus"), StatusCode::Unknown);
    EXPECT_STREQ(StatusCodeToString(StatusCode::NotFound), "not_found");
}

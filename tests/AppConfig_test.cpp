#include "Auth/FileAuthProvider.hpp"
#include "Config/AppConfig.hpp"
#include "common/RandomId.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <filesystem>
#include <fstream>

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& contents)
        : _path(std::filesystem::temp_directory_path() / ("dictation_" + GenerateRandomId(8))) {
        Write(contents);
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(_path, ec);
    }

    void Write(const std::string& contents) {
        std::ofstream out(_path, std::ios::trunc);
        out << contents;
    }

    std::string Path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

} // namespace

TEST(AppConfigTest, MissingFileGivesDefaults) {
    AppConfig config = AppConfig::LoadFile("/nonexistent/dictation.json");
    EXPECT_EQ(config.serverUrl, "ws://localhost:8080");
    EXPECT_FALSE(config.grammarServiceEnabled);
    EXPECT_EQ(config.responseTimeout.count(), 30000);
    EXPECT_TRUE(config.cursorContextCommand.empty());
    EXPECT_TRUE(config.syncDictionary);
}

TEST(AppConfigTest, ReadsKnownKeys) {
    TempFile file(R"({
        "server_url": "ws://dictation.example:9000",
        "device_id": "4",
        "grammar_service_enabled": true,
        "vocabulary": ["Kubernetes", "gRPC"],
        "model_settings": {"llmModel": "llama-3", "llmTemperature": 0.1},
        "response_timeout_ms": 2500,
        "cursor_context_command": "cat /tmp/before-cursor",
        "sync_dictionary": false
    })");

    AppConfig config = AppConfig::LoadFile(file.Path());
    EXPECT_EQ(config.serverUrl, "ws://dictation.example:9000");
    EXPECT_EQ(config.deviceId, "4");
    EXPECT_TRUE(config.grammarServiceEnabled);
    ASSERT_EQ(config.vocabulary.size(), 2u);
    EXPECT_EQ(config.modelSettings.llmModel, std::optional<std::string>("llama-3"));
    EXPECT_EQ(config.responseTimeout.count(), 2500);
    EXPECT_EQ(config.cursorContextCommand, "cat /tmp/before-cursor");
    EXPECT_FALSE(config.syncDictionary);
}

TEST(AppConfigTest, MalformedFileThrows) {
    TempFile broken("{ \"server_url\": ");
    EXPECT_THROW(AppConfig::LoadFile(broken.Path()), ConfigError);

    TempFile wrongType(R"({"upload_interactions": "yes"})");
    EXPECT_THROW(AppConfig::LoadFile(wrongType.Path()), ConfigError);

    TempFile notObject("[1, 2, 3]");
    EXPECT_THROW(AppConfig::LoadFile(notObject.Path()), ConfigError);
}

TEST(AppConfigTest, CommandLineOverridesFile) {
    TempFile file(R"({"server_url": "ws://from-file:1", "device_id": "2"})");
    std::string path = file.Path();

    std::vector<std::string> args = {"dictation_client", "--config", path, "--server", "ws://cli:2", "--list-devices"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }

    AppConfig config = AppConfig::FromCommandLine(static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(config.serverUrl, "ws://cli:2");
    EXPECT_EQ(config.deviceId, "2");
    EXPECT_TRUE(config.listDevices);
}

TEST(AppConfigTest, UnknownOptionThrows) {
    std::string program = "dictation_client";
    std::string bogus = "--bogus";
    char* argv[] = {&program[0], &bogus[0]};
    EXPECT_THROW(AppConfig::FromCommandLine(2, argv), ConfigError);

    std::string server = "--server";
    char* incomplete[] = {&program[0], &server[0]};
    EXPECT_THROW(AppConfig::FromCommandLine(2, incomplete), ConfigError);
}

TEST(FileAuthProviderTest, RefreshNeedsANewToken) {
    TempFile token("token-one\n");
    FileAuthProvider auth(token.Path());

    EXPECT_TRUE(auth.IsSignedIn());
    EXPECT_EQ(auth.AccessToken(), "token-one");
    EXPECT_FALSE(auth.RefreshTokens().has_value());

    token.Write("token-two");
    auto tokens = auth.RefreshTokens();
    ASSERT_TRUE(tokens.has_value());
    EXPECT_EQ(tokens->accessToken, "token-two");
    EXPECT_EQ(auth.AccessToken(), "token-two");

    auth.OnAuthInvalidated();
    EXPECT_FALSE(auth.IsSignedIn());
    EXPECT_TRUE(auth.AccessToken().empty());
}

TEST(RandomIdTest, AlphanumericOfRequestedLength) {
    std::string id = GenerateRandomId();
    EXPECT_EQ(id.size(), interaction_id_size);
    for (char c : id) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << c;
    }
    EXPECT_NE(GenerateRandomId(), GenerateRandomId());
}

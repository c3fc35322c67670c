#include "Context/ConfigContextProvider.hpp"
#include "TextInsertion/CommandTextInserter.hpp"
#include "common/RandomId.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

TEST(ConfigContextProviderTest, SnapshotFromConfig) {
    AppConfig config;
    config.windowTitle = "notes.txt";
    config.appName = "Editor";
    config.vocabulary = {"Kubernetes"};
    config.modelSettings.asrModel = "whisper-large";
    config.selectedTextCommand = "printf 'teh text'";

    ConfigContextProvider provider(config);

    ConfigSnapshot transcribe = provider.GatherContext(Mode::Transcribe);
    EXPECT_EQ(transcribe.windowTitle, "notes.txt");
    EXPECT_EQ(transcribe.appName, "Editor");
    EXPECT_EQ(transcribe.vocabulary, std::vector<std::string>{"Kubernetes"});
    EXPECT_EQ(transcribe.modelSettings.asrModel, std::optional<std::string>("whisper-large"));
    EXPECT_TRUE(transcribe.selectedText.empty());

    ConfigSnapshot edit = provider.GatherContext(Mode::Edit);
    EXPECT_EQ(edit.selectedText, "teh text");
}

TEST(ConfigContextProviderTest, FailingCommandLeavesSelectionEmpty) {
    AppConfig config;
    config.selectedTextCommand = "exit 3";

    ConfigContextProvider provider(config);
    EXPECT_TRUE(provider.GatherContext(Mode::Edit).selectedText.empty());
    EXPECT_TRUE(provider.GetCursorContext(10).empty());
}

TEST(ConfigContextProviderTest, CursorContextIsTheTailOfTheCommandOutput) {
    AppConfig config;
    config.cursorContextCommand = "printf 'The meeting ended. '";

    ConfigContextProvider provider(config);
    EXPECT_EQ(provider.GetCursorContext(10), "ng ended. ");
    EXPECT_EQ(provider.GetCursorContext(100), "The meeting ended. ");
    EXPECT_TRUE(provider.GetCursorContext(0).empty());
}

TEST(ConfigContextProviderTest, CursorContextKeepsWholeCharacters) {
    AppConfig config;
    config.cursorContextCommand = "printf 'caf\\303\\251 '";

    ConfigContextProvider provider(config);
    EXPECT_EQ(provider.GetCursorContext(2), "\xC3\xA9 ");
}

TEST(ConfigContextProviderTest, DictionaryAndSettingsAreMergedOverConfig) {
    auto transport = std::make_shared<test_utils::FakeTransport>();
    auto auth = std::make_shared<test_utils::FakeAuthProvider>();
    auto records = std::make_shared<RecordsClient>(std::make_shared<RetryingRpcClient>(transport, auth));

    transport->replies["ListDictionaryItems"] = {{"items", {
        {{"id", "1"}, {"word", "Kubernetes"}},
        {{"id", "2"}, {"word", "Terraform"}},
        {{"id", "3"}, {"word", "removed"}, {"deletedAt", "2024-01-01T00:00:00Z"}}
    }}};
    transport->replies["GetAdvancedSettings"] = {{"llm", {
        {"llmModel", "remote-model"},
        {"asrPrompt", "technical vocabulary"}
    }}};

    AppConfig config;
    config.vocabulary = {"Kubernetes", "gRPC"};
    config.modelSettings.llmModel = "configured-model";

    ConfigContextProvider provider(config, records);
    ConfigSnapshot snapshot = provider.GatherContext(Mode::Transcribe);

    EXPECT_EQ(snapshot.vocabulary, (std::vector<std::string>{"Kubernetes", "gRPC", "Terraform"}));
    EXPECT_EQ(snapshot.modelSettings.llmModel, std::optional<std::string>("configured-model"));
    EXPECT_EQ(snapshot.modelSettings.asrPrompt, std::optional<std::string>("technical vocabulary"));
    EXPECT_EQ(transport->methods, (std::vector<std::string>{"ListDictionaryItems", "GetAdvancedSettings"}));
}

TEST(ConfigContextProviderTest, UnreachableServerFallsBackToConfig) {
    auto transport = std::make_shared<test_utils::FakeTransport>();
    auto auth = std::make_shared<test_utils::FakeAuthProvider>();
    auto records = std::make_shared<RecordsClient>(std::make_shared<RetryingRpcClient>(transport, auth));
    transport->FailNext(StatusCode::Unavailable, "server down");
    transport->FailNext(StatusCode::Unavailable, "server down");

    AppConfig config;
    config.vocabulary = {"gRPC"};
    config.modelSettings.asrModel = "whisper-large";

    ConfigContextProvider provider(config, records);
    ConfigSnapshot snapshot;
    ASSERT_NO_THROW(snapshot = provider.GatherContext(Mode::Transcribe));

    EXPECT_EQ(snapshot.vocabulary, std::vector<std::string>{"gRPC"});
    EXPECT_EQ(snapshot.modelSettings.asrModel, std::optional<std::string>("whisper-large"));
    EXPECT_FALSE(snapshot.modelSettings.llmModel.has_value());
    EXPECT_EQ(transport->callAttempts, 2);
}

TEST(CommandTextInserterTest, PrintsWithoutCommand) {
    std::ostringstream out;
    CommandTextInserter inserter("", out);

    EXPECT_TRUE(inserter.InsertText("hello"));
    EXPECT_EQ(out.str(), "[TRANSCRIPT] hello\n");
    EXPECT_FALSE(inserter.InsertText(""));
}

TEST(CommandTextInserterTest, PipesToCommand) {
    auto path = std::filesystem::temp_directory_path() / ("dictation_insert_" + GenerateRandomId(8));
    CommandTextInserter inserter("cat > '" + path.string() + "'");

    ASSERT_TRUE(inserter.InsertText("typed text"));

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "typed text");

    std::error_code ec;
    std::filesystem::remove(path, ec);

    CommandTextInserter failing("cat > /dev/null; exit 1");
    EXPECT_FALSE(failing.InsertText("ignored"));
}

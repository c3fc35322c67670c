#include "Persistence/FileInteractionStore.hpp"
#include "common/RandomId.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sndfile.h>

#include <filesystem>
#include <fstream>

namespace {

class FileInteractionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        _dir = std::filesystem::temp_directory_path() / ("dictation_store_" + GenerateRandomId(8));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(_dir, ec);
    }

    nlohmann::json ReadMetadata(const FileInteractionStore& store, const std::string& id) {
        std::ifstream in(store.MetadataPath(id));
        return nlohmann::json::parse(in);
    }

    std::filesystem::path _dir;
};

} // namespace

TEST_F(FileInteractionStoreTest, WritesWavAndMetadata) {
    FileInteractionStore store(_dir.string());

    InteractionRecord record;
    record.id = "rec1";
    record.transcript = "hello world";
    record.sampleRate = 16000;
    record.durationMs = 1234;
    // Samples 1, -2, 300 as little-endian PCM16.
    record.audio = {0x01, 0x00, 0xFE, 0xFF, 0x2C, 0x01};

    ASSERT_TRUE(store.CreateInteraction(record));

    SF_INFO info{};
    SNDFILE* file = sf_open(store.WavPath("rec1").c_str(), SFM_READ, &info);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(info.samplerate, 16000);
    EXPECT_EQ(info.channels, 1);
    EXPECT_EQ(info.frames, 3);
    short samples[3] = {0, 0, 0};
    EXPECT_EQ(sf_read_short(file, samples, 3), 3);
    sf_close(file);
    EXPECT_EQ(samples[0], 1);
    EXPECT_EQ(samples[1], -2);
    EXPECT_EQ(samples[2], 300);

    auto metadata = ReadMetadata(store, "rec1");
    EXPECT_EQ(metadata["id"], "rec1");
    EXPECT_EQ(metadata["title"], "hello world");
    EXPECT_EQ(metadata["asr_output"]["transcript"], "hello world");
    EXPECT_TRUE(metadata["llm_output"].is_null());
    EXPECT_EQ(metadata["duration_ms"], 1234);
    EXPECT_EQ(metadata["audio_file"], "rec1.wav");
    EXPECT_FALSE(metadata["created_at"].get<std::string>().empty());
}

TEST_F(FileInteractionStoreTest, FailedAttemptWithoutAudio) {
    FileInteractionStore store(_dir.string());

    InteractionRecord record;
    record.id = "rec2";
    record.errorMessage = "connection lost";

    ASSERT_TRUE(store.CreateInteraction(record));
    EXPECT_FALSE(std::filesystem::exists(store.WavPath("rec2")));

    auto metadata = ReadMetadata(store, "rec2");
    EXPECT_EQ(metadata["title"], "No transcript");
    EXPECT_TRUE(metadata["asr_output"].is_null());
    EXPECT_EQ(metadata["llm_output"]["error"], "connection lost");
    EXPECT_TRUE(metadata["audio_file"].is_null());
}

TEST_F(FileInteractionStoreTest, RecordWithoutIdIsRejected) {
    FileInteractionStore store(_dir.string());
    EXPECT_FALSE(store.CreateInteraction(InteractionRecord{}));
}

TEST_F(FileInteractionStoreTest, MultiByteTranscriptKeepsWholeCharactersInTitle) {
    FileInteractionStore store(_dir.string());

    std::string transcript;
    for (int i = 0; i < 60; ++i) {
        transcript += "\xE4\xB8\xAD";
    }
    InteractionRecord record;
    record.id = "rec3";
    record.transcript = transcript;

    ASSERT_TRUE(store.CreateInteraction(record));

    auto metadata = ReadMetadata(store, "rec3");
    EXPECT_EQ(metadata["title"].get<std::string>(), transcript.substr(0, 150));
    EXPECT_EQ(metadata["asr_output"]["transcript"].get<std::string>(), transcript);
}

TEST_F(FileInteractionStoreTest, InvalidUtf8TranscriptIsStillSaved) {
    FileInteractionStore store(_dir.string());

    InteractionRecord record;
    record.id = "rec4";
    record.transcript = "bad \xFF\xFE bytes";

    EXPECT_TRUE(store.CreateInteraction(record));

    auto metadata = ReadMetadata(store, "rec4");
    EXPECT_EQ(metadata["id"], "rec4");
    EXPECT_EQ(metadata["asr_output"]["transcript"].get<std::string>(),
              "bad \xEF\xBF\xBD\xEF\xBF\xBD bytes");
}

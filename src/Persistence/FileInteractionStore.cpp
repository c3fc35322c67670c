#include "FileInteractionStore.hpp"
#include "../common/debug_log.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sndfile.h>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string CurrentTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // namespace

FileInteractionStore::FileInteractionStore(std::string directory, std::shared_ptr<RecordsClient> uploader)
    : _directory(std::move(directory)), _uploader(std::move(uploader)) {
}

std::string FileInteractionStore::WavPath(const std::string& id) const {
    return (std::filesystem::path(_directory) / (id + ".wav")).string();
}

std::string FileInteractionStore::MetadataPath(const std::string& id) const {
    return (std::filesystem::path(_directory) / (id + ".json")).string();
}

bool FileInteractionStore::CreateInteraction(const InteractionRecord& record) {
    if (record.id.empty()) {
        LOG_ERROR("[FileInteractionStore] Interaction without id");
        return false;
    }
    if (!EnsureDirectory()) {
        return false;
    }

    bool hasAudio = !record.audio.empty() && WriteWav(record);
    bool saved = WriteMetadata(record, hasAudio);

    if (_uploader) {
        Upload(record);
    }

    if (saved) {
        LOG_INFO("[FileInteractionStore] Saved interaction " << record.id
                 << (record.errorMessage ? " (failed attempt)" : ""));
    }
    return saved;
}

bool FileInteractionStore::EnsureDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(_directory, ec);
    if (ec) {
        LOG_ERROR("[FileInteractionStore] Could not create " << _directory << ": " << ec.message());
        return false;
    }
    return true;
}

bool FileInteractionStore::WriteWav(const InteractionRecord& record) {
    if (record.sampleRate == 0) {
        LOG_ERROR("[FileInteractionStore] Sample rate must be specified");
        return false;
    }

    std::vector<int16_t> samples(record.audio.size() / PCM_BYTES_PER_SAMPLE);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(record.audio[2 * i] | (record.audio[2 * i + 1] << 8));
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(record.sampleRate);
    sfinfo.channels = 1;
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    std::string filename = WavPath(record.id);
    SNDFILE* outfile = sf_open(filename.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        LOG_ERROR("[FileInteractionStore] Could not open output file: " << filename
                  << " (" << sf_strerror(nullptr) << ")");
        return false;
    }

    sf_count_t framesWritten = sf_write_short(outfile, samples.data(), static_cast<sf_count_t>(samples.size()));
    sf_close(outfile);

    if (framesWritten != static_cast<sf_count_t>(samples.size())) {
        LOG_ERROR("[FileInteractionStore] Wrote " << framesWritten << " samples, expected " << samples.size());
        return false;
    }

    DEBUG_LOG("[FileInteractionStore] Saved " << samples.size() << " samples to " << filename);
    return true;
}

bool FileInteractionStore::WriteMetadata(const InteractionRecord& record, bool hasAudio) {
    std::string serialized;
    try {
        serialized = BuildMetadata(record, hasAudio).dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        LOG_ERROR("[FileInteractionStore] Could not serialize metadata for " << record.id << ": " << e.what());
        return false;
    }

    std::string filename = MetadataPath(record.id);
    std::ofstream out(filename);
    if (!out.is_open()) {
        LOG_ERROR("[FileInteractionStore] Could not open output file: " << filename);
        return false;
    }
    out << serialized << std::endl;
    if (!out) {
        LOG_ERROR("[FileInteractionStore] Failed writing " << filename);
        return false;
    }
    return true;
}

nlohmann::json FileInteractionStore::BuildMetadata(const InteractionRecord& record, bool hasAudio) {
    return {
        {"id", record.id},
        {"title", RecordsClient::MakeTitle(record.transcript)},
        {"asr_output", record.transcript.empty() ? json(nullptr) : json{{"transcript", record.transcript}}},
        {"llm_output", record.errorMessage ? json{{"error", *record.errorMessage}} : json(nullptr)},
        {"duration_ms", record.durationMs},
        {"sample_rate", record.sampleRate},
        {"audio_file", hasAudio ? json(record.id + ".wav") : json(nullptr)},
        {"created_at", CurrentTimestamp()}
    };
}

bool FileInteractionStore::Upload(const InteractionRecord& record) {
    try {
        _uploader->CreateInteraction(record);
        DEBUG_LOG("[FileInteractionStore] Uploaded interaction " << record.id);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("[FileInteractionStore] Upload of " << record.id << " failed: " << e.what());
        return false;
    }
}

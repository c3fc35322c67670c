#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "IInteractionStore.hpp"

// Writes <dir>/<id>.wav (PCM16 mono) and <dir>/<id>.json, and optionally
// uploads the record.
class FileInteractionStore : public IInteractionStore {
public:
    FileInteractionStore(std::string directory, std::shared_ptr<RecordsClient> uploader = nullptr);

    bool CreateInteraction(const InteractionRecord& record) override;

    std::string WavPath(const std::string& id) const;
    std::string MetadataPath(const std::string& id) const;

private:
    bool EnsureDirectory();
    bool WriteWav(const InteractionRecord& record);
    bool WriteMetadata(const InteractionRecord& record, bool hasAudio);
    static nlohmann::json BuildMetadata(const InteractionRecord& record, bool hasAudio);
    bool Upload(const InteractionRecord& record);

    std::string _directory;
    std::shared_ptr<RecordsClient> _uploader;
};

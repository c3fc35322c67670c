#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "RetryingRpcClient.hpp"
#include "../Protocol/ProtocolTypes.hpp"

struct InteractionRecord {
    std::string id;
    std::string transcript;
    std::vector<uint8_t> audio;
    unsigned int sampleRate = DEFAULT_SAMPLE_RATE;
    std::optional<std::string> errorMessage;
    int64_t durationMs = 0;
};

struct RemoteInteraction {
    std::string id;
    std::string title;
    std::string createdAt;
    std::string updatedAt;
    std::optional<std::string> deletedAt;
};

struct DictionaryItem {
    std::string id;
    std::string word;
    std::string pronunciation;
    std::optional<std::string> deletedAt;
};

// Record sync and settings retrieval. All calls go through the auth retry
// wrapper and throw RpcError.
class RecordsClient {
public:
    explicit RecordsClient(std::shared_ptr<RetryingRpcClient> rpc);

    void CreateInteraction(const InteractionRecord& record);
    void UpdateInteraction(const std::string& id, const std::string& title);
    void DeleteInteraction(const std::string& id);
    std::vector<RemoteInteraction> ListInteractionsSince(const std::string& since);

    void CreateDictionaryItem(const DictionaryItem& item);
    void DeleteDictionaryItem(const std::string& id);
    std::vector<DictionaryItem> ListDictionaryItemsSince(const std::string& since);

    ModelSettings GetAdvancedSettings();

    static constexpr size_t TITLE_LENGTH = 50;

    // Interaction title: first TITLE_LENGTH code points of the UTF-8
    // transcript.
    static std::string MakeTitle(const std::string& transcript);

private:
    std::shared_ptr<RetryingRpcClient> _rpc;
};

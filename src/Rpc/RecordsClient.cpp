#include "RecordsClient.hpp"
#include "../Protocol/ProtocolCodec.hpp"

using json = nlohmann::json;

namespace {

std::optional<std::string> OptionalString(const json& source, const char* key) {
    auto it = source.find(key);
    if (it == source.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

RecordsClient::RecordsClient(std::shared_ptr<RetryingRpcClient> rpc)
    : _rpc(std::move(rpc)) {
}

std::string RecordsClient::MakeTitle(const std::string& transcript) {
    if (transcript.empty()) {
        return "No transcript";
    }
    // Cut on a code point boundary; continuation bytes look like 10xxxxxx.
    size_t codePoints = 0;
    for (size_t i = 0; i < transcript.size(); ++i) {
        if ((static_cast<unsigned char>(transcript[i]) & 0xC0) != 0x80 && ++codePoints > TITLE_LENGTH) {
            return transcript.substr(0, i);
        }
    }
    return transcript;
}

void RecordsClient::CreateInteraction(const InteractionRecord& record) {
    json request = {
        {"id", record.id},
        {"title", MakeTitle(record.transcript)},
        {"asrOutput", record.transcript.empty() ? json::object() : json{{"transcript", record.transcript}}},
        {"llmOutput", record.errorMessage ? json{{"error", *record.errorMessage}} : json::object()},
        {"rawAudio", record.audio},
        {"sampleRate", record.sampleRate},
        {"durationMs", record.durationMs}
    };
    _rpc->Call("CreateInteraction", request);
}

void RecordsClient::UpdateInteraction(const std::string& id, const std::string& title) {
    _rpc->Call("UpdateInteraction", {{"id", id}, {"title", title}});
}

void RecordsClient::DeleteInteraction(const std::string& id) {
    _rpc->Call("DeleteInteraction", {{"id", id}});
}

std::vector<RemoteInteraction> RecordsClient::ListInteractionsSince(const std::string& since) {
    json response = _rpc->Call("ListInteractions", {{"sinceTimestamp", since}});

    std::vector<RemoteInteraction> interactions;
    for (const auto& entry : response.value("interactions", json::array())) {
        RemoteInteraction interaction;
        interaction.id = entry.value("id", "");
        interaction.title = entry.value("title", "");
        interaction.createdAt = entry.value("createdAt", "");
        interaction.updatedAt = entry.value("updatedAt", "");
        interaction.deletedAt = OptionalString(entry, "deletedAt");
        interactions.push_back(std::move(interaction));
    }
    return interactions;
}

void RecordsClient::CreateDictionaryItem(const DictionaryItem& item) {
    _rpc->Call("CreateDictionaryItem", {
        {"id", item.id},
        {"word", item.word},
        {"pronunciation", item.pronunciation}
    });
}

void RecordsClient::DeleteDictionaryItem(const std::string& id) {
    _rpc->Call("DeleteDictionaryItem", {{"id", id}});
}

std::vector<DictionaryItem> RecordsClient::ListDictionaryItemsSince(const std::string& since) {
    json response = _rpc->Call("ListDictionaryItems", {{"sinceTimestamp", since}});

    std::vector<DictionaryItem> items;
    for (const auto& entry : response.value("items", json::array())) {
        DictionaryItem item;
        item.id = entry.value("id", "");
        item.word = entry.value("word", "");
        item.pronunciation = entry.value("pronunciation", "");
        item.deletedAt = OptionalString(entry, "deletedAt");
        items.push_back(std::move(item));
    }
    return items;
}

ModelSettings RecordsClient::GetAdvancedSettings() {
    json response = _rpc->Call("GetAdvancedSettings", json::object());
    return protocol::DecodeModelSettings(response.value("llm", json::object()));
}

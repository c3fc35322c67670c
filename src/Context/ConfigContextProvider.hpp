#pragma once

#include <memory>
#include <string>
#include <vector>

#include "IContextProvider.hpp"
#include "../Config/AppConfig.hpp"
#include "../Rpc/RecordsClient.hpp"

// Context taken from configuration. Selected text and the text before the
// cursor come from external commands; selected text is only gathered in
// Edit mode. With a records client the user's dictionary and advanced
// settings are pulled on every gather and merged over the configured ones.
class ConfigContextProvider : public IContextProvider {
public:
    explicit ConfigContextProvider(const AppConfig& config, std::shared_ptr<RecordsClient> records = nullptr);

    ConfigSnapshot GatherContext(Mode mode) override;
    std::string GetCursorContext(size_t length) override;

private:
    std::string ReadSelectedText();
    void MergeRemoteVocabulary(std::vector<std::string>& vocabulary);
    void MergeRemoteSettings(ModelSettings& settings);

    std::string _window_title;
    std::string _app_name;
    std::string _selected_text_command;
    std::string _cursor_context_command;
    std::vector<std::string> _vocabulary;
    ModelSettings _model_settings;
    std::shared_ptr<RecordsClient> _records;
};

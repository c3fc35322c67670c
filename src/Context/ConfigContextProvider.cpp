#include "ConfigContextProvider.hpp"
#include "../common/ShellCommand.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>

namespace {

template <typename T>
void FillIfUnset(std::optional<T>& target, const std::optional<T>& remote) {
    if (!target && remote) {
        target = remote;
    }
}

// Index of the first byte of the last `length` UTF-8 code points.
size_t TailStart(const std::string& text, size_t length) {
    size_t start = text.size();
    size_t codePoints = 0;
    while (start > 0 && codePoints < length) {
        --start;
        if ((static_cast<unsigned char>(text[start]) & 0xC0) != 0x80) {
            ++codePoints;
        }
    }
    return start;
}

} // namespace

ConfigContextProvider::ConfigContextProvider(const AppConfig& config, std::shared_ptr<RecordsClient> records)
    : _window_title(config.windowTitle),
      _app_name(config.appName),
      _selected_text_command(config.selectedTextCommand),
      _cursor_context_command(config.cursorContextCommand),
      _vocabulary(config.vocabulary),
      _model_settings(config.modelSettings),
      _records(std::move(records)) {
}

ConfigSnapshot ConfigContextProvider::GatherContext(Mode mode) {
    ConfigSnapshot snapshot;
    snapshot.windowTitle = _window_title;
    snapshot.appName = _app_name;
    snapshot.vocabulary = _vocabulary;
    snapshot.modelSettings = _model_settings;

    if (_records) {
        MergeRemoteVocabulary(snapshot.vocabulary);
        MergeRemoteSettings(snapshot.modelSettings);
    }

    if (mode == Mode::Edit) {
        snapshot.selectedText = ReadSelectedText();
    }

    DEBUG_LOG("[ConfigContextProvider] Context gathered: window='" << snapshot.windowTitle
              << "' app='" << snapshot.appName << "' selected=" << snapshot.selectedText.size()
              << " chars, vocabulary=" << snapshot.vocabulary.size());
    return snapshot;
}

// Without a command there is no way to look behind the cursor; the grammar
// rules treat an empty context as the start of a sentence.
std::string ConfigContextProvider::GetCursorContext(size_t length) {
    if (_cursor_context_command.empty() || length == 0) {
        return std::string();
    }

    std::string output;
    if (!ReadCommandOutput(_cursor_context_command, output)) {
        LOG_WARN("[ConfigContextProvider] Cursor context command failed: " << _cursor_context_command);
        return std::string();
    }
    return output.substr(TailStart(output, length));
}

std::string ConfigContextProvider::ReadSelectedText() {
    if (_selected_text_command.empty()) {
        return std::string();
    }

    std::string output;
    if (!ReadCommandOutput(_selected_text_command, output)) {
        LOG_WARN("[ConfigContextProvider] Selected text command failed: " << _selected_text_command);
        return std::string();
    }
    return output;
}

void ConfigContextProvider::MergeRemoteVocabulary(std::vector<std::string>& vocabulary) {
    std::vector<DictionaryItem> items;
    try {
        items = _records->ListDictionaryItemsSince("");
    } catch (const std::exception& e) {
        LOG_WARN("[ConfigContextProvider] Dictionary unavailable, using configured vocabulary: " << e.what());
        return;
    }

    for (const DictionaryItem& item : items) {
        if (item.deletedAt || item.word.empty()) {
            continue;
        }
        if (std::find(vocabulary.begin(), vocabulary.end(), item.word) == vocabulary.end()) {
            vocabulary.push_back(item.word);
        }
    }
}

void ConfigContextProvider::MergeRemoteSettings(ModelSettings& settings) {
    ModelSettings remote;
    try {
        remote = _records->GetAdvancedSettings();
    } catch (const std::exception& e) {
        LOG_WARN("[ConfigContextProvider] Advanced settings unavailable, using configured ones: " << e.what());
        return;
    }

    // Values set in the config file win.
    FillIfUnset(settings.asrModel, remote.asrModel);
    FillIfUnset(settings.asrProvider, remote.asrProvider);
    FillIfUnset(settings.asrPrompt, remote.asrPrompt);
    FillIfUnset(settings.noSpeechThreshold, remote.noSpeechThreshold);
    FillIfUnset(settings.llmProvider, remote.llmProvider);
    FillIfUnset(settings.llmModel, remote.llmModel);
    FillIfUnset(settings.llmTemperature, remote.llmTemperature);
    FillIfUnset(settings.transcriptionPrompt, remote.transcriptionPrompt);
    FillIfUnset(settings.editingPrompt, remote.editingPrompt);
}

#include <atomic>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "AudioCapture/RtAudioCapture.hpp"
#include "Auth/FileAuthProvider.hpp"
#include "Config/AppConfig.hpp"
#include "Context/ConfigContextProvider.hpp"
#include "Persistence/FileInteractionStore.hpp"
#include "Rpc/RecordsClient.hpp"
#include "Rpc/RetryingRpcClient.hpp"
#include "Session/SessionManager.hpp"
#include "StreamSession/StreamSessionController.hpp"
#include "TextInsertion/CommandTextInserter.hpp"
#include "Transport/WebSocketTransport.hpp"
#include "common/RandomId.hpp"
#include "common/debug_log.hpp"

class DictationApplication {
public:
    explicit DictationApplication(const AppConfig& config)
        : _config(config), _running(true) {
    }

    bool Run() {
        auto auth = std::make_shared<FileAuthProvider>(_config.tokenFile);
        if (!auth->IsSignedIn()) {
            LOG_WARN("No access token in " << _config.tokenFile << ", requests will be rejected until sign-in");
        }

        auto transport = std::make_shared<WebSocketTransport>(_config.serverUrl, _config.responseTimeout);
        auto rpc = std::make_shared<RetryingRpcClient>(transport, auth);
        _records = std::make_shared<RecordsClient>(rpc);
        auto contextProvider = std::make_shared<ConfigContextProvider>(
            _config, _config.syncDictionary ? _records : nullptr);

        std::shared_ptr<RecordsClient> uploader;
        if (_config.uploadInteractions) {
            uploader = _records;
        }

        auto controller = std::make_shared<StreamSessionController>(rpc, contextProvider);

        SessionManager::Options options;
        options.deviceId = _config.deviceId;
        options.grammarServiceEnabled = _config.grammarServiceEnabled;

        _session = std::make_unique<SessionManager>(
            controller,
            std::make_shared<RtAudioCapture>(),
            contextProvider,
            std::make_shared<CommandTextInserter>(_config.insertCommand),
            std::make_shared<FileInteractionStore>(_config.interactionDir, uploader),
            options);

        _session->SetRecordingStateCallback([this](SessionManager::RecordingState state, Mode mode) {
            OnRecordingStateChanged(state, mode);
        });

        PrintHelp();

        std::string line;
        while (_running && std::getline(std::cin, line)) {
            if (!ProcessCommand(line)) {
                break;
            }
        }

        _session->Cancel();
        _session.reset();
        return true;
    }

private:
    void OnRecordingStateChanged(SessionManager::RecordingState state, Mode mode) {
        if (state == SessionManager::RecordingState::Started) {
            std::cout << "[STATE] Recording (" << ModeToString(mode) << ")" << std::endl;
        } else {
            std::cout << "[STATE] Stopped" << std::endl;
        }
    }

    bool ProcessCommand(const std::string& line) {
        std::istringstream words(line);
        std::string command;
        std::string argument;
        words >> command >> argument;
        std::string rest;
        std::getline(words >> std::ws, rest);

        if (command.empty()) {
            return true;
        }

        if (command == "start") {
            Mode mode = Mode::Transcribe;
            if (!argument.empty() && !ModeFromString(argument, mode)) {
                std::cout << "Unknown mode: " << argument << std::endl;
                return true;
            }
            _session->Start(mode);
        }
        else if (command == "mode") {
            Mode mode;
            if (!ModeFromString(argument, mode)) {
                std::cout << "Usage: mode <edit|transcribe>" << std::endl;
                return true;
            }
            _session->SetMode(mode);
        }
        else if (command == "stop") {
            SessionManager::Outcome outcome = _session->Complete();
            std::cout << "[RESULT] " << SessionManager::OutcomeToString(outcome) << std::endl;
        }
        else if (command == "cancel") {
            _session->Cancel();
        }
        else if (command == "history" || command == "rename" || command == "delete" || command == "dict") {
            RunRecordsCommand(command, argument, rest);
        }
        else if (command == "quit" || command == "exit") {
            _running = false;
            return false;
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
        return true;
    }

    // Server-side records; failures are reported and the prompt continues.
    void RunRecordsCommand(const std::string& command, const std::string& argument, const std::string& rest) {
        try {
            if (command == "history") {
                for (const RemoteInteraction& interaction : _records->ListInteractionsSince(argument)) {
                    if (interaction.deletedAt) {
                        continue;
                    }
                    std::cout << "  " << interaction.id << "  " << interaction.createdAt
                              << "  " << interaction.title << std::endl;
                }
            } else if (command == "rename") {
                if (argument.empty() || rest.empty()) {
                    std::cout << "Usage: rename <id> <title>" << std::endl;
                    return;
                }
                _records->UpdateInteraction(argument, rest);
                std::cout << "Renamed " << argument << std::endl;
            } else if (command == "delete") {
                if (argument.empty()) {
                    std::cout << "Usage: delete <id>" << std::endl;
                    return;
                }
                _records->DeleteInteraction(argument);
                std::cout << "Deleted " << argument << std::endl;
            } else {
                RunDictionaryCommand(argument, rest);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("'" << command << "' failed: " << e.what());
        }
    }

    void RunDictionaryCommand(const std::string& action, const std::string& rest) {
        std::istringstream words(rest);
        std::string first;
        words >> first;

        if (action == "list") {
            for (const DictionaryItem& item : _records->ListDictionaryItemsSince("")) {
                if (item.deletedAt) {
                    continue;
                }
                std::cout << "  " << item.id << "  " << item.word;
                if (!item.pronunciation.empty()) {
                    std::cout << " (" << item.pronunciation << ")";
                }
                std::cout << std::endl;
            }
        } else if (action == "add" && !first.empty()) {
            DictionaryItem item;
            item.id = GenerateRandomId();
            item.word = first;
            std::getline(words >> std::ws, item.pronunciation);
            _records->CreateDictionaryItem(item);
            std::cout << "Added " << item.word << " as " << item.id << std::endl;
        } else if (action == "rm" && !first.empty()) {
            _records->DeleteDictionaryItem(first);
            std::cout << "Removed " << first << std::endl;
        } else {
            std::cout << "Usage: dict list | dict add <word> [pronunciation] | dict rm <id>" << std::endl;
        }
    }

    void PrintHelp() {
        std::cout << "\n=== Dictation Client ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  start [edit|transcribe] - Start dictating" << std::endl;
        std::cout << "  mode <edit|transcribe>  - Switch mode while dictating" << std::endl;
        std::cout << "  stop                    - Finish and insert the transcript" << std::endl;
        std::cout << "  cancel                  - Discard the current dictation" << std::endl;
        std::cout << "  history [since]         - List stored interactions" << std::endl;
        std::cout << "  rename <id> <title>     - Rename an interaction" << std::endl;
        std::cout << "  delete <id>             - Delete an interaction" << std::endl;
        std::cout << "  dict list               - List dictionary words" << std::endl;
        std::cout << "  dict add <word> [pron]  - Add a dictionary word" << std::endl;
        std::cout << "  dict rm <id>            - Remove a dictionary word" << std::endl;
        std::cout << "  help                    - Show this help" << std::endl;
        std::cout << "  quit                    - Exit application" << std::endl;
        std::cout << "========================\n" << std::endl;
    }

    AppConfig _config;
    std::unique_ptr<SessionManager> _session;
    std::shared_ptr<RecordsClient> _records;
    std::atomic<bool> _running;
};

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::FromCommandLine(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        AppConfig::PrintUsage(argv[0]);
        return 1;
    }

    if (config.listDevices) {
        RtAudioCapture::ListDevices(std::cout);
        return 0;
    }

    try {
        DictationApplication app(config);
        return app.Run() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}

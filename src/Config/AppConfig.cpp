#include "AppConfig.hpp"
#include "../Protocol/ProtocolCodec.hpp"
#include "../common/debug_log.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace {

const char* const default_config_path = "dictation.json";

template <typename T>
void ReadKey(const nlohmann::json& json, const char* key, T& value) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return;
    }
    try {
        value = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

AppConfig AppConfig::LoadFile(const std::string& path) {
    AppConfig config;

    std::ifstream file(path);
    if (!file.is_open()) {
        DEBUG_LOG("[AppConfig] No config file at " << path << ", using defaults");
        return config;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    if (!json.is_object()) {
        throw ConfigError("Config file " + path + " must contain a JSON object");
    }

    ReadKey(json, "server_url", config.serverUrl);
    ReadKey(json, "token_file", config.tokenFile);
    ReadKey(json, "device_id", config.deviceId);
    ReadKey(json, "interaction_dir", config.interactionDir);
    ReadKey(json, "upload_interactions", config.uploadInteractions);
    ReadKey(json, "grammar_service_enabled", config.grammarServiceEnabled);
    ReadKey(json, "insert_command", config.insertCommand);
    ReadKey(json, "selected_text_command", config.selectedTextCommand);
    ReadKey(json, "cursor_context_command", config.cursorContextCommand);
    ReadKey(json, "sync_dictionary", config.syncDictionary);
    ReadKey(json, "window_title", config.windowTitle);
    ReadKey(json, "app_name", config.appName);
    ReadKey(json, "vocabulary", config.vocabulary);

    int64_t timeoutMs = config.responseTimeout.count();
    ReadKey(json, "response_timeout_ms", timeoutMs);
    if (timeoutMs <= 0) {
        throw ConfigError("response_timeout_ms must be positive");
    }
    config.responseTimeout = std::chrono::milliseconds(timeoutMs);

    auto settings = json.find("model_settings");
    if (settings != json.end() && !settings->is_null()) {
        if (!settings->is_object()) {
            throw ConfigError("model_settings must be an object");
        }
        try {
            config.modelSettings = protocol::DecodeModelSettings(*settings);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("Invalid model_settings: ") + e.what());
        }
    }

    LOG_INFO("[AppConfig] Loaded " << path);
    return config;
}

AppConfig AppConfig::FromCommandLine(int argc, char* argv[]) {
    std::string configPath = default_config_path;
    std::string server;
    std::string device;
    bool listDevices = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + name);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            configPath = value(arg);
        } else if (arg == "--server") {
            server = value(arg);
        } else if (arg == "--device") {
            device = value(arg);
        } else if (arg == "--list-devices") {
            listDevices = true;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    AppConfig config = LoadFile(configPath);
    if (!server.empty()) {
        config.serverUrl = server;
    }
    if (!device.empty()) {
        config.deviceId = device;
    }
    config.listDevices = listDevices;
    return config;
}

void AppConfig::PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config path] [--server url] [--device id] [--list-devices]" << std::endl;
    std::cout << "Example: " << program << " --server ws://localhost:8080" << std::endl;
}

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "../Protocol/ProtocolTypes.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct AppConfig {
    std::string serverUrl = "ws://localhost:8080";
    std::string tokenFile = "token.txt";
    std::string deviceId;
    std::string interactionDir = "interactions";
    bool uploadInteractions = false;
    bool grammarServiceEnabled = false;
    std::string insertCommand;
    std::string selectedTextCommand;
    std::string cursorContextCommand;
    // Pull the dictionary and advanced settings from the server at each start.
    bool syncDictionary = true;
    std::string windowTitle;
    std::string appName;
    std::vector<std::string> vocabulary;
    ModelSettings modelSettings;
    std::chrono::milliseconds responseTimeout{30000};
    bool listDevices = false;

    // A missing file leaves the defaults. Throws ConfigError on unreadable
    // or malformed content.
    static AppConfig LoadFile(const std::string& path);

    // Applies --config, --server, --device and --list-devices. Throws
    // ConfigError on unknown or incomplete options.
    static AppConfig FromCommandLine(int argc, char* argv[]);

    static void PrintUsage(const char* program);
};

#include "ShellCommand.hpp"

#include <array>
#include <cstdio>

bool ReadCommandOutput(const std::string& command, std::string& output) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return false;
    }

    output.clear();
    std::array<char, 512> buffer;
    size_t read = 0;
    while ((read = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), read);
    }

    return pclose(pipe) == 0;
}

bool WriteCommandInput(const std::string& command, const std::string& input) {
    FILE* pipe = popen(command.c_str(), "w");
    if (!pipe) {
        return false;
    }

    size_t written = fwrite(input.data(), 1, input.size(), pipe);
    int status = pclose(pipe);
    return written == input.size() && status == 0;
}

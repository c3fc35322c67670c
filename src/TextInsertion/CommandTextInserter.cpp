#include "CommandTextInserter.hpp"
#include "../common/ShellCommand.hpp"
#include "../common/debug_log.hpp"

CommandTextInserter::CommandTextInserter(std::string command, std::ostream& fallback)
    : _command(std::move(command)), _fallback(fallback) {
}

bool CommandTextInserter::InsertText(const std::string& text) {
    if (text.empty()) {
        return false;
    }

    if (_command.empty()) {
        LOG_TO_STREAM(_fallback, "[TRANSCRIPT] " << text);
        return true;
    }

    if (!WriteCommandInput(_command, text)) {
        LOG_ERROR("[CommandTextInserter] Insert command failed: " << _command);
        return false;
    }
    DEBUG_LOG("[CommandTextInserter] Inserted " << text.size() << " chars");
    return true;
}

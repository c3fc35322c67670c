#pragma once

#include <string>

// Runs `command` through the shell and collects its stdout.
// Returns false when the command cannot be started or exits non-zero.
bool ReadCommandOutput(const std::string& command, std::string& output);

// Runs `command` through the shell with `input` on its stdin.
bool WriteCommandInput(const std::string& command, const std::string& input);

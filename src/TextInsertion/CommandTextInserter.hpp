#pragma once

#include <iostream>
#include <string>

#include "ITextInserter.hpp"

// Hands the transcript to an external typing command (for example
// `xdotool type --file -`), or prints it when none is configured.
class CommandTextInserter : public ITextInserter {
public:
    explicit CommandTextInserter(std::string command, std::ostream& fallback = std::cout);

    bool InsertText(const std::string& text) override;

private:
    std::string _command;
    std::ostream& _fallback;
};

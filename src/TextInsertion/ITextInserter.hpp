#pragma once

#include <string>

class ITextInserter {
public:
    virtual ~ITextInserter() = default;

    virtual bool InsertText(const std::string& text) = 0;
};

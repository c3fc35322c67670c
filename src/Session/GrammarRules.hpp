#pragma once

#include <string>

// Fits a transcript to the text in front of the cursor: case of the first
// letter and a separating space.
class GrammarRules {
public:
    explicit GrammarRules(std::string cursor_context);

    std::string Apply(const std::string& transcript) const;

    std::string SetCaseFirstWord(const std::string& transcript) const;
    std::string AddLeadingSpaceIfNeeded(const std::string& transcript) const;

    const std::string& GetCursorContext() const { return _cursor_context; }

private:
    bool ShouldCapitalize(const std::string& firstWord) const;
    bool NeedsLeadingSpace() const;

    std::string _cursor_context;
};

#include "GrammarRules.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

bool IsAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool IsAsciiAlnum(char c) {
    return IsAsciiLetter(c) || (c >= '0' && c <= '9');
}

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string Trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && IsSpace(text[begin])) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && IsSpace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string FirstWord(const std::string& text) {
    std::string trimmed = Trim(text);
    auto end = std::find_if(trimmed.begin(), trimmed.end(), IsSpace);
    return std::string(trimmed.begin(), end);
}

// "i", "i'm", "i'll" ... are always capitalized.
bool IsFirstPersonPronoun(const std::string& word) {
    if (word.empty() || (word[0] != 'i' && word[0] != 'I')) {
        return false;
    }
    return word.size() == 1 || word[1] == '\'';
}

// Trailing bytes of a UTF-8 en or em dash.
bool EndsWithDash(const std::string& text) {
    static const char* const dashes[] = {"\xE2\x80\x93", "\xE2\x80\x94"};
    for (const char* dash : dashes) {
        size_t len = std::strlen(dash);
        if (text.size() >= len && text.compare(text.size() - len, len, dash) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace

GrammarRules::GrammarRules(std::string cursor_context)
    : _cursor_context(std::move(cursor_context)) {
}

std::string GrammarRules::Apply(const std::string& transcript) const {
    return AddLeadingSpaceIfNeeded(SetCaseFirstWord(transcript));
}

std::string GrammarRules::SetCaseFirstWord(const std::string& transcript) const {
    auto letter = std::find_if(transcript.begin(), transcript.end(), IsAsciiLetter);
    if (letter == transcript.end()) {
        return transcript;
    }

    std::string corrected = transcript;
    size_t index = static_cast<size_t>(letter - transcript.begin());
    unsigned char c = static_cast<unsigned char>(corrected[index]);
    if (ShouldCapitalize(FirstWord(transcript))) {
        corrected[index] = static_cast<char>(std::toupper(c));
    } else {
        corrected[index] = static_cast<char>(std::tolower(c));
    }
    return corrected;
}

std::string GrammarRules::AddLeadingSpaceIfNeeded(const std::string& transcript) const {
    if (transcript.empty() || !NeedsLeadingSpace()) {
        return transcript;
    }
    return " " + transcript;
}

bool GrammarRules::ShouldCapitalize(const std::string& firstWord) const {
    if (IsFirstPersonPronoun(firstWord)) {
        return true;
    }

    std::string context = Trim(_cursor_context);
    if (context.empty()) {
        return true;
    }

    char last = context.back();
    if (last == '.' || last == '!' || last == '?') {
        return true;
    }
    if (last == ',' || last == ';' || last == ':' || last == '-' || EndsWithDash(context)) {
        return false;
    }
    if (IsAsciiAlnum(last)) {
        return false;
    }
    return true;
}

bool GrammarRules::NeedsLeadingSpace() const {
    if (_cursor_context.empty()) {
        return false;
    }

    char last = _cursor_context.back();
    if (IsSpace(last)) {
        return false;
    }

    static const char opening[] = "([{\"'`";
    return std::strchr(opening, last) == nullptr;
}

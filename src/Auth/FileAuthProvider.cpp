#include "FileAuthProvider.hpp"
#include "../common/debug_log.hpp"

#include <fstream>

namespace {

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // namespace

FileAuthProvider::FileAuthProvider(const std::string& token_file)
    : _token_file(token_file), _invalidated(false) {
    _access_token = ReadTokenFile();
    if (_access_token.empty()) {
        LOG_WARN("[Auth] No access token in " << _token_file << ", calls will be unauthenticated");
    }
}

std::string FileAuthProvider::AccessToken() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _access_token;
}

std::optional<AuthTokens> FileAuthProvider::RefreshTokens() {
    std::string fresh = ReadTokenFile();

    std::lock_guard<std::mutex> lock(_mutex);
    if (fresh.empty() || fresh == _access_token) {
        return std::nullopt;
    }
    _access_token = fresh;
    _invalidated = false;

    AuthTokens tokens;
    tokens.accessToken = fresh;
    return tokens;
}

void FileAuthProvider::OnAuthInvalidated() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _access_token.clear();
        _invalidated = true;
    }
    LOG_ERROR("[Auth] Session invalidated, sign in again to continue");
}

bool FileAuthProvider::IsSignedIn() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return !_invalidated && !_access_token.empty();
}

std::string FileAuthProvider::ReadTokenFile() const {
    if (_token_file.empty()) {
        return "";
    }
    std::ifstream file(_token_file);
    if (!file) {
        return "";
    }
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return Trim(contents);
}

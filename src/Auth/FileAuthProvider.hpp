#pragma once

#include <mutex>
#include <string>

#include "../Rpc/IAuthProvider.hpp"

// Access token kept in a file written by the sign-in flow. A refresh re-reads
// the file and succeeds only when a different token has appeared there.
class FileAuthProvider : public IAuthProvider {
public:
    explicit FileAuthProvider(const std::string& token_file);

    std::string AccessToken() const override;
    std::optional<AuthTokens> RefreshTokens() override;
    void OnAuthInvalidated() override;

    bool IsSignedIn() const;

private:
    std::string ReadTokenFile() const;

    std::string _token_file;
    mutable std::mutex _mutex;
    std::string _access_token;
    bool _invalidated;
};

#pragma once

#include <optional>
#include <string>

struct AuthTokens {
    std::string accessToken;
    std::string idToken;
};

class IAuthProvider {
public:
    virtual ~IAuthProvider() = default;

    virtual std::string AccessToken() const = 0;

    // Exchanges the refresh credentials for new tokens; std::nullopt on failure.
    // Implementations must make the new access token visible to AccessToken().
    virtual std::optional<AuthTokens> RefreshTokens() = 0;

    // The refresh failed; the application should sign the user out.
    virtual void OnAuthInvalidated() = 0;
};

#include "RetryingRpcClient.hpp"
#include "../common/debug_log.hpp"

RetryingRpcClient::RetryingRpcClient(std::shared_ptr<IRemoteTransport> transport,
                                     std::shared_ptr<IAuthProvider> auth)
    : _transport(std::move(transport)), _auth(std::move(auth)) {
}

TranscriptResponse RetryingRpcClient::TranscribeStream(const IRemoteTransport::OutboundSource& next,
                                                       const std::shared_ptr<CallContext>& context) {
    // Items handed to a failed attempt are gone; only an attempt that failed
    // before pulling anything can be repeated.
    bool pulled = false;
    IRemoteTransport::OutboundSource tracked = [&pulled, &next](OutboundItem& item) {
        pulled = true;
        return next(item);
    };

    return WithAuthRetry([&](const std::string& token) {
        return _transport->TranscribeStream(token, tracked, context);
    }, [&pulled]() {
        return !pulled;
    });
}

nlohmann::json RetryingRpcClient::Call(const std::string& method, const nlohmann::json& request) {
    return WithAuthRetry([&](const std::string& token) {
        return _transport->Call(token, method, request);
    });
}

std::mutex& RetryingRpcClient::RefreshMutex() {
    static std::mutex mutex;
    return mutex;
}

bool RetryingRpcClient::RefreshAfterAuthFailure(const RpcError& original) {
    std::unique_lock<std::mutex> lock(RefreshMutex(), std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_WARN("[RetryingRpcClient] Token refresh already in progress, not retrying: " << original.what());
        return false;
    }

    LOG_INFO("[RetryingRpcClient] Unauthenticated, refreshing tokens");
    std::optional<AuthTokens> tokens;
    try {
        tokens = _auth->RefreshTokens();
    } catch (const std::exception& e) {
        LOG_ERROR("[RetryingRpcClient] Token refresh threw: " << e.what());
    }

    if (!tokens) {
        LOG_ERROR("[RetryingRpcClient] Token refresh failed, session invalidated");
        _auth->OnAuthInvalidated();
        RpcError invalidated = original;
        invalidated.MarkSessionInvalidated();
        throw invalidated;
    }

    LOG_INFO("[RetryingRpcClient] Tokens refreshed, retrying once");
    return true;
}

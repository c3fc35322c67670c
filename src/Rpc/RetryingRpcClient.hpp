#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "IAuthProvider.hpp"
#include "../common/debug_log.hpp"
#include "../Protocol/RpcError.hpp"
#include "../Transport/IRemoteTransport.hpp"

// Every remote call goes through WithAuthRetry: an Unauthenticated failure
// triggers one token refresh and one retry. Only one refresh runs at a time
// in the whole process; a caller that hits Unauthenticated while another
// refresh is in flight gets its original error back.
class RetryingRpcClient {
public:
    RetryingRpcClient(std::shared_ptr<IRemoteTransport> transport,
                      std::shared_ptr<IAuthProvider> auth);

    TranscriptResponse TranscribeStream(const IRemoteTransport::OutboundSource& next,
                                        const std::shared_ptr<CallContext>& context);

    nlohmann::json Call(const std::string& method, const nlohmann::json& request);

    // `operation` receives the access token to use for the attempt.
    template <typename Operation>
    auto WithAuthRetry(Operation&& operation) -> decltype(operation(std::string())) {
        return WithAuthRetry(std::forward<Operation>(operation), []() { return true; });
    }

    // `canRetry` is asked after an Unauthenticated failure; when it says no,
    // the failure propagates without a refresh.
    template <typename Operation, typename CanRetry>
    auto WithAuthRetry(Operation&& operation, CanRetry&& canRetry) -> decltype(operation(std::string())) {
        try {
            return operation(_auth->AccessToken());
        } catch (const RpcError& error) {
            if (!error.IsUnauthenticated()) {
                throw;
            }
            if (!canRetry()) {
                LOG_WARN("[RetryingRpcClient] Unauthenticated after the call consumed input, not retrying: "
                         << error.what());
                throw;
            }
            if (!RefreshAfterAuthFailure(error)) {
                throw;
            }
        }
        return operation(_auth->AccessToken());
    }

private:
    // True when a refresh succeeded and the operation should be retried.
    // Throws (a copy of `original`, marked invalidated) when the refresh failed.
    bool RefreshAfterAuthFailure(const RpcError& original);

    static std::mutex& RefreshMutex();

    std::shared_ptr<IRemoteTransport> _transport;
    std::shared_ptr<IAuthProvider> _auth;
};

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../Protocol/ProtocolTypes.hpp"
#include "CallContext.hpp"

// Remote transcription service. Both calls block the calling thread and
// throw RpcError on failure.
class IRemoteTransport {
public:
    // Pulls the next outbound item; returns false once the sequence ended.
    using OutboundSource = std::function<bool(OutboundItem&)>;

    virtual ~IRemoteTransport() = default;

    // An Unauthenticated failure raised before the first call to `next` can be
    // retried with a fresh token; once items were pulled it is final.
    virtual TranscriptResponse TranscribeStream(const std::string& accessToken,
                                                const OutboundSource& next,
                                                const std::shared_ptr<CallContext>& context) = 0;

    virtual nlohmann::json Call(const std::string& accessToken,
                                const std::string& method,
                                const nlohmann::json& request) = 0;
};

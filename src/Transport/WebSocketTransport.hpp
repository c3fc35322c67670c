#pragma once

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "IRemoteTransport.hpp"
#include "../Protocol/ProtocolCodec.hpp"

typedef websocketpp::client<websocketpp::config::asio_client> ws_client;

// Remote transcription service over websockets. Every call gets its own
// connection on a shared perpetual io thread:
//   <server>/transcribe  binary audio frames + JSON control frames, then "end"
//   <server>/rpc         one JSON request, one JSON reply
class WebSocketTransport : public IRemoteTransport {
public:
    WebSocketTransport(const std::string& server_url, std::chrono::milliseconds response_timeout);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    TranscriptResponse TranscribeStream(const std::string& accessToken,
                                        const OutboundSource& next,
                                        const std::shared_ptr<CallContext>& context) override;

    nlohmann::json Call(const std::string& accessToken,
                        const std::string& method,
                        const nlohmann::json& request) override;

private:
    struct PendingCall {
        websocketpp::connection_hdl hdl;
        std::mutex mutex;
        std::condition_variable cv;
        bool opened = false;
        bool finished = false;
        std::optional<protocol::ServerFrame> frame;
        std::optional<RpcError> error;
    };
    using PendingCallPtr = std::shared_ptr<PendingCall>;

    PendingCallPtr Connect(const std::string& path, const std::string& accessToken,
                           const std::shared_ptr<CallContext>& context);
    void SendText(const PendingCallPtr& call, const std::string& payload);
    void SendBinary(const PendingCallPtr& call, const std::vector<uint8_t>& payload);
    protocol::ServerFrame AwaitFrame(const PendingCallPtr& call);
    void Close(const PendingCallPtr& call);

    static bool IsFinished(const PendingCallPtr& call);
    static void Finish(const PendingCallPtr& call, std::optional<protocol::ServerFrame> frame,
                       std::optional<RpcError> error);

    void OnFail(const PendingCallPtr& call, websocketpp::connection_hdl hdl);
    void OnMessage(const PendingCallPtr& call, ws_client::message_ptr msg);

    ws_client _endpoint;
    std::string _server_url;
    std::chrono::milliseconds _response_timeout;
    std::unique_ptr<std::thread> _thread;
};

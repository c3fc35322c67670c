#include "WebSocketTransport.hpp"
#include "../common/debug_log.hpp"

using websocketpp::lib::placeholders::_1;
using websocketpp::lib::placeholders::_2;

WebSocketTransport::WebSocketTransport(const std::string& server_url,
                                       std::chrono::milliseconds response_timeout)
    : _server_url(server_url), _response_timeout(response_timeout) {

    _endpoint.clear_access_channels(websocketpp::log::alevel::all);
    _endpoint.clear_error_channels(websocketpp::log::elevel::all);

    _endpoint.init_asio();
    _endpoint.start_perpetual();

    _thread.reset(new std::thread([this]() {
        // A throwing handler must not take the loop down with it; pending
        // calls still need their close and fail callbacks.
        for (;;) {
            try {
                _endpoint.run();
                return;
            } catch (const std::exception& e) {
                LOG_ERROR("[WebSocketTransport] io loop error: " << e.what());
            }
        }
    }));
}

WebSocketTransport::~WebSocketTransport() {
    _endpoint.stop_perpetual();
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

TranscriptResponse WebSocketTransport::TranscribeStream(const std::string& accessToken,
                                                        const OutboundSource& next,
                                                        const std::shared_ptr<CallContext>& context) {
    PendingCallPtr call = Connect("/transcribe", accessToken, context);

    try {
        OutboundItem item;
        size_t audioFrames = 0;
        size_t controlFrames = 0;

        while (!IsFinished(call) && next(item)) {
            if (std::holds_alternative<AudioFrame>(item)) {
                SendBinary(call, std::get<AudioFrame>(item).data);
                ++audioFrames;
            } else {
                SendText(call, protocol::Serialize(protocol::EncodeControlMessage(std::get<ControlMessage>(item))));
                ++controlFrames;
            }
        }

        if (context->IsCancelled()) {
            throw RpcError(StatusCode::Cancelled, "Transcription stream cancelled");
        }

        DEBUG_LOG("[WebSocketTransport] Sent " << audioFrames << " audio and "
                  << controlFrames << " control frames, ending input");

        if (!IsFinished(call)) {
            SendText(call, protocol::Serialize(protocol::EncodeEndOfInput()));
        }

        protocol::ServerFrame frame = AwaitFrame(call);
        context->ClearAbortHandler();
        Close(call);

        if (frame.type != protocol::ServerFrameType::Result) {
            throw RpcError(StatusCode::Internal, "Unexpected frame in place of a transcription result");
        }
        return frame.result;
    } catch (const std::exception&) {
        context->ClearAbortHandler();
        Close(call);
        throw;
    }
}

nlohmann::json WebSocketTransport::Call(const std::string& accessToken,
                                        const std::string& method,
                                        const nlohmann::json& request) {
    auto context = std::make_shared<CallContext>();
    PendingCallPtr call = Connect("/rpc", accessToken, context);

    try {
        SendText(call, protocol::Serialize(protocol::EncodeUnaryRequest(method, request)));
        protocol::ServerFrame frame = AwaitFrame(call);
        Close(call);

        if (frame.type != protocol::ServerFrameType::Reply) {
            throw RpcError(StatusCode::Internal, "Unexpected frame in place of a reply to " + method);
        }
        return frame.reply;
    } catch (const std::exception&) {
        Close(call);
        throw;
    }
}

WebSocketTransport::PendingCallPtr WebSocketTransport::Connect(const std::string& path,
                                                               const std::string& accessToken,
                                                               const std::shared_ptr<CallContext>& context) {
    websocketpp::lib::error_code ec;
    std::string full_url = _server_url + path;
    ws_client::connection_ptr con = _endpoint.get_connection(full_url, ec);

    if (ec) {
        throw RpcError(StatusCode::Unavailable, "Could not create connection to " + full_url + ": " + ec.message());
    }

    if (!accessToken.empty()) {
        con->append_header("Authorization", "Bearer " + accessToken);
    }

    auto call = std::make_shared<PendingCall>();
    call->hdl = con->get_handle();

    con->set_open_handler([this, call](websocketpp::connection_hdl) {
        bool abandoned = false;
        {
            std::lock_guard<std::mutex> lock(call->mutex);
            call->opened = true;
            abandoned = call->finished;
            call->cv.notify_all();
        }
        // The caller gave up waiting for the handshake.
        if (abandoned) {
            Close(call);
        }
    });
    con->set_fail_handler([this, call](websocketpp::connection_hdl hdl) {
        OnFail(call, hdl);
    });
    con->set_close_handler([call](websocketpp::connection_hdl) {
        Finish(call, std::nullopt,
               RpcError(StatusCode::Unavailable, "Connection closed before a response arrived"));
    });
    con->set_message_handler([this, call](websocketpp::connection_hdl, ws_client::message_ptr msg) {
        OnMessage(call, msg);
    });

    context->SetAbortHandler([this, call]() {
        Finish(call, std::nullopt, RpcError(StatusCode::Cancelled, "Call cancelled"));
        Close(call);
    });

    _endpoint.connect(con);

    std::unique_lock<std::mutex> lock(call->mutex);
    bool settled = call->cv.wait_for(lock, _response_timeout,
                                     [&call] { return call->opened || call->finished; });

    if (!settled) {
        lock.unlock();
        RpcError timeout(StatusCode::Unavailable, "Timed out connecting to " + full_url);
        Finish(call, std::nullopt, timeout);
        context->ClearAbortHandler();
        Close(call);
        throw timeout;
    }
    if (call->finished && call->error) {
        RpcError error = *call->error;
        lock.unlock();
        context->ClearAbortHandler();
        throw error;
    }
    return call;
}

void WebSocketTransport::SendText(const PendingCallPtr& call, const std::string& payload) {
    websocketpp::lib::error_code ec;
    _endpoint.send(call->hdl, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
        throw RpcError(StatusCode::Unavailable, "Error sending message: " + ec.message());
    }
}

void WebSocketTransport::SendBinary(const PendingCallPtr& call, const std::vector<uint8_t>& payload) {
    if (payload.empty()) {
        return;
    }
    websocketpp::lib::error_code ec;
    _endpoint.send(call->hdl, payload.data(), payload.size(), websocketpp::frame::opcode::binary, ec);
    if (ec) {
        throw RpcError(StatusCode::Unavailable, "Error sending audio: " + ec.message());
    }
}

protocol::ServerFrame WebSocketTransport::AwaitFrame(const PendingCallPtr& call) {
    std::unique_lock<std::mutex> lock(call->mutex);
    bool done = call->cv.wait_for(lock, _response_timeout, [&call] { return call->finished; });
    if (!done) {
        throw RpcError(StatusCode::Unavailable, "Timed out waiting for the server response");
    }
    if (call->error) {
        throw *call->error;
    }
    return *call->frame;
}

void WebSocketTransport::Close(const PendingCallPtr& call) {
    websocketpp::lib::error_code ec;
    _endpoint.close(call->hdl, websocketpp::close::status::normal, "", ec);
    if (ec) {
        DEBUG_LOG("[WebSocketTransport] close: " << ec.message());
    }
}

bool WebSocketTransport::IsFinished(const PendingCallPtr& call) {
    std::lock_guard<std::mutex> lock(call->mutex);
    return call->finished;
}

void WebSocketTransport::Finish(const PendingCallPtr& call, std::optional<protocol::ServerFrame> frame,
                                std::optional<RpcError> error) {
    std::lock_guard<std::mutex> lock(call->mutex);
    if (call->finished) {
        return;
    }
    call->finished = true;
    call->frame = std::move(frame);
    call->error = std::move(error);
    call->cv.notify_all();
}

void WebSocketTransport::OnFail(const PendingCallPtr& call, websocketpp::connection_hdl hdl) {
    ws_client::connection_ptr con = _endpoint.get_con_from_hdl(hdl);
    websocketpp::http::status_code::value status = con->get_response_code();

    if (status == websocketpp::http::status_code::unauthorized) {
        Finish(call, std::nullopt, RpcError(StatusCode::Unauthenticated, "Server rejected the access token"));
        return;
    }
    Finish(call, std::nullopt,
           RpcError(StatusCode::Unavailable, "Connection failed: " + con->get_ec().message()));
}

void WebSocketTransport::OnMessage(const PendingCallPtr& call, ws_client::message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        return;
    }

    protocol::ServerFrame frame;
    try {
        frame = protocol::DecodeServerFrame(msg->get_payload());
    } catch (const RpcError& e) {
        Finish(call, std::nullopt, e);
        return;
    } catch (const std::exception& e) {
        Finish(call, std::nullopt, RpcError(StatusCode::Internal, std::string("Undecodable server frame: ") + e.what()));
        return;
    }

    switch (frame.type) {
        case protocol::ServerFrameType::Status:
            Finish(call, std::nullopt, RpcError(frame.statusCode, frame.statusMessage));
            break;
        case protocol::ServerFrameType::Result:
        case protocol::ServerFrameType::Reply:
            Finish(call, std::move(frame), std::nullopt);
            break;
        case protocol::ServerFrameType::Unknown:
            DEBUG_LOG("[WebSocketTransport] Ignoring unknown frame: " << msg->get_payload());
            break;
    }
}

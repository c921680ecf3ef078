#pragma once

#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/client.hpp>
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lolc::network {

using WsEndpoint = websocketpp::client<websocketpp::config::asio_tls_client>;
using WsConnectionPtr = WsEndpoint::connection_ptr;
using WsMessagePtr = WsEndpoint::message_ptr;

// wss://host:port/target
std::string websocketUri(const std::string& host, uint16_t port, const std::string& target);

/**
 * WebSocket Client
 *
 * One TLS WebSocket connection on a websocketpp endpoint that shares the
 * caller's io_context. Delivers complete text messages and reports the
 * end of the connection once.
 *
 * All methods must be called on the io_context thread.
 */
class WebSocketClient : public std::enable_shared_from_this<WebSocketClient> {
public:
    using OpenHandler = std::function<void(const asio::error_code&)>;
    using MessageHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const asio::error_code&)>;

    WebSocketClient(asio::io_context& io_context,
                    std::shared_ptr<asio::ssl::context> ssl_context,
                    const std::string& host,
                    uint16_t port,
                    std::chrono::milliseconds handshakeTimeout);
    ~WebSocketClient();

    void setMessageHandler(MessageHandler handler) { m_messageHandler = std::move(handler); }
    void setCloseHandler(CloseHandler handler) { m_closeHandler = std::move(handler); }

    // Connect and upgrade; the open handler fires once
    void connect(const std::string& target,
                 const std::vector<std::pair<std::string, std::string>>& headers,
                 OpenHandler handler);

    void sendText(const std::string& text);

    // Start the close handshake; the close handler still fires when it ends
    void close();

    bool isOpen() const { return m_state == State::Open; }

private:
    enum class State { Idle, Connecting, Open, Closing, Closed };

    void handleOpen(websocketpp::connection_hdl hdl);
    void handleFail(websocketpp::connection_hdl hdl);
    void handleMessage(websocketpp::connection_hdl hdl, WsMessagePtr message);
    void handleClose(websocketpp::connection_hdl hdl);

    asio::error_code connectionError(websocketpp::connection_hdl hdl,
                                     const asio::error_code& fallback);

    WsEndpoint m_endpoint;
    std::shared_ptr<asio::ssl::context> m_sslContext;
    websocketpp::connection_hdl m_hdl;
    std::string m_host;
    uint16_t m_port;
    std::chrono::milliseconds m_handshakeTimeout;
    State m_state = State::Idle;

    OpenHandler m_openHandler;
    MessageHandler m_messageHandler;
    CloseHandler m_closeHandler;
};

} // namespace lolc::network

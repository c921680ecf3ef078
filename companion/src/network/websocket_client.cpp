#include "network/websocket_client.hpp"
#include "utils/logger.hpp"

namespace lolc::network {

std::string websocketUri(const std::string& host, uint16_t port, const std::string& target) {
    std::string uri = "wss://" + host + ":" + std::to_string(port);
    if (target.empty() || target[0] != '/') {
        uri += '/';
    }
    return uri + target;
}

WebSocketClient::WebSocketClient(asio::io_context& io_context,
                                 std::shared_ptr<asio::ssl::context> ssl_context,
                                 const std::string& host,
                                 uint16_t port,
                                 std::chrono::milliseconds handshakeTimeout)
    : m_sslContext(std::move(ssl_context))
    , m_host(host)
    , m_port(port)
    , m_handshakeTimeout(handshakeTimeout)
{
    // Our own logger reports connection events
    m_endpoint.clear_access_channels(websocketpp::log::alevel::all);
    m_endpoint.clear_error_channels(websocketpp::log::elevel::all);

    m_endpoint.init_asio(&io_context);

    auto context = m_sslContext;
    m_endpoint.set_tls_init_handler([context](websocketpp::connection_hdl) {
        return context;
    });
}

WebSocketClient::~WebSocketClient() {
    if (m_state == State::Open || m_state == State::Connecting) {
        websocketpp::lib::error_code ec;
        m_endpoint.close(m_hdl, websocketpp::close::status::going_away, "", ec);
    }
}

void WebSocketClient::connect(const std::string& target,
                              const std::vector<std::pair<std::string, std::string>>& headers,
                              OpenHandler handler) {
    if (m_state != State::Idle) {
        asio::post(m_endpoint.get_io_service(), [handler]() {
            handler(asio::error::already_started);
        });
        return;
    }

    websocketpp::lib::error_code ec;
    WsConnectionPtr connection = m_endpoint.get_connection(websocketUri(m_host, m_port, target), ec);
    if (ec) {
        LOG_ERROR("[WS] Cannot create connection to {}:{}: {}", m_host, m_port, ec.message());
        m_state = State::Closed;
        asio::post(m_endpoint.get_io_service(), [handler, ec]() {
            handler(ec);
        });
        return;
    }

    for (const auto& header : headers) {
        connection->append_header(header.first, header.second);
    }
    connection->set_open_handshake_timeout(static_cast<long>(m_handshakeTimeout.count()));

    std::weak_ptr<WebSocketClient> weak = shared_from_this();

    connection->set_open_handler([weak](websocketpp::connection_hdl hdl) {
        if (auto self = weak.lock()) {
            self->handleOpen(hdl);
        }
    });
    connection->set_fail_handler([weak](websocketpp::connection_hdl hdl) {
        if (auto self = weak.lock()) {
            self->handleFail(hdl);
        }
    });
    connection->set_message_handler([weak](websocketpp::connection_hdl hdl, WsMessagePtr message) {
        if (auto self = weak.lock()) {
            self->handleMessage(hdl, message);
        }
    });
    connection->set_close_handler([weak](websocketpp::connection_hdl hdl) {
        if (auto self = weak.lock()) {
            self->handleClose(hdl);
        }
    });

    m_openHandler = std::move(handler);
    m_hdl = connection->get_handle();
    m_state = State::Connecting;

    m_endpoint.connect(connection);
}

void WebSocketClient::handleOpen(websocketpp::connection_hdl hdl) {
    if (m_state == State::Closing) {
        // close() ran while the upgrade was in flight
        websocketpp::lib::error_code ec;
        m_endpoint.close(hdl, websocketpp::close::status::normal, "", ec);
        return;
    }

    if (m_state != State::Connecting) {
        return;
    }

    m_state = State::Open;
    LOG_DEBUG("[WS] Connected to {}:{}", m_host, m_port);

    auto handler = std::move(m_openHandler);
    if (handler) {
        handler(asio::error_code());
    }
}

void WebSocketClient::handleFail(websocketpp::connection_hdl hdl) {
    asio::error_code error = connectionError(hdl, asio::error::connection_refused);
    bool opening = m_state == State::Connecting;
    m_state = State::Closed;

    if (!opening) {
        // A failure after open still ends the connection
        LOG_ERROR("[WS] Connection to {}:{} failed: {}", m_host, m_port, error.message());
        auto handler = std::move(m_closeHandler);
        if (handler) {
            handler(error);
        }
        return;
    }

    LOG_DEBUG("[WS] Upgrade to {}:{} failed: {}", m_host, m_port, error.message());

    auto handler = std::move(m_openHandler);
    if (handler) {
        handler(error);
    }
}

void WebSocketClient::handleMessage(websocketpp::connection_hdl hdl, WsMessagePtr message) {
    (void)hdl;

    if (message->get_opcode() != websocketpp::frame::opcode::text) {
        LOG_TRACE("[WS] Ignoring binary message ({} bytes)", message->get_payload().size());
        return;
    }

    if (m_messageHandler) {
        m_messageHandler(message->get_payload());
    }
}

void WebSocketClient::handleClose(websocketpp::connection_hdl hdl) {
    asio::error_code fallback = m_state == State::Closing
        ? asio::error_code(asio::error::operation_aborted)
        : asio::error_code(asio::error::eof);
    asio::error_code error = connectionError(hdl, fallback);
    m_state = State::Closed;

    LOG_DEBUG("[WS] Closed connection to {}:{} ({})", m_host, m_port, error.message());

    auto handler = std::move(m_closeHandler);
    if (handler) {
        handler(error);
    }
}

void WebSocketClient::sendText(const std::string& text) {
    if (m_state != State::Open) {
        LOG_DEBUG("[WS] Dropping message, socket not open");
        return;
    }

    websocketpp::lib::error_code ec;
    m_endpoint.send(m_hdl, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        LOG_ERROR("[WS] Send to {}:{} failed: {}", m_host, m_port, ec.message());
    }
}

void WebSocketClient::close() {
    if (m_state != State::Open && m_state != State::Connecting) {
        return;
    }

    bool opening = m_state == State::Connecting;
    m_state = State::Closing;

    websocketpp::lib::error_code ec;
    m_endpoint.close(m_hdl, websocketpp::close::status::normal, "", ec);
    if (ec) {
        LOG_DEBUG("[WS] Close of {}:{} reported: {}", m_host, m_port, ec.message());
    }

    if (opening) {
        auto handler = std::move(m_openHandler);
        if (handler) {
            handler(asio::error::operation_aborted);
        }
    }
}

asio::error_code WebSocketClient::connectionError(websocketpp::connection_hdl hdl,
                                                  const asio::error_code& fallback) {
    websocketpp::lib::error_code ec;
    WsConnectionPtr connection = m_endpoint.get_con_from_hdl(hdl, ec);
    if (ec || !connection || !connection->get_ec()) {
        return fallback;
    }
    return connection->get_ec();
}

} // namespace lolc::network

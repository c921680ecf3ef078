#pragma once

#include "lcu/credentials.hpp"
#include "lcu/requester.hpp"
#include "network/http_client.hpp"
#include "network/websocket_client.hpp"
#include "utils/config.hpp"
#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace lolc::lcu {

/**
 * Connection Handle
 * 
 * Owns one transport to the local endpoint: request/response calls plus
 * the push-event stream. A handle is opened at most once; reconnecting
 * means building a new one.
 * 
 * Every method and every handler runs on the owning io_context thread.
 */
class LcuConnection : public Requester {
public:
    using OpenHandler = std::function<void(const asio::error_code&)>;
    using EventHandler = std::function<void(const Event&)>;
    using CloseHandler = std::function<void(const asio::error_code&)>;
    
    // Fires once; success means the event subscription is live
    virtual void open(OpenHandler handler) = 0;
    
    // Intentional close; the close handler is not invoked
    virtual void close() = 0;
    
    virtual bool isOpen() const = 0;
    
    void setEventHandler(EventHandler handler) { m_eventHandler = std::move(handler); }
    
    // Invoked once when the transport drops on its own
    void setCloseHandler(CloseHandler handler) { m_closeHandler = std::move(handler); }
    
protected:
    EventHandler m_eventHandler;
    CloseHandler m_closeHandler;
};

/**
 * Connection to the running League client.
 * 
 * open() discovers credentials, upgrades a TLS WebSocket on
 * 127.0.0.1:<port> and subscribes to every JSON API event. Requests are
 * independent HTTPS exchanges with Basic auth. The client's certificate
 * is self-signed, so peer verification is off for this endpoint.
 */
class LcuClientConnection : public LcuConnection,
                            public std::enable_shared_from_this<LcuClientConnection> {
public:
    LcuClientConnection(asio::io_context& io_context, const utils::AppConfig& config, uint32_t id);
    ~LcuClientConnection() override;
    
    void open(OpenHandler handler) override;
    void close() override;
    bool isOpen() const override { return m_open; }
    
    void request(const std::string& method,
                 const std::string& path,
                 const std::optional<nlohmann::json>& body,
                 ResponseHandler handler) override;
    
    uint32_t getId() const { return m_id; }
    
private:
    void handleWebSocketOpen(const asio::error_code& error, OpenHandler handler);
    void handleMessage(const std::string& message);
    void handleWebSocketClosed(const asio::error_code& error);
    void cancelRequests();
    
    asio::io_context& m_io_context;
    std::shared_ptr<asio::ssl::context> m_sslContext;
    uint32_t m_id;
    std::string m_lockfilePath;
    std::chrono::milliseconds m_timeout;
    
    std::optional<Credentials> m_credentials;
    std::string m_authorization;
    std::shared_ptr<network::WebSocketClient> m_socket;
    std::vector<std::weak_ptr<network::HttpSession>> m_requests;
    
    bool m_open = false;
    bool m_closed = false;
};

} // namespace lolc::lcu

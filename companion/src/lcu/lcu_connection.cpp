#include "lcu/lcu_connection.hpp"
#include "lcu/event_router.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace lolc::lcu {

LcuClientConnection::LcuClientConnection(asio::io_context& io_context,
                                         const utils::AppConfig& config,
                                         uint32_t id)
    : m_io_context(io_context)
    , m_sslContext(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client))
    , m_id(id)
    , m_lockfilePath(config.lockfile_path)
    , m_timeout(config.local_timeout_ms)
{
    m_sslContext->set_verify_mode(asio::ssl::verify_none);
}

LcuClientConnection::~LcuClientConnection() {
    LOG_TRACE("[LCU #{}] Connection handle destroyed", m_id);
}

void LcuClientConnection::open(OpenHandler handler) {
    if (m_closed || m_socket) {
        asio::post(m_io_context, [handler]() {
            handler(asio::error::already_started);
        });
        return;
    }
    
    m_credentials = discoverCredentials(m_lockfilePath);
    if (!m_credentials) {
        LOG_DEBUG("[LCU #{}] League client not running", m_id);
        asio::post(m_io_context, [handler]() {
            handler(asio::error::connection_refused);
        });
        return;
    }
    
    LOG_DEBUG("[LCU #{}] Found League client on port {} (pid {})",
              m_id, m_credentials->port, m_credentials->pid);
    
    m_authorization = network::basicAuthorization(Credentials::kUsername, m_credentials->password);
    m_socket = std::make_shared<network::WebSocketClient>(
        m_io_context, m_sslContext, Credentials::kHost, m_credentials->port, m_timeout);
    
    std::weak_ptr<LcuClientConnection> weak = shared_from_this();
    
    m_socket->setMessageHandler([weak](const std::string& message) {
        if (auto self = weak.lock()) {
            self->handleMessage(message);
        }
    });
    m_socket->setCloseHandler([weak](const asio::error_code& error) {
        if (auto self = weak.lock()) {
            self->handleWebSocketClosed(error);
        }
    });
    
    m_socket->connect("/", {{"Authorization", m_authorization}},
        [weak, handler](const asio::error_code& error) {
            auto self = weak.lock();
            if (!self) {
                handler(asio::error::operation_aborted);
                return;
            }
            self->handleWebSocketOpen(error, handler);
        }
    );
}

void LcuClientConnection::handleWebSocketOpen(const asio::error_code& error, OpenHandler handler) {
    if (error) {
        LOG_DEBUG("[LCU #{}] WebSocket upgrade failed: {}", m_id, error.message());
        handler(error);
        return;
    }
    
    if (m_closed) {
        handler(asio::error::operation_aborted);
        return;
    }
    
    m_socket->sendText(kSubscribeAllEvents);
    m_open = true;
    
    LOG_INFO("[LCU #{}] Connected to League client on port {}", m_id, m_credentials->port);
    handler(asio::error_code());
}

void LcuClientConnection::handleMessage(const std::string& message) {
    // Subscription acks and other WAMP traffic arrive as empty or non-event messages
    if (message.empty()) {
        return;
    }
    
    auto event = parseEventMessage(message);
    if (!event) {
        LOG_TRACE("[LCU #{}] Ignoring non-event message ({} bytes)", m_id, message.size());
        return;
    }
    
    if (m_eventHandler) {
        m_eventHandler(*event);
    }
}

void LcuClientConnection::handleWebSocketClosed(const asio::error_code& error) {
    bool notify = !m_closed;
    
    m_open = false;
    m_closed = true;
    cancelRequests();
    
    if (!notify) {
        return;
    }
    
    LOG_WARN("[LCU #{}] Connection to League client lost: {}", m_id, error.message());
    
    auto handler = std::move(m_closeHandler);
    if (handler) {
        handler(error);
    }
}

void LcuClientConnection::close() {
    if (m_closed) return;
    
    LOG_DEBUG("[LCU #{}] Closing connection", m_id);
    
    m_open = false;
    m_closed = true;
    cancelRequests();
    
    if (m_socket) {
        m_socket->close();
    }
}

void LcuClientConnection::request(const std::string& method,
                                  const std::string& path,
                                  const std::optional<nlohmann::json>& body,
                                  ResponseHandler handler) {
    if (!m_open) {
        asio::post(m_io_context, [handler]() {
            handler(asio::error::not_connected, Response());
        });
        return;
    }
    
    network::HttpRequest request;
    request.method = method;
    request.target = path;
    request.headers.emplace_back("Authorization", m_authorization);
    request.headers.emplace_back("Accept", "application/json");
    if (body) {
        request.headers.emplace_back("Content-Type", "application/json");
        request.body = body->dump();
    }
    
    // Drop bookkeeping for finished exchanges
    m_requests.erase(
        std::remove_if(m_requests.begin(), m_requests.end(),
                       [](const std::weak_ptr<network::HttpSession>& session) {
                           return session.expired();
                       }),
        m_requests.end());
    
    auto session = std::make_shared<network::HttpSession>(
        m_io_context, *m_sslContext, Credentials::kHost, m_credentials->port, m_timeout, false);
    m_requests.push_back(session);
    
    uint32_t id = m_id;
    session->start(request, [id, method, path, handler](const asio::error_code& error,
                                                        network::HttpResponse response) {
        if (error) {
            LOG_DEBUG("[LCU #{}] {} {} failed: {}", id, method, path, error.message());
            handler(error, Response());
            return;
        }
        
        LOG_TRACE("[LCU #{}] {} {} -> {}", id, method, path, response.status);
        handler(asio::error_code(), Response{response.status, std::move(response.body)});
    });
}

void LcuClientConnection::cancelRequests() {
    auto requests = std::move(m_requests);
    m_requests.clear();
    
    for (auto& weak : requests) {
        if (auto session = weak.lock()) {
            session->cancel();
        }
    }
}

} // namespace lolc::lcu

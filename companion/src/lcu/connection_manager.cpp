#include "lcu/connection_manager.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace lolc::lcu {

const char* toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Idle:         return "Idle";
        case ConnectionStatus::Connecting:   return "Connecting";
        case ConnectionStatus::Connected:    return "Connected";
        case ConnectionStatus::Disconnected: return "Disconnected";
        case ConnectionStatus::Exhausted:    return "Exhausted";
    }
    return "Unknown";
}

ConnectionManager::Settings ConnectionManager::Settings::fromConfig(const utils::AppConfig& config) {
    Settings settings;
    settings.maxAttempts = static_cast<int>(config.connect_max_attempts);
    settings.retryDelay = std::chrono::milliseconds(config.connect_retry_delay_ms);
    settings.reconnect = config.reconnect;
    return settings;
}

ConnectionManager::ConnectionManager(asio::io_context& io_context,
                                     session::SessionStateModel& model,
                                     session::ActionDispatcher& dispatcher,
                                     ConnectionFactory factory,
                                     Settings settings)
    : m_io_context(io_context)
    , m_model(model)
    , m_dispatcher(dispatcher)
    , m_factory(std::move(factory))
    , m_settings(settings)
    , m_retry(settings.maxAttempts, settings.retryDelay)
    , m_retryTimer(io_context)
    , m_tracker(model)
{
    m_tracker.registerHandlers(m_router);
}

ConnectionManager::~ConnectionManager() {
    if (m_connection) {
        m_connection->close();
        m_connection.reset();
    }
}

std::future<void> ConnectionManager::connect() {
    auto waiter = std::make_shared<std::promise<void>>();
    std::future<void> future = waiter->get_future();
    
    asio::post(m_io_context, [this, waiter]() {
        if (m_status == ConnectionStatus::Connected) {
            waiter->set_value();
            return;
        }
        
        m_waiters.push_back(waiter);
        if (m_status != ConnectionStatus::Connecting) {
            startCycle();
        }
    });
    
    return future;
}

void ConnectionManager::disconnect() {
    asio::post(m_io_context, [this]() {
        m_retryTimer.cancel();
        
        if (m_connection) {
            LOG_INFO("Disconnecting from League client");
            m_connection->close();
            m_connection.reset();
        }
        m_connectionId = 0;
        
        dropSession();
        failWaiters(std::make_exception_ptr(NotConnectedError("Connection cancelled")));
        setStatus(ConnectionStatus::Disconnected, "disconnected");
    });
}

void ConnectionManager::startCycle() {
    m_retry.reset();
    setStatus(ConnectionStatus::Connecting);
    attempt();
}

void ConnectionManager::attempt() {
    uint32_t id = ++m_nextId;
    m_connectionId = id;
    m_connection = m_factory(m_io_context, id);
    
    LOG_DEBUG("Connecting to League client (attempt {}/{})",
              m_retry.attempts() + 1, m_retry.maxAttempts());
    
    m_connection->setEventHandler([this, id](const Event& event) {
        handleEvent(id, event);
    });
    m_connection->setCloseHandler([this, id](const asio::error_code& error) {
        handleClosed(id, error);
    });
    m_connection->open([this, id](const asio::error_code& error) {
        handleOpen(id, error);
    });
}

void ConnectionManager::scheduleRetry() {
    m_retryTimer.expires_after(m_retry.delay());
    m_retryTimer.async_wait([this](const asio::error_code& error) {
        if (error == asio::error::operation_aborted) {
            return;
        }
        if (m_status == ConnectionStatus::Connecting && !m_connection) {
            attempt();
        }
    });
}

void ConnectionManager::handleOpen(uint32_t id, const asio::error_code& error) {
    // Stale: the handle was replaced or disconnected meanwhile
    if (id != m_connectionId) {
        return;
    }
    
    if (!error) {
        m_retry.reset();
        auto connection = m_connection;
        m_tracker.handshake(connection, [this, id]() {
            handleHandshake(id);
        });
        return;
    }
    
    m_connection.reset();
    m_connectionId = 0;
    
    RetryPolicy::Decision decision = m_retry.recordFailure();
    LOG_WARN("Failed to connect to League client (attempt {}/{}): {}",
             m_retry.attempts(), m_retry.maxAttempts(), error.message());
    
    if (decision == RetryPolicy::Decision::Exhausted) {
        LOG_ERROR("Giving up on the League client after {} attempts", m_retry.attempts());
        failWaiters(std::make_exception_ptr(ConnectionExhausted(m_retry.attempts())));
        setStatus(ConnectionStatus::Exhausted, std::to_string(m_retry.attempts()) + " attempts");
        return;
    }
    
    scheduleRetry();
}

void ConnectionManager::handleHandshake(uint32_t id) {
    if (id != m_connectionId || !m_connection) {
        return;
    }
    
    m_dispatcher.attach(m_connection);
    setStatus(ConnectionStatus::Connected);
    resolveWaiters();
}

void ConnectionManager::handleEvent(uint32_t id, const Event& event) {
    if (id != m_connectionId || !m_connection) {
        return;
    }
    
    std::shared_ptr<Requester> requester = m_connection;
    m_router.dispatch(requester, event);
}

void ConnectionManager::handleClosed(uint32_t id, const asio::error_code& error) {
    if (id != m_connectionId) {
        return;
    }
    
    LOG_WARN("Lost connection to League client: {}", error.message());
    
    m_connection.reset();
    m_connectionId = 0;
    dropSession();
    
    if (m_settings.reconnect) {
        LOG_INFO("Reconnecting to League client");
        startCycle();
        return;
    }
    
    failWaiters(std::make_exception_ptr(ConnectionError("Connection to League client lost")));
    setStatus(ConnectionStatus::Disconnected, error.message());
}

void ConnectionManager::dropSession() {
    m_tracker.invalidate();
    m_model.reset();
    m_dispatcher.detach();
}

void ConnectionManager::setStatus(ConnectionStatus status, const std::string& detail) {
    ConnectionStatus previous = m_status.exchange(status);
    if (previous == status) {
        return;
    }
    
    LOG_DEBUG("Connection status: {} -> {}", toString(previous), toString(status));
    if (m_statusHandler) {
        m_statusHandler(status, detail);
    }
}

void ConnectionManager::resolveWaiters() {
    auto waiters = std::move(m_waiters);
    m_waiters.clear();
    for (auto& waiter : waiters) {
        waiter->set_value();
    }
}

void ConnectionManager::failWaiters(std::exception_ptr error) {
    auto waiters = std::move(m_waiters);
    m_waiters.clear();
    for (auto& waiter : waiters) {
        waiter->set_exception(error);
    }
}

} // namespace lolc::lcu

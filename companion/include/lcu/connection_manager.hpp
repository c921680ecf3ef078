#pragma once

#include "lcu/event_router.hpp"
#include "lcu/lcu_connection.hpp"
#include "lcu/retry_policy.hpp"
#include "session/action_dispatcher.hpp"
#include "session/session_state.hpp"
#include "session/session_tracker.hpp"
#include "utils/config.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace lolc::lcu {

enum class ConnectionStatus {
    Idle,
    Connecting,
    Connected,
    Disconnected,
    Exhausted,
};

const char* toString(ConnectionStatus status);

/**
 * Local Connection Manager
 * 
 * Owns the lifecycle of the connection to the League client:
 * - connect with a bounded, fixed-delay retry (fresh handle per attempt)
 * - handshake, then hand the handle to the dispatcher
 * - route push events in arrival order
 * - on a drop, reset the session state and reconnect or stop
 * 
 * Internal state lives on the io_context thread. connect(), disconnect()
 * and status() may be called from any thread. Destroy only after the
 * io_context has stopped running.
 */
class ConnectionManager {
public:
    using ConnectionFactory = std::function<std::shared_ptr<LcuConnection>(asio::io_context&, uint32_t)>;
    using StatusHandler = std::function<void(ConnectionStatus, const std::string&)>;
    
    struct Settings {
        int maxAttempts = 30;
        std::chrono::milliseconds retryDelay{10000};
        bool reconnect = true;
        
        static Settings fromConfig(const utils::AppConfig& config);
    };
    
    ConnectionManager(asio::io_context& io_context,
                      session::SessionStateModel& model,
                      session::ActionDispatcher& dispatcher,
                      ConnectionFactory factory,
                      Settings settings);
    ~ConnectionManager();
    
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    
    // Resolves once a handle is open and the handshake has run;
    // fails with ConnectionExhausted when every attempt failed
    std::future<void> connect();
    
    // Stop retrying and close the current handle, if any
    void disconnect();
    
    ConnectionStatus status() const { return m_status.load(); }
    
    // Runs on the io_context thread; set before connect()
    void setStatusHandler(StatusHandler handler) { m_statusHandler = std::move(handler); }
    
    EventRouter& getRouter() { return m_router; }
    const RetryPolicy& getRetryPolicy() const { return m_retry; }
    
private:
    void startCycle();
    void attempt();
    void scheduleRetry();
    
    void handleOpen(uint32_t id, const asio::error_code& error);
    void handleHandshake(uint32_t id);
    void handleEvent(uint32_t id, const Event& event);
    void handleClosed(uint32_t id, const asio::error_code& error);
    
    void dropSession();
    void setStatus(ConnectionStatus status, const std::string& detail = std::string());
    void resolveWaiters();
    void failWaiters(std::exception_ptr error);
    
    asio::io_context& m_io_context;
    session::SessionStateModel& m_model;
    session::ActionDispatcher& m_dispatcher;
    ConnectionFactory m_factory;
    Settings m_settings;
    
    RetryPolicy m_retry;
    asio::steady_timer m_retryTimer;
    EventRouter m_router;
    session::SessionTracker m_tracker;
    
    std::shared_ptr<LcuConnection> m_connection;
    uint32_t m_connectionId = 0;
    uint32_t m_nextId = 0;
    
    std::atomic<ConnectionStatus> m_status{ConnectionStatus::Idle};
    StatusHandler m_statusHandler;
    std::vector<std::shared_ptr<std::promise<void>>> m_waiters;
};

} // namespace lolc::lcu

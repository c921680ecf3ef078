#pragma once

#include "backend/backend_client.hpp"
#include "lcu/connection_manager.hpp"
#include "lobby/lobby_joiner.hpp"
#include "session/action_dispatcher.hpp"
#include "session/session_state.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace lolc::app {

/**
 * Companion Application
 * 
 * Console shell around the companion core. The calling thread is the UI
 * context: it ticks every 100ms, drains typed commands and connection
 * notices, and polls outstanding futures without ever waiting on them.
 * The local connection runs on a dedicated io_context thread; backend
 * calls run on std::async workers.
 */
class CompanionApp {
public:
    static constexpr const char* kClientVersion = "1.0.0";
    static constexpr std::chrono::milliseconds kTickInterval{100};
    
    CompanionApp(utils::Config& config,
                 std::shared_ptr<network::HttpTransport> transport,
                 lcu::ConnectionManager::ConnectionFactory factory,
                 std::ostream& output);
    ~CompanionApp();
    
    CompanionApp(const CompanionApp&) = delete;
    CompanionApp& operator=(const CompanionApp&) = delete;
    
    // Starts the io thread, connects, and checks a stored registration
    void start();
    
    // Forwards stdin lines to the UI loop from a reader thread
    void startInputReader();
    
    // UI loop; returns after requestStop()
    void run();
    
    // Safe from any thread and from a signal handler
    void requestStop() { m_running = false; }
    
    // Disconnects and joins the io thread
    void stop();
    
    // One UI step: handle queued input and notices, poll futures
    void tick();
    
    void handleCommand(const std::string& line);
    
    size_t pendingTasks() const { return m_pending.size(); }
    bool isRunning() const { return m_running; }
    
    session::SessionStateModel& getModel() { return m_model; }
    lcu::ConnectionManager& getConnections() { return m_connections; }
    
private:
    struct Inbox {
        std::mutex mutex;
        std::deque<std::string> lines;
        std::deque<std::string> notices;
        bool inputClosed = false;
    };
    
    using PendingTask = std::function<bool()>;
    
    template <typename T, typename Handler>
    void track(std::future<T> future, Handler handler) {
        auto shared = std::make_shared<std::future<T>>(std::move(future));
        m_pending.push_back([shared, handler]() mutable {
            if (shared->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return false;
            }
            try {
                handler(*shared);
            }
            catch (const std::exception& e) {
                LOG_ERROR("Background task failed: {}", e.what());
            }
            return true;
        });
    }
    
    void checkRegistration();
    void handleStatusChange(lcu::ConnectionStatus status, const std::string& detail);
    void pushNotice(const std::string& notice);
    
    void commandRegister(const std::vector<std::string>& args);
    void commandJoin(const std::vector<std::string>& args);
    void commandStatus();
    void commandUpdate();
    void commandConnect();
    void printHelp();
    
    void say(const std::string& message);
    
    utils::Config& m_config;
    std::ostream& m_output;
    
    asio::io_context m_io_context;
    asio::executor_work_guard<asio::io_context::executor_type> m_workGuard;
    std::thread m_ioThread;
    
    session::SessionStateModel m_model;
    session::ActionDispatcher m_dispatcher;
    lcu::ConnectionManager m_connections;
    lobby::LobbyJoiner m_joiner;
    backend::BackendClient m_backend;
    
    std::shared_ptr<Inbox> m_inbox;
    std::atomic<bool> m_running{false};
    bool m_stopped = false;
    
    // Declared last so std::async workers finish before the backend goes away
    std::vector<PendingTask> m_pending;
};

} // namespace lolc::app

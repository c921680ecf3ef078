#include "session/action_dispatcher.hpp"
#include "utils/logger.hpp"

namespace lolc::session {

ActionDispatcher::ActionDispatcher(asio::io_context& io_context)
    : m_io_context(io_context)
{
}

void ActionDispatcher::attach(std::shared_ptr<lcu::Requester> requester) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_requester = std::move(requester);
}

void ActionDispatcher::detach() {
    std::deque<Job> cancelled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requester.reset();
        cancelled.swap(m_queue);
    }
    
    if (!cancelled.empty()) {
        LOG_DEBUG("[Dispatcher] Connection lost, failing {} queued job(s)", cancelled.size());
    }
    
    auto error = std::make_exception_ptr(NotConnectedError());
    for (auto& job : cancelled) {
        job.cancel(error);
    }
}

bool ActionDispatcher::isAttached() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requester != nullptr;
}

size_t ActionDispatcher::pendingJobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void ActionDispatcher::enqueue(Job job) {
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_requester) {
            m_queue.push_back(std::move(job));
            queued = true;
        }
    }
    
    // Not connected: fail fast on the caller's thread
    if (!queued) {
        job.cancel(std::make_exception_ptr(NotConnectedError()));
        return;
    }
    
    // One runNext per job; posts on a single-threaded context keep FIFO order
    asio::post(m_io_context, [this]() {
        runNext();
    });
}

void ActionDispatcher::runNext() {
    Job job;
    std::shared_ptr<lcu::Requester> requester;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return;
        }
        job = std::move(m_queue.front());
        m_queue.pop_front();
        requester = m_requester;
    }
    
    if (!requester) {
        job.cancel(std::make_exception_ptr(NotConnectedError()));
        return;
    }
    
    job.run(requester);
}

} // namespace lolc::session

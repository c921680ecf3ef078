#pragma once

#include "lcu/requester.hpp"
#include "utils/errors.hpp"
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

namespace lolc::session {

/**
 * Result channel of one dispatched job.
 * 
 * Copies share the same promise. Only the first succeed/fail lands,
 * later ones are ignored, so a job and a cancellation may race safely.
 */
template <typename T>
class Completion {
public:
    Completion() : m_state(std::make_shared<State>()) {}
    
    // May be called once
    std::future<T> future() { return m_state->promise.get_future(); }
    
    template <typename... Args>
    void succeed(Args&&... args) {
        if (m_state->done.exchange(true)) return;
        m_state->promise.set_value(std::forward<Args>(args)...);
    }
    
    void fail(std::exception_ptr error) {
        if (m_state->done.exchange(true)) return;
        m_state->promise.set_exception(error);
    }
    
    template <typename E, typename... Args>
    void failWith(Args&&... args) {
        fail(std::make_exception_ptr(E(std::forward<Args>(args)...)));
    }
    
    // Local transport failure reported by a Requester
    void failTransport(const asio::error_code& error) {
        if (error == asio::error::not_connected || error == asio::error::operation_aborted) {
            failWith<NotConnectedError>();
        }
        else {
            failWith<ConnectionError>("League client request failed: " + error.message());
        }
    }
    
    bool done() const { return m_state->done.load(); }
    
private:
    struct State {
        std::promise<T> promise;
        std::atomic<bool> done{false};
    };
    
    std::shared_ptr<State> m_state;
};

/**
 * Action Dispatcher
 * 
 * Hands work from the UI thread to the connection's io_context thread.
 * Jobs start in FIFO order against the connection attached when they
 * start. An async job may still be waiting on its requests when the
 * next one starts. Results come back through a std::future that the
 * caller polls. With no connection attached a job fails with
 * NotConnectedError, and detaching fails every job still queued.
 */
class ActionDispatcher {
public:
    template <typename T>
    using SyncJob = std::function<T(lcu::Requester&)>;
    
    // Asynchronous job: must eventually complete its Completion
    template <typename T>
    using AsyncJob = std::function<void(std::shared_ptr<lcu::Requester>, Completion<T>)>;
    
    explicit ActionDispatcher(asio::io_context& io_context);
    
    template <typename T>
    std::future<T> invokeOnConnectionContext(SyncJob<T> fn) {
        return invokeAsync<T>(
            [fn = std::move(fn)](std::shared_ptr<lcu::Requester> requester, Completion<T> completion) {
                if constexpr (std::is_void_v<T>) {
                    fn(*requester);
                    completion.succeed();
                }
                else {
                    completion.succeed(fn(*requester));
                }
            });
    }
    
    template <typename T>
    std::future<T> invokeAsync(AsyncJob<T> fn) {
        Completion<T> completion;
        std::future<T> future = completion.future();
        
        Job job;
        job.run = [fn = std::move(fn), completion](const std::shared_ptr<lcu::Requester>& requester) mutable {
            try {
                fn(requester, completion);
            }
            catch (...) {
                completion.fail(std::current_exception());
            }
        };
        job.cancel = [completion](std::exception_ptr error) mutable {
            completion.fail(error);
        };
        
        enqueue(std::move(job));
        return future;
    }
    
    // Called on the io_context thread by the connection manager
    void attach(std::shared_ptr<lcu::Requester> requester);
    void detach();
    
    bool isAttached() const;
    size_t pendingJobs() const;
    
private:
    struct Job {
        std::function<void(const std::shared_ptr<lcu::Requester>&)> run;
        std::function<void(std::exception_ptr)> cancel;
    };
    
    void enqueue(Job job);
    void runNext();
    
    asio::io_context& m_io_context;
    
    mutable std::mutex m_mutex;
    std::deque<Job> m_queue;
    std::shared_ptr<lcu::Requester> m_requester;
};

} // namespace lolc::session

#include "test_framework.hpp"
#include "fakes.hpp"
#include "session/action_dispatcher.hpp"

using namespace lolc;
using namespace lolc::test;

TEST(Dispatcher_NotConnectedWithoutHandle) {
    asio::io_context io_context;
    session::ActionDispatcher dispatcher(io_context);
    
    bool ran = false;
    auto future = dispatcher.invokeOnConnectionContext<int>([&](lcu::Requester&) {
        ran = true;
        return 1;
    });
    
    // Fails before anything is queued
    ASSERT_TRUE(isReady(future));
    ASSERT_THROWS(future.get(), NotConnectedError);
    ASSERT_FALSE(ran);
    ASSERT_EQ(dispatcher.pendingJobs(), 0u);
    PASS();
}

TEST(Dispatcher_RunsJobsInFifoOrder) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    session::ActionDispatcher dispatcher(io_context);
    dispatcher.attach(endpoint);
    
    std::vector<int> order;
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 5; i++) {
        futures.push_back(dispatcher.invokeOnConnectionContext<int>([&order, i](lcu::Requester&) {
            order.push_back(i);
            return i * 10;
        }));
    }
    ASSERT_EQ(dispatcher.pendingJobs(), 5u);
    
    ASSERT_TRUE(runUntil(io_context, [&]() { return isReady(futures.back()); }));
    
    ASSERT_EQ(order.size(), 5u);
    for (int i = 0; i < 5; i++) {
        ASSERT_EQ(order[i], i);
        ASSERT_EQ(futures[i].get(), i * 10);
    }
    PASS();
}

TEST(Dispatcher_AsyncJobsStartInOrderButMayOverlap) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    session::ActionDispatcher dispatcher(io_context);
    dispatcher.attach(endpoint);
    
    std::vector<std::string> events;
    std::optional<session::Completion<int>> first;
    
    auto slow = dispatcher.invokeAsync<int>(
        [&](std::shared_ptr<lcu::Requester>, session::Completion<int> completion) {
            events.push_back("first started");
            first = completion;
        });
    auto fast = dispatcher.invokeOnConnectionContext<int>([&](lcu::Requester&) {
        events.push_back("second started");
        return 2;
    });
    
    ASSERT_TRUE(runUntil(io_context, [&]() { return isReady(fast); }));
    
    // The second job ran while the first was still open
    ASSERT_EQ(events.size(), 2u);
    ASSERT_STREQ(events[0], "first started");
    ASSERT_STREQ(events[1], "second started");
    ASSERT_FALSE(isReady(slow));
    ASSERT_EQ(fast.get(), 2);
    
    first->succeed(1);
    ASSERT_TRUE(isReady(slow));
    ASSERT_EQ(slow.get(), 1);
    PASS();
}

TEST(Dispatcher_JobExceptionReachesFuture) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    session::ActionDispatcher dispatcher(io_context);
    dispatcher.attach(endpoint);
    
    auto future = dispatcher.invokeOnConnectionContext<void>([](lcu::Requester&) {
        throw JoinFailed("Lobby is full");
    });
    ASSERT_TRUE(runUntil(io_context, [&]() { return isReady(future); }));
    ASSERT_THROWS(future.get(), JoinFailed);
    PASS();
}

TEST(Dispatcher_AsyncJobUsesRequester) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    endpoint->respond("GET", lcu::endpoints::kGameflowPhase, 200, "\"Lobby\"");
    
    session::ActionDispatcher dispatcher(io_context);
    dispatcher.attach(endpoint);
    
    auto future = dispatcher.invokeAsync<std::string>(
        [](std::shared_ptr<lcu::Requester> requester, session::Completion<std::string> completion) {
            requester->get(lcu::endpoints::kGameflowPhase,
                [completion](const asio::error_code& error, const lcu::Response& response) mutable {
                    if (error) {
                        completion.failTransport(error);
                        return;
                    }
                    completion.succeed(response.body);
                });
        });
    
    ASSERT_TRUE(runUntil(io_context, [&]() { return isReady(future); }));
    ASSERT_STREQ(future.get(), "\"Lobby\"");
    PASS();
}

TEST(Dispatcher_DetachFailsQueuedJobs) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    session::ActionDispatcher dispatcher(io_context);
    dispatcher.attach(endpoint);
    
    int ran = 0;
    auto first = dispatcher.invokeOnConnectionContext<int>([&](lcu::Requester&) { return ++ran; });
    auto second = dispatcher.invokeOnConnectionContext<int>([&](lcu::Requester&) { return ++ran; });
    
    dispatcher.detach();
    ASSERT_TRUE(isReady(first));
    ASSERT_TRUE(isReady(second));
    
    // The posted run steps find nothing to do
    runUntil(io_context, []() { return false; }, std::chrono::milliseconds(20));
    
    ASSERT_THROWS(first.get(), NotConnectedError);
    ASSERT_THROWS(second.get(), NotConnectedError);
    ASSERT_EQ(ran, 0);
    ASSERT_FALSE(dispatcher.isAttached());
    PASS();
}

TEST(Dispatcher_TransportErrorsAreTyped) {
    session::Completion<int> dropped;
    auto droppedFuture = dropped.future();
    dropped.failTransport(asio::error::not_connected);
    ASSERT_THROWS(droppedFuture.get(), NotConnectedError);
    
    session::Completion<int> refused;
    auto refusedFuture = refused.future();
    refused.failTransport(asio::error::connection_refused);
    refused.succeed(1);
    ASSERT_THROWS(refusedFuture.get(), ConnectionError);
    PASS();
}

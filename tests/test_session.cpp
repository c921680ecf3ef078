#include "test_framework.hpp"
#include "fakes.hpp"
#include "session/session_state.hpp"
#include "session/session_tracker.hpp"
#include <atomic>
#include <thread>

using namespace lolc;
using namespace lolc::test;

// =============================================================================
// Session state model
// =============================================================================

TEST(SessionState_ResetClearsEverything) {
    session::SessionStateModel model;
    model.update([](session::SessionState& state) {
        state.ready = true;
        state.phase = "Lobby";
        state.identity = lcu::PlayerIdentity{"Ana", "NA1"};
        state.region = "NA";
    });
    uint64_t version = model.version();
    
    model.reset();
    
    auto state = model.snapshot();
    ASSERT_FALSE(state.ready);
    ASSERT_FALSE(state.phase.has_value());
    ASSERT_FALSE(state.identity.has_value());
    ASSERT_FALSE(state.region.has_value());
    ASSERT_EQ(model.version(), version + 1);
    PASS();
}

TEST(SessionState_SnapshotsAreNeverTorn) {
    session::SessionStateModel model;
    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};
    
    std::thread writer([&]() {
        for (int i = 0; i < 20000; i++) {
            std::string value = std::to_string(i);
            model.update([&](session::SessionState& state) {
                state.phase = value;
                state.identity = lcu::PlayerIdentity{value, value};
                state.region = value;
            });
        }
        done = true;
    });
    
    std::thread reader([&]() {
        while (!done) {
            auto state = model.snapshot();
            if (!state.phase) continue;
            if (!state.identity || !state.region ||
                state.identity->name != *state.phase || *state.region != *state.phase) {
                torn = true;
            }
        }
    });
    
    writer.join();
    reader.join();
    
    ASSERT_FALSE(torn.load());
    ASSERT_STREQ(*model.snapshot().phase, "19999");
    PASS();
}

// =============================================================================
// Handshake
// =============================================================================

TEST(Tracker_Handshake_PopulatesState) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    scriptHealthyClient(*endpoint);
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    bool finished = false;
    tracker.handshake(endpoint, [&]() { finished = true; });
    ASSERT_TRUE(runUntil(io_context, [&]() { return finished; }));
    
    auto state = model.snapshot();
    ASSERT_TRUE(state.ready);
    ASSERT_STREQ(*state.phase, "Lobby");
    ASSERT_TRUE(state.identity == (lcu::PlayerIdentity{"Ana", "NA1"}));
    ASSERT_STREQ(*state.region, "NA");
    PASS();
}

TEST(Tracker_Handshake_CompletesWithoutSummoner) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    endpoint->respond("GET", lcu::endpoints::kGameflowPhase, 200, "\"None\"");
    endpoint->respond("GET", lcu::endpoints::kCurrentSummoner, 404, R"({"message":"not logged in"})");
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    bool finished = false;
    tracker.handshake(endpoint, [&]() { finished = true; });
    ASSERT_TRUE(runUntil(io_context, [&]() { return finished; }));
    
    auto state = model.snapshot();
    ASSERT_TRUE(state.ready);
    ASSERT_STREQ(*state.phase, "None");
    ASSERT_FALSE(state.identity.has_value());
    ASSERT_FALSE(state.region.has_value());
    ASSERT_EQ(endpoint->count("GET", lcu::endpoints::kRegionLocale), 0u);
    PASS();
}

TEST(Tracker_Handshake_DiscardedAfterInvalidate) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    scriptHealthyClient(*endpoint);
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    bool finished = false;
    tracker.handshake(endpoint, [&]() { finished = true; });
    tracker.invalidate();
    ASSERT_TRUE(runUntil(io_context, [&]() { return finished; }));
    
    ASSERT_FALSE(model.snapshot().ready);
    PASS();
}

// =============================================================================
// Push events
// =============================================================================

TEST(Tracker_Handshake_KeepsPhaseFromEventDuringHandshake) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    scriptHealthyClient(*endpoint);
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    bool finished = false;
    tracker.handshake(endpoint, [&]() { finished = true; });
    
    // Phase reply ("Lobby") is handled, summoner read still pending
    ASSERT_EQ(io_context.run_one(), 1u);
    tracker.onPhaseEvent(endpoint, {lcu::endpoints::kGameflowPhase, lcu::EventType::Update, "ChampSelect"});
    
    ASSERT_TRUE(runUntil(io_context, [&]() { return finished; }));
    
    auto state = model.snapshot();
    ASSERT_TRUE(state.ready);
    ASSERT_STREQ(*state.phase, "ChampSelect");
    ASSERT_TRUE(state.identity == (lcu::PlayerIdentity{"Ana", "NA1"}));
    ASSERT_STREQ(*state.region, "NA");
    PASS();
}

TEST(Tracker_Handshake_KeepsIdentityFromEventDuringHandshake) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    endpoint->respond("GET", lcu::endpoints::kGameflowPhase, 200, "\"None\"");
    endpoint->respond("GET", lcu::endpoints::kCurrentSummoner, 404, R"({"message":"not logged in"})");
    endpoint->respond("GET", lcu::endpoints::kRegionLocale, 200, R"({"region":"euw"})");
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    bool finished = false;
    tracker.handshake(endpoint, [&]() { finished = true; });
    
    // Summoner logs in while the handshake reads are in flight
    tracker.onSummonerEvent(endpoint, {lcu::endpoints::kCurrentSummoner, lcu::EventType::Create,
                                       nlohmann::json{{"gameName", "Ana"}, {"tagLine", "EUW"}}});
    
    ASSERT_TRUE(runUntil(io_context, [&]() {
        return finished && model.snapshot().region.has_value();
    }));
    
    auto state = model.snapshot();
    ASSERT_TRUE(state.ready);
    ASSERT_STREQ(*state.phase, "None");
    ASSERT_TRUE(state.identity == (lcu::PlayerIdentity{"Ana", "EUW"}));
    ASSERT_STREQ(*state.region, "EUW");
    PASS();
}

TEST(Tracker_PhaseEvent_StringPayload) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    tracker.onPhaseEvent(endpoint, {lcu::endpoints::kGameflowPhase, lcu::EventType::Update, "ChampSelect"});
    
    ASSERT_STREQ(*model.snapshot().phase, "ChampSelect");
    ASSERT_EQ(endpoint->calls().size(), 0u);
    PASS();
}

TEST(Tracker_PhaseEvent_RefetchesOtherShapes) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    endpoint->respond("GET", lcu::endpoints::kGameflowPhase, 200, "\"InProgress\"");
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    tracker.onPhaseEvent(endpoint, {lcu::endpoints::kGameflowPhase, lcu::EventType::Update,
                                    nlohmann::json{{"phase", "InProgress"}}});
    ASSERT_TRUE(runUntil(io_context, [&]() { return model.snapshot().phase.has_value(); }));
    
    ASSERT_STREQ(*model.snapshot().phase, "InProgress");
    ASSERT_EQ(endpoint->count("GET", lcu::endpoints::kGameflowPhase), 1u);
    PASS();
}

TEST(Tracker_PhaseEvent_RefetchFailureClearsPhase) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    endpoint->fail("GET", lcu::endpoints::kGameflowPhase, asio::error::timed_out);
    
    session::SessionStateModel model;
    model.update([](session::SessionState& state) { state.phase = "Lobby"; });
    session::SessionTracker tracker(model);
    
    uint64_t before = model.version();
    tracker.onPhaseEvent(endpoint, {lcu::endpoints::kGameflowPhase, lcu::EventType::Delete, nullptr});
    ASSERT_TRUE(runUntil(io_context, [&]() { return model.version() > before; }));
    
    ASSERT_FALSE(model.snapshot().phase.has_value());
    PASS();
}

TEST(Tracker_SummonerEvent_PartialPayloadRefetches) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    scriptHealthyClient(*endpoint);
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    tracker.onSummonerEvent(endpoint, {lcu::endpoints::kCurrentSummoner, lcu::EventType::Update,
                                       nlohmann::json{{"gameName", "Ana"}, {"summonerLevel", 31}}});
    ASSERT_TRUE(runUntil(io_context, [&]() { return model.snapshot().region.has_value(); }));
    
    auto state = model.snapshot();
    ASSERT_TRUE(state.identity == (lcu::PlayerIdentity{"Ana", "NA1"}));
    ASSERT_STREQ(*state.region, "NA");
    ASSERT_EQ(endpoint->count("GET", lcu::endpoints::kCurrentSummoner), 1u);
    PASS();
}

TEST(Tracker_SummonerEvent_KeepsIdentityWhenRefetchFails) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    endpoint->fail("GET", lcu::endpoints::kCurrentSummoner, asio::error::timed_out);
    endpoint->respond("GET", lcu::endpoints::kRegionLocale, 200, R"({"region":"euw"})");
    
    session::SessionStateModel model;
    model.update([](session::SessionState& state) {
        state.identity = lcu::PlayerIdentity{"Old", "TAG"};
    });
    session::SessionTracker tracker(model);
    
    tracker.onSummonerEvent(endpoint, {lcu::endpoints::kCurrentSummoner, lcu::EventType::Update,
                                       nlohmann::json{{"tagLine", "NA1"}}});
    ASSERT_TRUE(runUntil(io_context, [&]() { return model.snapshot().region.has_value(); }));
    
    auto state = model.snapshot();
    ASSERT_TRUE(state.identity == (lcu::PlayerIdentity{"Old", "TAG"}));
    ASSERT_STREQ(*state.region, "EUW");
    PASS();
}

TEST(Tracker_SummonerEvent_EmptyPayloadIgnored) {
    asio::io_context io_context;
    auto endpoint = std::make_shared<FakeRequester>(io_context);
    
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    
    tracker.onSummonerEvent(endpoint, {lcu::endpoints::kCurrentSummoner, lcu::EventType::Create, nullptr});
    tracker.onSummonerEvent(endpoint, {lcu::endpoints::kCurrentSummoner, lcu::EventType::Create,
                                       nlohmann::json::object()});
    
    ASSERT_EQ(endpoint->calls().size(), 0u);
    ASSERT_EQ(model.version(), 0u);
    PASS();
}

TEST(Tracker_RegistersRoutes) {
    session::SessionStateModel model;
    session::SessionTracker tracker(model);
    lcu::EventRouter router;
    tracker.registerHandlers(router);
    
    ASSERT_TRUE(router.handles(lcu::endpoints::kGameflowPhase, lcu::EventType::Update));
    ASSERT_TRUE(router.handles(lcu::endpoints::kCurrentSummoner, lcu::EventType::Create));
    ASSERT_TRUE(router.handles(lcu::endpoints::kCurrentSummoner, lcu::EventType::Update));
    ASSERT_FALSE(router.handles(lcu::endpoints::kCurrentSummoner, lcu::EventType::Delete));
    PASS();
}

TEST(Tracker_ParseHelpers) {
    ASSERT_STREQ(*session::SessionTracker::parsePhase("\"Matchmaking\""), "Matchmaking");
    ASSERT_STREQ(*session::SessionTracker::parsePhase("Lobby\n"), "Lobby");
    ASSERT_FALSE(session::SessionTracker::parsePhase("{\"phase\":1}").has_value());
    ASSERT_FALSE(session::SessionTracker::parseIdentity(
        nlohmann::json{{"gameName", ""}, {"tagLine", "NA1"}}).has_value());
    ASSERT_FALSE(session::SessionTracker::parseRegion(nlohmann::json{{"locale", "en_US"}}).has_value());
    PASS();
}

#pragma once

#include "lcu/event_router.hpp"
#include "lcu/requester.hpp"
#include "session/session_state.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lolc::session {

/**
 * Session Tracker
 * 
 * Fills the session state from the local endpoint: the handshake after
 * each connect, then the phase and current-summoner push events.
 * Runs entirely on the connection's io_context thread.
 */
class SessionTracker {
public:
    explicit SessionTracker(SessionStateModel& model);
    
    // Reads phase, summoner and region, then publishes them with ready=true.
    // Fields written by push events after the handshake began are kept.
    void handshake(const std::shared_ptr<lcu::Requester>& requester, std::function<void()> done);
    
    void registerHandlers(lcu::EventRouter& router);
    
    // Called when the connection drops; replies still in flight are discarded
    void invalidate() { m_generation++; }
    
    void onPhaseEvent(const std::shared_ptr<lcu::Requester>& requester, const lcu::Event& event);
    void onSummonerEvent(const std::shared_ptr<lcu::Requester>& requester, const lcu::Event& event);
    
    // Phase response body: a JSON string, or a bare word
    static std::optional<std::string> parsePhase(const std::string& body);
    
    // Both gameName and tagLine must be non-empty strings
    static std::optional<lcu::PlayerIdentity> parseIdentity(const nlohmann::json& data);
    
    // {"region": "euw"} -> "EUW"
    static std::optional<std::string> parseRegion(const nlohmann::json& data);
    
private:
    using PhaseCallback = std::function<void(std::optional<std::string>)>;
    using IdentityCallback = std::function<void(std::optional<lcu::PlayerIdentity>)>;
    using RegionCallback = std::function<void(std::optional<std::string>)>;
    
    // Bumped each time an event writes the field
    struct Revisions {
        uint64_t phase = 0;
        uint64_t identity = 0;
        uint64_t region = 0;
    };
    
    static void fetchPhase(const std::shared_ptr<lcu::Requester>& requester, PhaseCallback callback);
    static void fetchIdentity(const std::shared_ptr<lcu::Requester>& requester, IdentityCallback callback);
    static void fetchRegion(const std::shared_ptr<lcu::Requester>& requester, RegionCallback callback);
    
    void publishSummoner(const std::shared_ptr<lcu::Requester>& requester,
                         std::optional<lcu::PlayerIdentity> identity);
    
    SessionStateModel& m_model;
    uint64_t m_generation = 0;
    Revisions m_revisions;
};

} // namespace lolc::session

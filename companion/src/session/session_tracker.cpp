#include "session/session_tracker.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"

namespace lolc::session {

SessionTracker::SessionTracker(SessionStateModel& model)
    : m_model(model)
{
}

std::optional<std::string> SessionTracker::parsePhase(const std::string& body) {
    nlohmann::json value = nlohmann::json::parse(body, nullptr, false);
    if (!value.is_discarded()) {
        if (value.is_string() && !value.get<std::string>().empty()) {
            return value.get<std::string>();
        }
        return std::nullopt;
    }
    
    std::string raw = utils::trim(body);
    if (raw.empty()) {
        return std::nullopt;
    }
    return raw;
}

std::optional<lcu::PlayerIdentity> SessionTracker::parseIdentity(const nlohmann::json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    
    auto name = data.find("gameName");
    auto tag = data.find("tagLine");
    if (name == data.end() || !name->is_string() || tag == data.end() || !tag->is_string()) {
        return std::nullopt;
    }
    
    lcu::PlayerIdentity identity{name->get<std::string>(), tag->get<std::string>()};
    if (identity.name.empty() || identity.tag.empty()) {
        return std::nullopt;
    }
    return identity;
}

std::optional<std::string> SessionTracker::parseRegion(const nlohmann::json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    
    auto region = data.find("region");
    if (region == data.end() || !region->is_string()) {
        return std::nullopt;
    }
    
    std::string value = utils::toUpper(region->get<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void SessionTracker::fetchPhase(const std::shared_ptr<lcu::Requester>& requester, PhaseCallback callback) {
    requester->get(lcu::endpoints::kGameflowPhase,
        [callback](const asio::error_code& error, const lcu::Response& response) {
            if (error || !response.ok()) {
                LOG_WARN("Failed to get gameflow phase: {}",
                         error ? error.message() : "status " + std::to_string(response.status));
                callback(std::nullopt);
                return;
            }
            callback(parsePhase(response.body));
        });
}

void SessionTracker::fetchIdentity(const std::shared_ptr<lcu::Requester>& requester, IdentityCallback callback) {
    requester->get(lcu::endpoints::kCurrentSummoner,
        [callback](const asio::error_code& error, const lcu::Response& response) {
            if (error || !response.ok()) {
                LOG_WARN("Failed to get current summoner: {}",
                         error ? error.message() : "status " + std::to_string(response.status));
                callback(std::nullopt);
                return;
            }
            callback(parseIdentity(nlohmann::json::parse(response.body, nullptr, false)));
        });
}

void SessionTracker::fetchRegion(const std::shared_ptr<lcu::Requester>& requester, RegionCallback callback) {
    requester->get(lcu::endpoints::kRegionLocale,
        [callback](const asio::error_code& error, const lcu::Response& response) {
            if (error || !response.ok()) {
                LOG_WARN("Failed to get region: {}",
                         error ? error.message() : "status " + std::to_string(response.status));
                callback(std::nullopt);
                return;
            }
            callback(parseRegion(nlohmann::json::parse(response.body, nullptr, false)));
        });
}

void SessionTracker::handshake(const std::shared_ptr<lcu::Requester>& requester, std::function<void()> done) {
    uint64_t generation = m_generation;
    Revisions started = m_revisions;
    
    fetchPhase(requester, [this, requester, done, generation, started](std::optional<std::string> phase) {
        LOG_INFO("Initial gameflow phase: {}", phase.value_or("Unknown"));
        
        fetchIdentity(requester, [this, requester, done, generation, started, phase](std::optional<lcu::PlayerIdentity> identity) {
            auto publish = [this, done, generation, started, phase, identity](std::optional<std::string> region) {
                if (generation != m_generation) {
                    LOG_DEBUG("Discarding handshake from a closed connection");
                    done();
                    return;
                }
                
                m_model.update([&](SessionState& state) {
                    state.ready = true;
                    
                    // Events handled during the handshake are newer than its reads
                    if (m_revisions.phase == started.phase) {
                        state.phase = phase;
                    }
                    if (m_revisions.identity == started.identity) {
                        state.identity = identity;
                    }
                    if (m_revisions.region == started.region) {
                        state.region = region;
                    }
                });
                
                auto state = m_model.snapshot();
                LOG_INFO("Handshake complete: summoner {} region {}",
                         state.identity ? state.identity->toString() : "Not detected",
                         state.region.value_or("Unknown"));
                done();
            };
            
            // Region is only meaningful once a summoner is known
            if (!identity) {
                publish(std::nullopt);
                return;
            }
            fetchRegion(requester, publish);
        });
    });
}

void SessionTracker::registerHandlers(lcu::EventRouter& router) {
    router.on(lcu::endpoints::kGameflowPhase,
              {lcu::EventType::Create, lcu::EventType::Update, lcu::EventType::Delete},
              [this](const std::shared_ptr<lcu::Requester>& requester, const lcu::Event& event) {
                  onPhaseEvent(requester, event);
              });
    
    router.on(lcu::endpoints::kCurrentSummoner,
              {lcu::EventType::Create, lcu::EventType::Update},
              [this](const std::shared_ptr<lcu::Requester>& requester, const lcu::Event& event) {
                  onSummonerEvent(requester, event);
              });
}

void SessionTracker::onPhaseEvent(const std::shared_ptr<lcu::Requester>& requester, const lcu::Event& event) {
    if (event.data.is_string()) {
        std::string phase = event.data.get<std::string>();
        LOG_INFO("Gameflow phase changed to {}", phase);
        m_revisions.phase++;
        m_model.update([&](SessionState& state) {
            state.phase = phase;
        });
        return;
    }
    
    uint64_t generation = m_generation;
    fetchPhase(requester, [this, generation](std::optional<std::string> phase) {
        if (generation != m_generation) return;
        
        LOG_INFO("Gameflow phase changed to {}", phase.value_or("Unknown"));
        m_revisions.phase++;
        m_model.update([&](SessionState& state) {
            state.phase = phase;
        });
    });
}

void SessionTracker::onSummonerEvent(const std::shared_ptr<lcu::Requester>& requester, const lcu::Event& event) {
    if (event.data.is_null() || event.data.empty()) {
        LOG_DEBUG("Ignoring empty summoner event");
        return;
    }
    
    auto identity = parseIdentity(event.data);
    if (identity) {
        publishSummoner(requester, identity);
        return;
    }
    
    // Partial payload: ask the endpoint directly
    fetchIdentity(requester, [this, requester](std::optional<lcu::PlayerIdentity> fetched) {
        publishSummoner(requester, fetched);
    });
}

void SessionTracker::publishSummoner(const std::shared_ptr<lcu::Requester>& requester,
                                     std::optional<lcu::PlayerIdentity> identity) {
    uint64_t generation = m_generation;
    
    fetchRegion(requester, [this, generation, identity](std::optional<std::string> region) {
        if (generation != m_generation) return;
        
        if (identity) {
            m_revisions.identity++;
        }
        if (region) {
            m_revisions.region++;
        }
        
        m_model.update([&](SessionState& state) {
            // An incomplete identity keeps whatever was known before
            if (identity) {
                state.identity = identity;
            }
            if (region) {
                state.region = region;
            }
        });
        
        auto state = m_model.snapshot();
        LOG_INFO("Summoner updated: {} Region: {}",
                 state.identity ? state.identity->toString() : "Not detected",
                 state.region.value_or("Unknown"));
    });
}

} // namespace lolc::session

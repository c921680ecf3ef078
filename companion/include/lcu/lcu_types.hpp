#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lolc::lcu {

// =============================================================================
// Local client endpoints
// =============================================================================
namespace endpoints {
constexpr const char* kGameflowPhase   = "/lol-gameflow/v1/gameflow-phase";
constexpr const char* kCurrentSummoner = "/lol-summoner/v1/current-summoner";
constexpr const char* kRegionLocale    = "/riotclient/region-locale";
constexpr const char* kCustomLobbies   = "/lol-lobby/v2/lobby/custom/available";

inline std::string joinCustomLobby(const std::string& lobbyId) {
    return "/lol-lobby/v2/lobby/custom/" + lobbyId + "/join";
}
} // namespace endpoints

struct PlayerIdentity {
    std::string name;
    std::string tag;
    
    // Name#Tag
    std::string toString() const { return name + "#" + tag; }
    
    bool operator==(const PlayerIdentity& other) const {
        return name == other.name && tag == other.tag;
    }
    bool operator!=(const PlayerIdentity& other) const { return !(*this == other); }
};

/**
 * Join request issued by the remote backend's joinmatch call.
 * Consumed once by the lobby joiner.
 */
struct JoinRequest {
    std::string targetName;
    std::string targetTag;
    std::string credential;
    
    std::string target() const { return targetName + "#" + targetTag; }
};

struct LobbyDescriptor {
    std::string id;
    std::string ownerDisplayName;
};

// Response from the local endpoint
struct Response {
    int status = 0;
    std::string body;
    
    bool ok() const { return status == 200; }
};

enum class EventType {
    Create,
    Update,
    Delete,
};

const char* toString(EventType type);
std::optional<EventType> parseEventType(const std::string& name);

// Push event from the local endpoint
struct Event {
    std::string uri;
    EventType type = EventType::Update;
    nlohmann::json data;
};

} // namespace lolc::lcu

#pragma once

#include "lcu/lcu_types.hpp"
#include "lcu/requester.hpp"
#include "session/action_dispatcher.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lolc::lobby {

struct JoinResult {
    std::string target;   // Name#Tag
    std::string lobbyId;
};

/**
 * Lobby Joiner
 * 
 * Finds the custom lobby owned by the join request's target and joins it
 * with the request's credential. The whole sequence runs on the
 * connection's context through the dispatcher.
 * 
 * Owner matching, both case-insensitive:
 * 1. exact "<name> #<tag>"
 * 2. prefix "<name>#"
 */
class LobbyJoiner {
public:
    explicit LobbyJoiner(session::ActionDispatcher& dispatcher);
    
    // Fails with NotConnectedError, ConnectionError, LobbyNotFound or JoinFailed
    std::future<JoinResult> joinLobby(const lcu::JoinRequest& request);
    
    static void run(const std::shared_ptr<lcu::Requester>& requester,
                    const lcu::JoinRequest& request,
                    session::Completion<JoinResult> completion);
    
    static std::vector<lcu::LobbyDescriptor> parseLobbies(const nlohmann::json& data);
    
    static std::optional<lcu::LobbyDescriptor> selectLobby(const std::vector<lcu::LobbyDescriptor>& lobbies,
                                                           const std::string& name,
                                                           const std::string& tag);
    
    // {"message": "..."} or "Unknown error"
    static std::string extractErrorMessage(const std::string& body);
    
private:
    session::ActionDispatcher& m_dispatcher;
};

} // namespace lolc::lobby

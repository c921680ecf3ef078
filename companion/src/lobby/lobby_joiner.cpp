#include "lobby/lobby_joiner.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"

namespace lolc::lobby {

LobbyJoiner::LobbyJoiner(session::ActionDispatcher& dispatcher)
    : m_dispatcher(dispatcher)
{
}

std::future<JoinResult> LobbyJoiner::joinLobby(const lcu::JoinRequest& request) {
    LOG_INFO("Attempting to join lobby of {}", request.target());
    
    return m_dispatcher.invokeAsync<JoinResult>(
        [request](std::shared_ptr<lcu::Requester> requester, session::Completion<JoinResult> completion) {
            run(requester, request, completion);
        });
}

std::vector<lcu::LobbyDescriptor> LobbyJoiner::parseLobbies(const nlohmann::json& data) {
    std::vector<lcu::LobbyDescriptor> lobbies;
    if (!data.is_array()) {
        return lobbies;
    }
    
    for (const auto& entry : data) {
        if (!entry.is_object()) continue;
        
        auto id = entry.find("id");
        if (id == entry.end()) continue;
        
        lcu::LobbyDescriptor lobby;
        if (id->is_string()) {
            lobby.id = id->get<std::string>();
        }
        else if (id->is_number_integer()) {
            lobby.id = std::to_string(id->get<int64_t>());
        }
        else {
            continue;
        }
        
        auto owner = entry.find("ownerDisplayName");
        if (owner != entry.end() && owner->is_string()) {
            lobby.ownerDisplayName = owner->get<std::string>();
        }
        
        lobbies.push_back(std::move(lobby));
    }
    
    return lobbies;
}

std::optional<lcu::LobbyDescriptor> LobbyJoiner::selectLobby(const std::vector<lcu::LobbyDescriptor>& lobbies,
                                                             const std::string& name,
                                                             const std::string& tag) {
    // The client renders owners as "Name #Tag"
    const std::string exact = utils::toLower(name + " #" + tag);
    for (const auto& lobby : lobbies) {
        if (utils::toLower(lobby.ownerDisplayName) == exact) {
            return lobby;
        }
    }
    
    const std::string prefix = utils::toLower(name + "#");
    for (const auto& lobby : lobbies) {
        if (utils::startsWith(utils::toLower(lobby.ownerDisplayName), prefix)) {
            return lobby;
        }
    }
    
    return std::nullopt;
}

std::string LobbyJoiner::extractErrorMessage(const std::string& body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_object()) {
        auto message = data.find("message");
        if (message != data.end() && message->is_string() && !message->get<std::string>().empty()) {
            return message->get<std::string>();
        }
    }
    return "Unknown error";
}

void LobbyJoiner::run(const std::shared_ptr<lcu::Requester>& requester,
                      const lcu::JoinRequest& request,
                      session::Completion<JoinResult> completion) {
    requester->get(lcu::endpoints::kCustomLobbies,
        [requester, request, completion](const asio::error_code& error, const lcu::Response& response) mutable {
            if (error) {
                LOG_ERROR("Failed to list custom lobbies: {}", error.message());
                completion.failTransport(error);
                return;
            }
            if (!response.ok()) {
                LOG_ERROR("Failed to list custom lobbies: status {}", response.status);
                completion.failWith<ConnectionError>(
                    "Listing custom lobbies failed with status " + std::to_string(response.status));
                return;
            }
            
            auto lobbies = parseLobbies(nlohmann::json::parse(response.body, nullptr, false));
            auto match = selectLobby(lobbies, request.targetName, request.targetTag);
            if (!match) {
                LOG_WARN("No lobby owned by {} among {} custom lobbies", request.target(), lobbies.size());
                completion.failWith<LobbyNotFound>(request.target());
                return;
            }
            
            LOG_DEBUG("Matched lobby {} owned by '{}'", match->id, match->ownerDisplayName);
            
            nlohmann::json body = {
                {"asSpectator", false},
                {"password", request.credential},
            };
            
            std::string lobbyId = match->id;
            requester->request("POST", lcu::endpoints::joinCustomLobby(lobbyId), body,
                [request, lobbyId, completion](const asio::error_code& error, const lcu::Response& response) mutable {
                    if (error) {
                        LOG_ERROR("Join request for lobby {} failed: {}", lobbyId, error.message());
                        completion.failTransport(error);
                        return;
                    }
                    
                    if (!response.ok()) {
                        std::string message = extractErrorMessage(response.body);
                        LOG_WARN("Failed to join {}'s lobby ({}): {}", request.target(), response.status, message);
                        completion.failWith<JoinFailed>(message);
                        return;
                    }
                    
                    LOG_INFO("Joined {}'s lobby ({})", request.target(), lobbyId);
                    completion.succeed(JoinResult{request.target(), lobbyId});
                });
        });
}

} // namespace lolc::lobby

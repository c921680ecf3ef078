#include "backend/backend_client.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"

namespace lolc::backend {

namespace {

const char* kNotRegisteredMarker = "User not found";

} // namespace

const char* toString(AuthStatus status) {
    switch (status) {
        case AuthStatus::Authenticated: return "Authenticated";
        case AuthStatus::NotRegistered: return "NotRegistered";
        case AuthStatus::Unknown:       return "Unknown";
    }
    return "Unknown";
}

BackendClient::BackendClient(std::shared_ptr<network::HttpTransport> transport)
    : m_transport(std::move(transport))
{
}

network::HttpResponse BackendClient::get(const std::string& path) {
    network::HttpRequest request;
    request.method = "GET";
    request.target = path;
    request.headers.emplace_back("Accept", "*/*");
    
    network::HttpResponse response = m_transport->send(request);
    
    // Path only; query strings carry credentials
    LOG_INFO("[Backend] {} -> {}", path.substr(0, path.find('?')), response.status);
    LOG_TRACE("[Backend] Body: {}", response.body);
    return response;
}

AuthStatus BackendClient::authenticate(const std::string& credential) {
    network::HttpResponse response;
    try {
        response = get("/auth?discord_id=" + utils::urlEncode(credential));
    }
    catch (const RemoteRequestError& e) {
        LOG_WARN("[Backend] Authentication check failed: {}", e.what());
        return AuthStatus::Unknown;
    }
    
    if (response.status == 200) {
        return AuthStatus::Authenticated;
    }
    if (response.status == 404 && response.body.find(kNotRegisteredMarker) != std::string::npos) {
        return AuthStatus::NotRegistered;
    }
    return AuthStatus::Unknown;
}

std::string BackendClient::redeemCode(const std::string& code, const std::string& summonerIdentity) {
    network::HttpResponse response = get("/otp?otp_pass=" + utils::urlEncode(utils::trim(code)) +
                                         "&summonersname=" + utils::urlEncode(summonerIdentity));
    
    if (response.status != 200) {
        throw RemoteRequestError("Invalid registration code or server error", response.status);
    }
    
    std::string token = utils::trim(response.body);
    if (token.empty()) {
        throw MalformedResponseError("Registration succeeded without a credential");
    }
    return token;
}

std::string BackendClient::fetchLatestVersion() {
    network::HttpResponse response = get("/client_version");
    
    if (response.status != 200) {
        throw RemoteRequestError("Server returned error: " + std::to_string(response.status),
                                 response.status);
    }
    
    nlohmann::json data = nlohmann::json::parse(response.body, nullptr, false);
    if (!data.is_object()) {
        throw MalformedResponseError("Version response is not a JSON object");
    }
    
    auto version = data.find("version");
    if (version == data.end()) {
        return "Unknown";
    }
    if (version->is_string()) {
        return version->get<std::string>();
    }
    return version->dump();
}

lcu::JoinRequest BackendClient::joinMatch(const std::string& password) {
    network::HttpResponse response = get("/joinmatch?password=" + utils::urlEncode(utils::trim(password)));
    
    if (response.status != 200) {
        throw RemoteRequestError("Invalid response from server", response.status);
    }
    
    return parseJoinMatchBody(response.body);
}

lcu::JoinRequest BackendClient::parseJoinMatchBody(const std::string& body) {
    std::string data = utils::trim(body);
    
    size_t comma = data.find(',');
    if (comma == std::string::npos) {
        throw MalformedResponseError("Join response has no credential: '" + data + "'");
    }
    
    std::string identity = data.substr(0, comma);
    size_t hash = identity.find('#');
    if (hash == std::string::npos) {
        throw MalformedResponseError("Join response has no Name#Tag: '" + identity + "'");
    }
    
    lcu::JoinRequest request;
    request.targetName = identity.substr(0, hash);
    request.targetTag = identity.substr(hash + 1);
    request.credential = data.substr(comma + 1);
    
    if (request.targetName.empty() || request.targetTag.empty() || request.credential.empty()) {
        throw MalformedResponseError("Join response has empty fields: '" + data + "'");
    }
    return request;
}

} // namespace lolc::backend

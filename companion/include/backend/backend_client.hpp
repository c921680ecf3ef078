#pragma once

#include "lcu/lcu_types.hpp"
#include "network/http_client.hpp"
#include <memory>
#include <string>

namespace lolc::backend {

enum class AuthStatus {
    Authenticated,
    NotRegistered,  // definitive: the backend does not know this credential
    Unknown,        // transient failure, try again later
};

const char* toString(AuthStatus status);

/**
 * Remote Backend Client
 * 
 * Stateless wrapper over the League of Leagues backend. Every call is a
 * single blocking GET with the transport's timeout and no retry; call
 * it off the UI thread.
 */
class BackendClient {
public:
    explicit BackendClient(std::shared_ptr<network::HttpTransport> transport);
    
    // GET /auth?discord_id=
    AuthStatus authenticate(const std::string& credential);
    
    // GET /otp?otp_pass=&summonersname=  -> credential token
    std::string redeemCode(const std::string& code, const std::string& summonerIdentity);
    
    // GET /client_version
    std::string fetchLatestVersion();
    
    // GET /joinmatch?password=
    lcu::JoinRequest joinMatch(const std::string& password);
    
    // "Name#Tag,credential"
    static lcu::JoinRequest parseJoinMatchBody(const std::string& body);
    
private:
    network::HttpResponse get(const std::string& path);
    
    std::shared_ptr<network::HttpTransport> m_transport;
};

} // namespace lolc::backend

#pragma once

#include "lcu/lcu_types.hpp"
#include <asio.hpp>
#include <functional>
#include <optional>
#include <string>

namespace lolc::lcu {

/**
 * Issues requests against the local endpoint.
 * 
 * Handlers run on the connection's io_context thread. A transport failure
 * arrives as an error code; a closed handle reports asio::error::not_connected
 * without touching the transport. Requests are never retried here.
 */
class Requester {
public:
    using ResponseHandler = std::function<void(const asio::error_code&, const Response&)>;
    
    virtual ~Requester() = default;
    
    virtual void request(const std::string& method,
                         const std::string& path,
                         const std::optional<nlohmann::json>& body,
                         ResponseHandler handler) = 0;
    
    void get(const std::string& path, ResponseHandler handler) {
        request("GET", path, std::nullopt, std::move(handler));
    }
};

} // namespace lolc::lcu

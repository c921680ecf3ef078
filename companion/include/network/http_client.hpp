#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lolc::network {

using asio::ip::tcp;

struct HttpRequest {
    std::string method = "GET";
    std::string target = "/";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;
    
    std::string header(const std::string& name) const;
};

struct HttpEndpoint {
    std::string host;
    uint16_t port = 443;
    std::string basePath;  // without trailing '/'
};

// Accepts https://host[:port][/path]
std::optional<HttpEndpoint> parseHttpsUrl(const std::string& url);

std::string serializeRequest(const HttpRequest& request, const std::string& host, uint16_t port);

// Parses a complete HTTP/1.1 response (Content-Length, chunked or read-to-EOF bodies)
bool parseResponse(const std::string& raw, HttpResponse& out);

std::string base64Encode(const std::string& data);
std::string basicAuthorization(const std::string& user, const std::string& password);

/**
 * HTTP Session
 * 
 * One HTTPS request/response exchange on an io_context:
 * resolve -> connect -> TLS handshake -> write -> read until EOF.
 * The whole exchange is bounded by a single deadline timer.
 * The handler is invoked exactly once, on the io_context thread.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using ResponseHandler = std::function<void(const asio::error_code&, HttpResponse)>;
    
    HttpSession(asio::io_context& io_context,
                asio::ssl::context& ssl_context,
                const std::string& host,
                uint16_t port,
                std::chrono::milliseconds timeout,
                bool verifyPeer);
    
    void start(const HttpRequest& request, ResponseHandler handler);
    
    // Abort the exchange; the handler sees operation_aborted
    void cancel();
    
private:
    void handleResolve(const asio::error_code& error, const tcp::resolver::results_type& results);
    void handleConnect(const asio::error_code& error);
    void handleHandshake(const asio::error_code& error);
    void handleWrite(const asio::error_code& error);
    void handleRead(const asio::error_code& error);
    void handleTimeout(const asio::error_code& error);
    void finish(const asio::error_code& error, HttpResponse response = {});
    
    tcp::resolver m_resolver;
    asio::ssl::stream<tcp::socket> m_stream;
    asio::steady_timer m_timer;
    std::string m_host;
    uint16_t m_port;
    std::chrono::milliseconds m_timeout;
    bool m_timedOut = false;
    bool m_done = false;
    
    std::string m_requestData;
    asio::streambuf m_responseBuffer;
    ResponseHandler m_handler;
};

/**
 * Blocking request/response seam used by the remote backend client.
 * Implementations throw RemoteRequestError on transport failure.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * HTTPS transport with a fixed per-request timeout.
 * Each call runs a private io_context to completion; no retries.
 */
class HttpsTransport : public HttpTransport {
public:
    HttpsTransport(const std::string& baseUrl, std::chrono::milliseconds timeout);
    
    HttpResponse send(const HttpRequest& request) override;
    
    const HttpEndpoint& getEndpoint() const { return m_endpoint; }
    
private:
    HttpEndpoint m_endpoint;
    std::chrono::milliseconds m_timeout;
    asio::ssl::context m_sslContext;
};

} // namespace lolc::network

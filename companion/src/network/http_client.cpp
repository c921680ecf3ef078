#include "network/http_client.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <sstream>

namespace lolc::network {

namespace {

bool decodeChunked(const std::string& in, std::string& out) {
    size_t pos = 0;
    while (true) {
        size_t eol = in.find("\r\n", pos);
        if (eol == std::string::npos) {
            return false;
        }
        
        // Chunk extensions after ';' are ignored
        std::string sizeLine = in.substr(pos, eol - pos);
        sizeLine = sizeLine.substr(0, sizeLine.find(';'));
        
        size_t size = 0;
        try {
            size = std::stoul(utils::trim(sizeLine), nullptr, 16);
        }
        catch (const std::exception&) {
            return false;
        }
        
        pos = eol + 2;
        if (size == 0) {
            return true;
        }
        if (pos + size > in.size()) {
            return false;
        }
        
        out.append(in, pos, size);
        pos += size + 2;
    }
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(utils::toLower(name));
    return it != headers.end() ? it->second : std::string();
}

std::optional<HttpEndpoint> parseHttpsUrl(const std::string& url) {
    const std::string scheme = "https://";
    if (!utils::startsWith(utils::toLower(url), scheme)) {
        return std::nullopt;
    }
    
    std::string rest = url.substr(scheme.size());
    HttpEndpoint endpoint;
    
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.basePath = rest.substr(slash);
        while (!endpoint.basePath.empty() && endpoint.basePath.back() == '/') {
            endpoint.basePath.pop_back();
        }
    }
    
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        try {
            size_t pos = 0;
            int port = std::stoi(authority.substr(colon + 1), &pos);
            if (pos != authority.size() - colon - 1 || port <= 0 || port > 65535) {
                return std::nullopt;
            }
            endpoint.port = static_cast<uint16_t>(port);
        }
        catch (const std::exception&) {
            return std::nullopt;
        }
        authority = authority.substr(0, colon);
    }
    
    if (authority.empty()) {
        return std::nullopt;
    }
    endpoint.host = authority;
    return endpoint;
}

std::string serializeRequest(const HttpRequest& request, const std::string& host, uint16_t port) {
    std::ostringstream out;
    out << request.method << " " << request.target << " HTTP/1.1\r\n";
    out << "Host: " << host;
    if (port != 443) {
        out << ":" << port;
    }
    out << "\r\n";
    
    bool hasUserAgent = false;
    for (const auto& [name, value] : request.headers) {
        if (utils::toLower(name) == "user-agent") {
            hasUserAgent = true;
        }
        out << name << ": " << value << "\r\n";
    }
    if (!hasUserAgent) {
        out << "User-Agent: lol-companion\r\n";
    }
    
    if (!request.body.empty() || request.method != "GET") {
        out << "Content-Length: " << request.body.size() << "\r\n";
    }
    out << "Connection: close\r\n";
    out << "\r\n";
    out << request.body;
    
    return out.str();
}

bool parseResponse(const std::string& raw, HttpResponse& out) {
    size_t headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return false;
    }
    
    std::istringstream head(raw.substr(0, headerEnd));
    std::string statusLine;
    std::getline(head, statusLine);
    
    // HTTP/1.1 200 OK
    if (!utils::startsWith(statusLine, "HTTP/")) {
        return false;
    }
    size_t space = statusLine.find(' ');
    if (space == std::string::npos) {
        return false;
    }
    try {
        out.status = std::stoi(statusLine.substr(space + 1, 3));
    }
    catch (const std::exception&) {
        return false;
    }
    
    std::string line;
    while (std::getline(head, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        out.headers[utils::toLower(utils::trim(line.substr(0, colon)))] =
            utils::trim(line.substr(colon + 1));
    }
    
    std::string rest = raw.substr(headerEnd + 4);
    
    if (utils::toLower(out.header("transfer-encoding")).find("chunked") != std::string::npos) {
        out.body.clear();
        return decodeChunked(rest, out.body);
    }
    
    std::string contentLength = out.header("content-length");
    if (!contentLength.empty()) {
        size_t length = 0;
        try {
            length = std::stoul(contentLength);
        }
        catch (const std::exception&) {
            return false;
        }
        if (rest.size() < length) {
            return false;
        }
        rest.resize(length);
    }
    
    out.body = std::move(rest);
    return true;
}

std::string base64Encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

std::string basicAuthorization(const std::string& user, const std::string& password) {
    return "Basic " + base64Encode(user + ":" + password);
}

// =============================================================================
// HttpSession
// =============================================================================

HttpSession::HttpSession(asio::io_context& io_context,
                         asio::ssl::context& ssl_context,
                         const std::string& host,
                         uint16_t port,
                         std::chrono::milliseconds timeout,
                         bool verifyPeer)
    : m_resolver(io_context)
    , m_stream(io_context, ssl_context)
    , m_timer(io_context)
    , m_host(host)
    , m_port(port)
    , m_timeout(timeout)
{
    if (verifyPeer) {
        m_stream.set_verify_mode(asio::ssl::verify_peer);
        m_stream.set_verify_callback(asio::ssl::host_name_verification(host));
    }
    else {
        m_stream.set_verify_mode(asio::ssl::verify_none);
    }
}

void HttpSession::start(const HttpRequest& request, ResponseHandler handler) {
    m_handler = std::move(handler);
    m_requestData = serializeRequest(request, m_host, m_port);
    
    LOG_TRACE("[HTTP] {} https://{}:{}{}", request.method, m_host, m_port, request.target);
    
    auto self = shared_from_this();
    
    m_timer.expires_after(m_timeout);
    m_timer.async_wait([this, self](const asio::error_code& error) {
        handleTimeout(error);
    });
    
    m_resolver.async_resolve(
        m_host, std::to_string(m_port),
        [this, self](const asio::error_code& error, const tcp::resolver::results_type& results) {
            handleResolve(error, results);
        }
    );
}

void HttpSession::cancel() {
    finish(asio::error::operation_aborted);
}

void HttpSession::handleResolve(const asio::error_code& error,
                                const tcp::resolver::results_type& results) {
    if (error) {
        finish(error);
        return;
    }
    
    auto self = shared_from_this();
    asio::async_connect(
        m_stream.lowest_layer(), results,
        [this, self](const asio::error_code& error, const tcp::endpoint&) {
            handleConnect(error);
        }
    );
}

void HttpSession::handleConnect(const asio::error_code& error) {
    if (error) {
        finish(error);
        return;
    }
    
    // SNI only makes sense for host names
    asio::error_code addrError;
    asio::ip::make_address(m_host, addrError);
    if (addrError) {
        SSL_set_tlsext_host_name(m_stream.native_handle(), m_host.c_str());
    }
    
    auto self = shared_from_this();
    m_stream.async_handshake(
        asio::ssl::stream_base::client,
        [this, self](const asio::error_code& error) {
            handleHandshake(error);
        }
    );
}

void HttpSession::handleHandshake(const asio::error_code& error) {
    if (error) {
        finish(error);
        return;
    }
    
    auto self = shared_from_this();
    asio::async_write(
        m_stream, asio::buffer(m_requestData),
        [this, self](const asio::error_code& error, size_t) {
            handleWrite(error);
        }
    );
}

void HttpSession::handleWrite(const asio::error_code& error) {
    if (error) {
        finish(error);
        return;
    }
    
    auto self = shared_from_this();
    asio::async_read(
        m_stream, m_responseBuffer, asio::transfer_all(),
        [this, self](const asio::error_code& error, size_t) {
            handleRead(error);
        }
    );
}

void HttpSession::handleRead(const asio::error_code& error) {
    // Servers routinely close without a TLS close_notify
    if (error && error != asio::error::eof && error != asio::ssl::error::stream_truncated) {
        finish(error);
        return;
    }
    
    std::string raw(asio::buffers_begin(m_responseBuffer.data()),
                    asio::buffers_end(m_responseBuffer.data()));
    
    HttpResponse response;
    if (!parseResponse(raw, response)) {
        LOG_WARN("[HTTP] Unparseable response from {}:{} ({} bytes)", m_host, m_port, raw.size());
        finish(asio::error::invalid_argument);
        return;
    }
    
    finish(asio::error_code(), std::move(response));
}

void HttpSession::handleTimeout(const asio::error_code& error) {
    if (error == asio::error::operation_aborted || m_done) {
        return;
    }
    
    LOG_DEBUG("[HTTP] Request to {}:{} timed out", m_host, m_port);
    m_timedOut = true;
    m_resolver.cancel();
    
    asio::error_code ec;
    m_stream.lowest_layer().close(ec);
}

void HttpSession::finish(const asio::error_code& error, HttpResponse response) {
    if (m_done) return;
    m_done = true;
    
    m_timer.cancel();
    m_resolver.cancel();
    
    asio::error_code ec;
    m_stream.lowest_layer().close(ec);
    
    auto handler = std::move(m_handler);
    if (handler) {
        handler(m_timedOut ? asio::error_code(asio::error::timed_out) : error, std::move(response));
    }
}

// =============================================================================
// HttpsTransport
// =============================================================================

HttpsTransport::HttpsTransport(const std::string& baseUrl, std::chrono::milliseconds timeout)
    : m_timeout(timeout)
    , m_sslContext(asio::ssl::context::tls_client)
{
    auto endpoint = parseHttpsUrl(baseUrl);
    if (!endpoint) {
        throw std::invalid_argument("Not an https:// URL: " + baseUrl);
    }
    m_endpoint = *endpoint;
    
    m_sslContext.set_default_verify_paths();
}

HttpResponse HttpsTransport::send(const HttpRequest& request) {
    asio::io_context io_context;
    
    HttpRequest outgoing = request;
    outgoing.target = m_endpoint.basePath + request.target;
    
    asio::error_code result;
    HttpResponse response;
    
    auto session = std::make_shared<HttpSession>(
        io_context, m_sslContext, m_endpoint.host, m_endpoint.port, m_timeout, true);
    session->start(outgoing, [&](const asio::error_code& error, HttpResponse received) {
        result = error;
        response = std::move(received);
    });
    
    io_context.run();
    
    if (result) {
        if (result == asio::error::timed_out) {
            throw RemoteRequestError("Request to " + m_endpoint.host + " timed out");
        }
        throw RemoteRequestError("Request to " + m_endpoint.host + " failed: " + result.message());
    }
    return response;
}

} // namespace lolc::network

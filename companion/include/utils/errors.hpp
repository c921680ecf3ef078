#pragma once

#include <stdexcept>
#include <string>
#include <optional>

namespace lolc {

/**
 * Base class for every failure the companion reports to a caller.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Transient: a single connect attempt or local call failed
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string& what) : Error(what) {}
};

// Terminal for the session: the connect retry bound was reached
class ConnectionExhausted : public Error {
public:
    explicit ConnectionExhausted(int attempts)
        : Error("Gave up connecting to the League client after " +
                std::to_string(attempts) + " attempts")
        , m_attempts(attempts) {}
    
    int attempts() const { return m_attempts; }
    
private:
    int m_attempts;
};

// A command needed the local connection but none is live
class NotConnectedError : public Error {
public:
    NotConnectedError() : Error("Not connected to the League client") {}
    explicit NotConnectedError(const std::string& what) : Error(what) {}
};

class LobbyNotFound : public Error {
public:
    explicit LobbyNotFound(const std::string& target)
        : Error("Couldn't find " + target + "'s lobby")
        , m_target(target) {}
    
    const std::string& target() const { return m_target; }
    
private:
    std::string m_target;
};

class JoinFailed : public Error {
public:
    explicit JoinFailed(const std::string& message)
        : Error("Failed to join: " + message)
        , m_message(message) {}
    
    const std::string& message() const { return m_message; }
    
private:
    std::string m_message;
};

// Network failure, timeout or unexpected status from the remote backend
class RemoteRequestError : public Error {
public:
    explicit RemoteRequestError(const std::string& what,
                                std::optional<int> status = std::nullopt)
        : Error(what), m_status(status) {}
    
    std::optional<int> status() const { return m_status; }
    
private:
    std::optional<int> m_status;
};

// Remote payload did not have the expected shape
class MalformedResponseError : public Error {
public:
    explicit MalformedResponseError(const std::string& what) : Error(what) {}
};

} // namespace lolc

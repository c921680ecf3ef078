#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lolc::lcu {

/**
 * Connection details for the local endpoint.
 * The client accepts Basic auth as riot:<password> on 127.0.0.1:<port>.
 */
struct Credentials {
    uint16_t port = 0;
    std::string password;
    std::string protocol = "https";
    int pid = 0;
    
    static constexpr const char* kUsername = "riot";
    static constexpr const char* kHost = "127.0.0.1";
};

// name:pid:port:password:protocol
std::optional<Credentials> parseLockfile(const std::string& contents);
std::optional<Credentials> readLockfile(const std::string& path);

// Reads --app-port= and --remoting-auth-token= from a client process command line
std::optional<Credentials> parseCommandLine(const std::vector<std::string>& args);

// Scans <procRoot>/<pid>/cmdline for the client UX process
std::optional<Credentials> findClientProcess(const std::string& procRoot = "/proc");

// Lockfile when a path is configured, process scan otherwise
std::optional<Credentials> discoverCredentials(const std::string& lockfilePath);

} // namespace lolc::lcu

#include "lcu/credentials.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace lolc::lcu {

namespace {

const char* kProcessName = "LeagueClientUx";

std::optional<uint16_t> parsePort(const std::string& value) {
    try {
        size_t pos = 0;
        int port = std::stoi(value, &pos);
        if (pos != value.size() || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(port);
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<Credentials> parseLockfile(const std::string& contents) {
    std::vector<std::string> fields;
    std::stringstream ss(utils::trim(contents));
    std::string field;
    while (std::getline(ss, field, ':')) {
        fields.push_back(field);
    }
    
    if (fields.size() != 5) {
        return std::nullopt;
    }
    
    auto port = parsePort(fields[2]);
    if (!port || fields[3].empty()) {
        return std::nullopt;
    }
    
    Credentials credentials;
    credentials.port = *port;
    credentials.password = fields[3];
    credentials.protocol = fields[4];
    try {
        credentials.pid = std::stoi(fields[1]);
    }
    catch (const std::exception&) {
        credentials.pid = 0;
    }
    return credentials;
}

std::optional<Credentials> readLockfile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    std::stringstream contents;
    contents << file.rdbuf();
    
    auto credentials = parseLockfile(contents.str());
    if (!credentials) {
        LOG_WARN("Malformed lockfile: {}", path);
    }
    return credentials;
}

std::optional<Credentials> parseCommandLine(const std::vector<std::string>& args) {
    const std::string portFlag = "--app-port=";
    const std::string tokenFlag = "--remoting-auth-token=";
    
    std::optional<uint16_t> port;
    std::string token;
    
    for (const auto& arg : args) {
        // Wine keeps the quotes around arguments
        std::string value = arg;
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        
        if (utils::startsWith(value, portFlag)) {
            port = parsePort(value.substr(portFlag.size()));
        }
        else if (utils::startsWith(value, tokenFlag)) {
            token = value.substr(tokenFlag.size());
        }
    }
    
    if (!port || token.empty()) {
        return std::nullopt;
    }
    
    Credentials credentials;
    credentials.port = *port;
    credentials.password = token;
    return credentials;
}

std::optional<Credentials> findClientProcess(const std::string& procRoot) {
    namespace fs = std::filesystem;
    
    std::error_code ec;
    fs::directory_iterator it(procRoot, ec);
    if (ec) {
        LOG_DEBUG("Cannot scan {}: {}", procRoot, ec.message());
        return std::nullopt;
    }
    
    // Processes come and go while we iterate
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        const std::string pidName = entry.path().filename().string();
        if (pidName.empty() || pidName.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        
        std::ifstream cmdline(entry.path() / "cmdline", std::ios::binary);
        if (!cmdline.is_open()) {
            continue;
        }
        
        std::vector<std::string> args;
        std::string arg;
        while (std::getline(cmdline, arg, '\0')) {
            args.push_back(arg);
        }
        
        if (args.empty() || args[0].find(kProcessName) == std::string::npos) {
            continue;
        }
        
        auto credentials = parseCommandLine(args);
        if (credentials) {
            credentials->pid = std::stoi(pidName);
            LOG_DEBUG("Found {} (pid {}) on port {}", kProcessName, credentials->pid, credentials->port);
            return credentials;
        }
    }
    
    return std::nullopt;
}

std::optional<Credentials> discoverCredentials(const std::string& lockfilePath) {
    if (!lockfilePath.empty()) {
        return readLockfile(lockfilePath);
    }
    return findClientProcess();
}

} // namespace lolc::lcu

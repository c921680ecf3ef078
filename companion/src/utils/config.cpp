#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace lolc::utils {

namespace {

bool parseUnsigned(const std::string& key, const std::string& value, uint32_t& out) {
    try {
        size_t pos = 0;
        unsigned long parsed = std::stoul(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        out = static_cast<uint32_t>(parsed);
        return true;
    }
    catch (const std::exception&) {
        LOG_WARN("Config: invalid value '{}' for {}, keeping {}", value, key, out);
        return false;
    }
}

// Older builds stored the credential as a JSON object
std::string parseCredential(const std::string& raw) {
    auto doc = nlohmann::json::parse(raw, nullptr, false);
    if (doc.is_object() && doc.contains("discord_id") && doc["discord_id"].is_string()) {
        return doc["discord_id"].get<std::string>();
    }
    return raw;
}

} // namespace

Config& Config::instance() {
    static Config config;
    return config;
}

std::string Config::defaultPath() {
    namespace fs = std::filesystem;
    
    fs::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    }
    else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".config";
    }
    else {
        base = fs::current_path();
    }
    return (base / "LeagueOfLeagues" / "settings.cfg").string();
}

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        
        if (key == "discord_id") {
            m_config.discord_id = parseCredential(value);
        }
        else if (key == "backend_url") {
            m_config.backend_url = value;
        }
        else if (key == "download_url") {
            m_config.download_url = value;
        }
        else if (key == "remote_timeout_ms") {
            parseUnsigned(key, value, m_config.remote_timeout_ms);
        }
        else if (key == "lockfile_path") {
            m_config.lockfile_path = value;
        }
        else if (key == "connect_max_attempts") {
            parseUnsigned(key, value, m_config.connect_max_attempts);
        }
        else if (key == "connect_retry_delay_ms") {
            parseUnsigned(key, value, m_config.connect_retry_delay_ms);
        }
        else if (key == "reconnect") {
            m_config.reconnect = (toLower(value) == "true" || value == "1");
        }
        else if (key == "local_timeout_ms") {
            parseUnsigned(key, value, m_config.local_timeout_ms);
        }
        else if (key == "log_file") {
            m_config.log_file = value;
        }
    }
    
    m_path = path;
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("Config: cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }
    
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# League of Leagues companion settings\n\n";
    
    file << "# Registration\n";
    file << "discord_id = " << m_config.discord_id << "\n\n";
    
    file << "# Remote backend\n";
    file << "backend_url = " << m_config.backend_url << "\n";
    file << "download_url = " << m_config.download_url << "\n";
    file << "remote_timeout_ms = " << m_config.remote_timeout_ms << "\n\n";
    
    file << "# League client connection\n";
    file << "lockfile_path = " << m_config.lockfile_path << "\n";
    file << "connect_max_attempts = " << m_config.connect_max_attempts << "\n";
    file << "connect_retry_delay_ms = " << m_config.connect_retry_delay_ms << "\n";
    file << "reconnect = " << (m_config.reconnect ? "true" : "false") << "\n";
    file << "local_timeout_ms = " << m_config.local_timeout_ms << "\n\n";
    
    file << "log_file = " << m_config.log_file << "\n";
    
    return file.good();
}

bool Config::setCredential(const std::string& credential) {
    m_config.discord_id = credential;
    if (m_path.empty()) {
        return true;
    }
    if (!saveToFile(m_path)) {
        LOG_ERROR("Failed to save config to {}", m_path);
        return false;
    }
    LOG_INFO("Saved config to {}", m_path);
    return true;
}

bool Config::clearCredential() {
    m_config.discord_id.clear();
    if (m_path.empty()) {
        return true;
    }
    if (!saveToFile(m_path)) {
        LOG_ERROR("Failed to save config to {}", m_path);
        return false;
    }
    LOG_INFO("Cleared stored credential in {}", m_path);
    return true;
}

} // namespace lolc::utils

#pragma once

#include <string>
#include <cstdint>

namespace lolc::utils {

struct AppConfig {
    // Registration credential returned by the backend
    std::string discord_id;
    
    // Remote backend
    std::string backend_url = "https://rust.gameras.gr";
    std::string download_url;   // empty = <backend_url>/downloadclient
    uint32_t remote_timeout_ms = 10000;
    
    // Local client
    std::string lockfile_path;  // empty = scan running processes
    uint32_t connect_max_attempts = 30;
    uint32_t connect_retry_delay_ms = 10000;
    bool reconnect = true;
    uint32_t local_timeout_ms = 10000;
    
    std::string log_file = "lol-companion.log";
    
    std::string downloadUrl() const {
        return download_url.empty() ? backend_url + "/downloadclient" : download_url;
    }
};

/**
 * Configuration manager
 * 
 * Loads and saves the settings file (key = value, '#' comments).
 * Unknown keys are ignored, bad numbers keep their defaults.
 */
class Config {
public:
    static Config& instance();
    
    // Default location: $XDG_CONFIG_HOME/LeagueOfLeagues/settings.cfg
    static std::string defaultPath();
    
    bool loadFromFile(const std::string& path);
    bool saveToFile(const std::string& path) const;
    
    // Remembers where the settings came from so credential changes persist there
    void setPath(const std::string& path) { m_path = path; }
    const std::string& getPath() const { return m_path; }
    
    const AppConfig& getAppConfig() const { return m_config; }
    AppConfig& getAppConfig() { return m_config; }
    
    bool hasCredential() const { return !m_config.discord_id.empty(); }
    bool setCredential(const std::string& credential);
    bool clearCredential();
    
private:
    Config() = default;
    
    AppConfig m_config;
    std::string m_path;
};

} // namespace lolc::utils

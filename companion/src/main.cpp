#include "app/companion_app.hpp"
#include "lcu/lcu_connection.hpp"
#include "network/http_client.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

#include <iostream>
#include <csignal>

static lolc::app::CompanionApp* g_app = nullptr;

void signalHandler(int signal) {
    (void)signal;
    if (g_app) {
        g_app->requestStop();
    }
}

void printUsage(const char* program) {
    std::cout << "League of Leagues Companion\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   Load settings from file\n";
    std::cout << "                        (default: " << lolc::utils::Config::defaultPath() << ")\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "\n";
    std::cout << "Start the League client, then type 'help' for commands.\n";
}

int main(int argc, char* argv[]) {
    // Parse arguments
    std::string configFile;
    
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
            else {
                std::cerr << "Error: --config requires a filename\n";
                return 1;
            }
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }
    
    // Load configuration
    auto& config = lolc::utils::Config::instance();
    if (configFile.empty()) {
        configFile = lolc::utils::Config::defaultPath();
    }
    
    bool loaded = config.loadFromFile(configFile);
    config.setPath(configFile);
    
    // Initialize logging; the console is shared with the shell
    lolc::utils::Logger::init(config.getAppConfig().log_file, spdlog::level::warn);
    
    LOG_INFO("===========================================");
    LOG_INFO("  League of Leagues Companion");
    LOG_INFO("  Version {}", lolc::app::CompanionApp::kClientVersion);
    LOG_INFO("===========================================");
    
    if (loaded) {
        LOG_INFO("Loaded configuration from {}", configFile);
    }
    else {
        LOG_INFO("No configuration at {}, using defaults", configFile);
    }
    
    const lolc::utils::AppConfig& settings = config.getAppConfig();
    
    std::shared_ptr<lolc::network::HttpTransport> transport;
    try {
        transport = std::make_shared<lolc::network::HttpsTransport>(
            settings.backend_url, std::chrono::milliseconds(settings.remote_timeout_ms));
    }
    catch (const std::exception& e) {
        LOG_CRITICAL("Invalid backend_url '{}': {}", settings.backend_url, e.what());
        std::cerr << "Invalid backend_url: " << settings.backend_url << "\n";
        lolc::utils::Logger::shutdown();
        return 1;
    }
    
    lolc::utils::AppConfig localSettings = settings;
    auto factory = [localSettings](asio::io_context& io_context, uint32_t id) {
        return std::make_shared<lolc::lcu::LcuClientConnection>(io_context, localSettings, id);
    };
    
    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    
    {
        lolc::app::CompanionApp app(config, transport, factory, std::cout);
        g_app = &app;
        
        std::cout << "League of Leagues Companion v" << lolc::app::CompanionApp::kClientVersion
                  << ". Type 'help' for commands.\n";
        
        app.start();
        app.startInputReader();
        
        // Run the UI loop (blocking)
        app.run();
        
        app.stop();
        g_app = nullptr;
    }
    
    LOG_INFO("Shutdown complete");
    lolc::utils::Logger::shutdown();
    
    return 0;
}

/**
 * League of Leagues Companion - Test Runner
 * 
 * Runs all unit tests for the companion core
 */

#include "test_framework.hpp"
#include "utils/logger.hpp"

// Include test files
#include "test_protocol.cpp"
#include "test_backend_client.cpp"
#include "test_lobby_joiner.cpp"
#include "test_session.cpp"
#include "test_dispatcher.cpp"
#include "test_connection_manager.cpp"
#include "test_companion_app.cpp"

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║       League of Leagues Companion - Unit Test Suite          ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";
    
    // Keep expected failures out of the report
    spdlog::set_level(spdlog::level::off);
    
    return lolc::test::TestRunner::getInstance().run();
}

#include "test_framework.hpp"
#include "fakes.hpp"
#include "app/companion_app.hpp"
#include <thread>

using namespace lolc;
using namespace lolc::test;

namespace {

// Ticks until every background task has reported
bool drain(app::CompanionApp& app) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    do {
        app.tick();
        if (app.pendingTasks() == 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    } while (std::chrono::steady_clock::now() < deadline);
    return false;
}

bool contains(const std::ostringstream& out, const std::string& text) {
    return out.str().find(text) != std::string::npos;
}

// Restores the shared settings when a test ends
struct ConfigGuard {
    utils::AppConfig saved;
    std::string path;
    
    ConfigGuard() {
        auto& config = utils::Config::instance();
        saved = config.getAppConfig();
        path = config.getPath();
        config.getAppConfig() = utils::AppConfig();
        config.setPath("");
    }
    
    ~ConfigGuard() {
        auto& config = utils::Config::instance();
        config.getAppConfig() = saved;
        config.setPath(path);
    }
};

} // namespace

TEST(App_StatusBeforeConnect) {
    ConfigGuard guard;
    FakeConnectionFactory factory;
    std::ostringstream out;
    app::CompanionApp app(utils::Config::instance(), std::make_shared<FakeTransport>(), factory.make(), out);
    
    app.handleCommand("status");
    
    ASSERT_TRUE(contains(out, "Client Connected: No"));
    ASSERT_TRUE(contains(out, "Summoner: Not detected"));
    ASSERT_TRUE(contains(out, "Region: Unknown"));
    ASSERT_TRUE(contains(out, "Registered: No"));
    PASS();
}

TEST(App_JoinRequiresReadyClient) {
    ConfigGuard guard;
    FakeConnectionFactory factory;
    auto transport = std::make_shared<FakeTransport>();
    std::ostringstream out;
    app::CompanionApp app(utils::Config::instance(), transport, factory.make(), out);
    
    app.getModel().update([](session::SessionState& state) { state.ready = true; });
    app.handleCommand("join secret");
    
    ASSERT_TRUE(contains(out, "Client not ready or no phase info."));
    ASSERT_EQ(app.pendingTasks(), 0u);
    ASSERT_TRUE(transport->targets().empty());
    PASS();
}

TEST(App_JoinReportsMalformedBackendReply) {
    ConfigGuard guard;
    FakeConnectionFactory factory;
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("/joinmatch?password=secret", 200, "malformed");
    std::ostringstream out;
    app::CompanionApp app(utils::Config::instance(), transport, factory.make(), out);
    
    app.getModel().update([](session::SessionState& state) {
        state.ready = true;
        state.phase = "None";
    });
    app.handleCommand("join secret");
    ASSERT_TRUE(drain(app));
    
    ASSERT_TRUE(contains(out, "Failed to join: Invalid response from server"));
    PASS();
}

TEST(App_RegisterWithManualIdentity) {
    ConfigGuard guard;
    FakeConnectionFactory factory;
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("/otp?otp_pass=CODE42&summonersname=Ana%23NA1%2CNA", 200, "token-77\n");
    std::ostringstream out;
    app::CompanionApp app(utils::Config::instance(), transport, factory.make(), out);
    
    app.handleCommand("register CODE42");
    ASSERT_TRUE(contains(out, "Please open your League client first."));
    
    app.getModel().update([](session::SessionState& state) {
        state.ready = true;
        state.region = "NA";
    });
    
    app.handleCommand("register CODE42");
    ASSERT_TRUE(contains(out, "Use: register <code> Name#Tag"));
    
    app.handleCommand("register CODE42 Ana#NA1");
    ASSERT_TRUE(contains(out, "Registering summoner: Ana#NA1,NA"));
    ASSERT_TRUE(drain(app));
    
    ASSERT_TRUE(contains(out, "Successfully registered!"));
    ASSERT_STREQ(utils::Config::instance().getAppConfig().discord_id, "token-77");
    PASS();
}

TEST(App_UpdateReportsNewVersion) {
    ConfigGuard guard;
    FakeConnectionFactory factory;
    auto transport = std::make_shared<FakeTransport>();
    transport->respond("/client_version", 200, R"({"version":"2.0.0"})");
    std::ostringstream out;
    app::CompanionApp app(utils::Config::instance(), transport, factory.make(), out);
    
    app.handleCommand("update");
    ASSERT_TRUE(drain(app));
    
    ASSERT_TRUE(contains(out, "League of Leagues v2.0.0 is available"));
    ASSERT_TRUE(contains(out, "https://rust.gameras.gr/downloadclient"));
    PASS();
}

TEST(App_UnknownCommand) {
    ConfigGuard guard;
    FakeConnectionFactory factory;
    std::ostringstream out;
    app::CompanionApp app(utils::Config::instance(), std::make_shared<FakeTransport>(), factory.make(), out);
    
    app.handleCommand("  dance  ");
    ASSERT_TRUE(contains(out, "Unknown command 'dance'"));
    PASS();
}

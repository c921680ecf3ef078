#include "app/companion_app.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/strings.hpp"
#include <iostream>
#include <sstream>

namespace lolc::app {

namespace {

std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream stream(line);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

CompanionApp::CompanionApp(utils::Config& config,
                           std::shared_ptr<network::HttpTransport> transport,
                           lcu::ConnectionManager::ConnectionFactory factory,
                           std::ostream& output)
    : m_config(config)
    , m_output(output)
    , m_workGuard(asio::make_work_guard(m_io_context))
    , m_dispatcher(m_io_context)
    , m_connections(m_io_context, m_model, m_dispatcher, std::move(factory),
                    lcu::ConnectionManager::Settings::fromConfig(config.getAppConfig()))
    , m_joiner(m_dispatcher)
    , m_backend(std::move(transport))
    , m_inbox(std::make_shared<Inbox>())
{
    m_connections.setStatusHandler([this](lcu::ConnectionStatus status, const std::string& detail) {
        handleStatusChange(status, detail);
    });
}

CompanionApp::~CompanionApp() {
    stop();
}

void CompanionApp::start() {
    m_running = true;
    
    m_ioThread = std::thread([this]() {
        m_io_context.run();
        LOG_DEBUG("Connection context stopped");
    });
    
    // Outcome is reported through status notices
    m_connections.connect();
    
    checkRegistration();
}

void CompanionApp::startInputReader() {
    // getline cannot be interrupted, so the reader is detached and only
    // touches the shared inbox
    std::shared_ptr<Inbox> inbox = m_inbox;
    std::thread([inbox]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            std::lock_guard<std::mutex> lock(inbox->mutex);
            inbox->lines.push_back(line);
        }
        
        std::lock_guard<std::mutex> lock(inbox->mutex);
        inbox->inputClosed = true;
    }).detach();
}

void CompanionApp::run() {
    while (m_running) {
        tick();
        std::this_thread::sleep_for(kTickInterval);
    }
}

void CompanionApp::stop() {
    if (m_stopped) return;
    m_stopped = true;
    m_running = false;
    
    m_connections.disconnect();
    
    // Let the disconnect drain, then allow run() to return
    asio::post(m_io_context, [this]() {
        m_workGuard.reset();
    });
    
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
    
    LOG_INFO("Companion stopped");
}

void CompanionApp::tick() {
    std::deque<std::string> lines;
    std::deque<std::string> notices;
    bool inputClosed = false;
    {
        std::lock_guard<std::mutex> lock(m_inbox->mutex);
        lines.swap(m_inbox->lines);
        notices.swap(m_inbox->notices);
        inputClosed = m_inbox->inputClosed;
    }
    
    for (const auto& notice : notices) {
        say(notice);
    }
    
    for (const auto& line : lines) {
        handleCommand(line);
    }
    
    // Handlers may track follow-up work while we iterate
    std::vector<PendingTask> pending = std::move(m_pending);
    m_pending.clear();
    
    std::vector<PendingTask> unfinished;
    for (auto& task : pending) {
        if (!task()) {
            unfinished.push_back(std::move(task));
        }
    }
    m_pending.insert(m_pending.begin(),
                     std::make_move_iterator(unfinished.begin()),
                     std::make_move_iterator(unfinished.end()));
    
    if (inputClosed && lines.empty()) {
        LOG_INFO("Input closed, shutting down");
        requestStop();
    }
}

void CompanionApp::handleCommand(const std::string& line) {
    std::vector<std::string> words = splitWords(line);
    if (words.empty()) {
        return;
    }
    
    std::string command = utils::toLower(words[0]);
    std::vector<std::string> args(words.begin() + 1, words.end());
    
    LOG_DEBUG("Command: {}", command);
    
    if (command == "register") {
        commandRegister(args);
    }
    else if (command == "join") {
        commandJoin(args);
    }
    else if (command == "status") {
        commandStatus();
    }
    else if (command == "update") {
        commandUpdate();
    }
    else if (command == "connect") {
        commandConnect();
    }
    else if (command == "help") {
        printHelp();
    }
    else if (command == "quit" || command == "exit") {
        requestStop();
    }
    else {
        say("Unknown command '" + command + "'. Type 'help' for a list of commands.");
    }
}

void CompanionApp::checkRegistration() {
    if (!m_config.hasCredential()) {
        say("Not registered yet. Use 'register <code>' with the code from the League of Leagues bot.");
        return;
    }
    
    std::string credential = m_config.getAppConfig().discord_id;
    backend::BackendClient& backend = m_backend;
    
    track(std::async(std::launch::async, [&backend, credential]() {
        return backend.authenticate(credential);
    }), [this](std::future<backend::AuthStatus>& result) {
        backend::AuthStatus status = result.get();
        switch (status) {
            case backend::AuthStatus::Authenticated:
                LOG_INFO("Successfully authenticated with stored credentials");
                break;
            
            case backend::AuthStatus::NotRegistered:
                LOG_WARN("Stored credentials are no longer registered");
                m_config.clearCredential();
                say("Your registration was not found. Use 'register <code>' to register again.");
                break;
            
            case backend::AuthStatus::Unknown:
                LOG_WARN("Could not verify stored credentials, keeping them");
                break;
        }
    });
}

void CompanionApp::handleStatusChange(lcu::ConnectionStatus status, const std::string& detail) {
    switch (status) {
        case lcu::ConnectionStatus::Connecting:
            pushNotice("Waiting for the League client...");
            break;
        
        case lcu::ConnectionStatus::Connected:
            pushNotice("Connected to the League client.");
            break;
        
        case lcu::ConnectionStatus::Disconnected:
            pushNotice("Disconnected from the League client.");
            break;
        
        case lcu::ConnectionStatus::Exhausted:
            pushNotice("Failed to connect to the League client (" + detail +
                       "). Start the client and type 'connect' to try again.");
            break;
        
        case lcu::ConnectionStatus::Idle:
            break;
    }
}

void CompanionApp::pushNotice(const std::string& notice) {
    std::lock_guard<std::mutex> lock(m_inbox->mutex);
    m_inbox->notices.push_back(notice);
}

void CompanionApp::commandRegister(const std::vector<std::string>& args) {
    if (args.empty()) {
        say("Usage: register <code> [Name#Tag]");
        return;
    }
    
    session::SessionState state = m_model.snapshot();
    if (!state.ready) {
        say("Please open your League client first.");
        return;
    }
    
    std::optional<lcu::PlayerIdentity> identity = state.identity;
    if (!identity) {
        if (args.size() < 2) {
            say("Could not automatically detect your summoner information. "
                "Use: register <code> Name#Tag");
            return;
        }
        
        std::string manual = args[1];
        for (size_t i = 2; i < args.size(); i++) {
            manual += " " + args[i];
        }
        
        size_t hash = manual.find('#');
        if (hash == std::string::npos) {
            say("Invalid format. Please use: Name#Tag");
            return;
        }
        identity = lcu::PlayerIdentity{utils::trim(manual.substr(0, hash)),
                                       utils::trim(manual.substr(hash + 1))};
    }
    
    std::string display = identity->toString();
    if (state.region) {
        display += "," + *state.region;
    }
    
    say("Registering summoner: " + display);
    
    std::string code = args[0];
    backend::BackendClient& backend = m_backend;
    
    track(std::async(std::launch::async, [&backend, code, display]() {
        return backend.redeemCode(code, display);
    }), [this](std::future<std::string>& result) {
        try {
            std::string credential = result.get();
            if (!m_config.setCredential(credential)) {
                LOG_WARN("Registered, but the credential could not be saved");
            }
            say("Successfully registered!");
        }
        catch (const RemoteRequestError& e) {
            say("Registration failed: Invalid registration code or server error.");
            LOG_WARN("Registration failed: {}", e.what());
        }
        catch (const Error& e) {
            say(std::string("Registration failed: ") + e.what());
        }
    });
}

void CompanionApp::commandJoin(const std::vector<std::string>& args) {
    if (args.empty()) {
        say("Usage: join <password>");
        return;
    }
    
    session::SessionState state = m_model.snapshot();
    if (!state.ready || !state.phase) {
        say("Client not ready or no phase info.");
        return;
    }
    
    LOG_DEBUG("Join requested in phase {}", *state.phase);
    
    std::string password = args[0];
    backend::BackendClient& backend = m_backend;
    
    track(std::async(std::launch::async, [&backend, password]() {
        return backend.joinMatch(password);
    }), [this](std::future<lcu::JoinRequest>& result) {
        lcu::JoinRequest request;
        try {
            request = result.get();
        }
        catch (const MalformedResponseError& e) {
            LOG_WARN("Join failed: {}", e.what());
            say("Failed to join: Invalid response from server");
            return;
        }
        catch (const RemoteRequestError& e) {
            LOG_WARN("Join failed: {}", e.what());
            say("Failed to join: Invalid response from server");
            return;
        }
        
        say("Looking for " + request.target() + "'s lobby...");
        
        track(m_joiner.joinLobby(request), [this](std::future<lobby::JoinResult>& joined) {
            try {
                lobby::JoinResult outcome = joined.get();
                say("Successfully joined " + outcome.target + "'s lobby!");
            }
            catch (const LobbyNotFound& e) {
                say(e.what());
            }
            catch (const JoinFailed& e) {
                say(e.what());
            }
            catch (const NotConnectedError& e) {
                say(std::string("Failed to join: ") + e.what());
            }
            catch (const Error& e) {
                say(std::string("Error during join process: ") + e.what());
            }
        });
    });
}

void CompanionApp::commandStatus() {
    session::SessionState state = m_model.snapshot();
    
    std::ostringstream status;
    status << "Status:\n";
    status << "  Client Connected: " << (state.ready ? "Yes" : "No") << "\n";
    status << "  Summoner: " << (state.identity ? state.identity->toString() : "Not detected") << "\n";
    status << "  Region: " << state.region.value_or("Unknown") << "\n";
    status << "  Phase: " << state.phase.value_or("Unknown") << "\n";
    status << "  Registered: " << (m_config.hasCredential() ? "Yes" : "No");
    say(status.str());
}

void CompanionApp::commandUpdate() {
    say("Checking for updates...");
    
    backend::BackendClient& backend = m_backend;
    std::string downloadUrl = m_config.getAppConfig().downloadUrl();
    
    track(std::async(std::launch::async, [&backend]() {
        return backend.fetchLatestVersion();
    }), [this, downloadUrl](std::future<std::string>& result) {
        try {
            std::string version = result.get();
            if (version == kClientVersion) {
                say(std::string("You are running the latest version (v") + kClientVersion + ").");
                return;
            }
            say("League of Leagues v" + version + " is available (running v" + kClientVersion + ").");
            say("Download it from " + downloadUrl);
        }
        catch (const Error& e) {
            say(std::string("Failed to check for updates. ") + e.what());
        }
    });
}

void CompanionApp::commandConnect() {
    lcu::ConnectionStatus status = m_connections.status();
    if (status == lcu::ConnectionStatus::Connected || status == lcu::ConnectionStatus::Connecting) {
        say(std::string("Connection is already ") + utils::toLower(lcu::toString(status)) + ".");
        return;
    }
    
    m_connections.connect();
}

void CompanionApp::printHelp() {
    say("Commands:\n"
        "  register <code> [Name#Tag]  Register this summoner with the bot's code\n"
        "  join <password>             Join a match lobby\n"
        "  status                      Show connection and registration status\n"
        "  update                      Check for a newer client version\n"
        "  connect                     Retry connecting to the League client\n"
        "  help                        Show this list\n"
        "  quit                        Exit");
}

void CompanionApp::say(const std::string& message) {
    m_output << message << std::endl;
}

} // namespace lolc::app

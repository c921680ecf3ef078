#pragma once

#include "lcu/lcu_types.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace lolc::session {

struct SessionState {
    bool ready = false;
    std::optional<std::string> phase;
    std::optional<lcu::PlayerIdentity> identity;
    std::optional<std::string> region;  // upper-case
};

/**
 * Session State Model
 * 
 * The single shared copy of what the companion knows about the client.
 * Writers are event handlers on the connection's io_context thread; any
 * thread may take a snapshot. A mutator sees and replaces the whole state,
 * so readers never observe half of an update.
 */
class SessionStateModel {
public:
    using Mutator = std::function<void(SessionState&)>;
    
    SessionState snapshot() const;
    
    void update(const Mutator& mutator);
    
    // Back to not-ready with every field absent
    void reset();
    
    // Incremented by every update and reset
    uint64_t version() const;
    
private:
    mutable std::mutex m_mutex;
    SessionState m_state;
    uint64_t m_version = 0;
};

} // namespace lolc::session

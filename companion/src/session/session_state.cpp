#include "session/session_state.hpp"

namespace lolc::session {

SessionState SessionStateModel::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void SessionStateModel::update(const Mutator& mutator) {
    SessionState next = snapshot();
    mutator(next);
    
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = std::move(next);
    m_version++;
}

void SessionStateModel::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = SessionState();
    m_version++;
}

uint64_t SessionStateModel::version() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_version;
}

} // namespace lolc::session

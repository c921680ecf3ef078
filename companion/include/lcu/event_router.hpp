#pragma once

#include "lcu/lcu_types.hpp"
#include "lcu/requester.hpp"
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace lolc::lcu {

// WAMP subscription for every JSON API event
constexpr const char* kSubscribeAllEvents = "[5,\"OnJsonApiEvent\"]";

// Parses [8, "OnJsonApiEvent", {uri, eventType, data}]; anything else is nullopt
std::optional<Event> parseEventMessage(const std::string& text);

/**
 * Event Router
 * 
 * Maps (uri, event type) to a handler. Filled once at startup.
 * Unknown pairs are dropped explicitly, and a throwing handler is
 * logged without disturbing the caller's receive loop.
 */
class EventRouter {
public:
    using Handler = std::function<void(const std::shared_ptr<Requester>&, const Event&)>;
    
    void on(const std::string& uri, std::initializer_list<EventType> types, const Handler& handler);
    
    // Returns true if a handler ran to completion
    bool dispatch(const std::shared_ptr<Requester>& requester, const Event& event) const;
    
    bool handles(const std::string& uri, EventType type) const;
    size_t size() const { return m_handlers.size(); }
    
private:
    std::map<std::pair<std::string, EventType>, Handler> m_handlers;
};

} // namespace lolc::lcu

#include "lcu/event_router.hpp"
#include "utils/logger.hpp"

namespace lolc::lcu {

namespace {

constexpr int kWampEvent = 8;

} // namespace

std::optional<Event> parseEventMessage(const std::string& text) {
    nlohmann::json message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_array() || message.size() < 3) {
        return std::nullopt;
    }
    
    if (!message[0].is_number_integer() || message[0].get<int>() != kWampEvent) {
        return std::nullopt;
    }
    
    const auto& payload = message[2];
    if (!payload.is_object()) {
        return std::nullopt;
    }
    
    auto uri = payload.find("uri");
    auto eventType = payload.find("eventType");
    if (uri == payload.end() || !uri->is_string() ||
        eventType == payload.end() || !eventType->is_string()) {
        return std::nullopt;
    }
    
    auto type = parseEventType(eventType->get<std::string>());
    if (!type) {
        return std::nullopt;
    }
    
    Event event;
    event.uri = uri->get<std::string>();
    event.type = *type;
    if (auto data = payload.find("data"); data != payload.end()) {
        event.data = *data;
    }
    return event;
}

void EventRouter::on(const std::string& uri, std::initializer_list<EventType> types,
                     const Handler& handler) {
    for (EventType type : types) {
        LOG_DEBUG("Registering event handler: {} {}", toString(type), uri);
        m_handlers[{uri, type}] = handler;
    }
}

bool EventRouter::dispatch(const std::shared_ptr<Requester>& requester, const Event& event) const {
    auto it = m_handlers.find({event.uri, event.type});
    if (it == m_handlers.end()) {
        LOG_TRACE("Ignoring event {} {}", toString(event.type), event.uri);
        return false;
    }
    
    try {
        it->second(requester, event);
        return true;
    }
    catch (const std::exception& e) {
        LOG_ERROR("Error in {} handler for {}: {}", toString(event.type), event.uri, e.what());
        return false;
    }
}

bool EventRouter::handles(const std::string& uri, EventType type) const {
    return m_handlers.count({uri, type}) > 0;
}

} // namespace lolc::lcu

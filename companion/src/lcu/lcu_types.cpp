#include "lcu/lcu_types.hpp"
#include "utils/strings.hpp"

namespace lolc::lcu {

const char* toString(EventType type) {
    switch (type) {
        case EventType::Create: return "Create";
        case EventType::Update: return "Update";
        case EventType::Delete: return "Delete";
    }
    return "Unknown";
}

std::optional<EventType> parseEventType(const std::string& name) {
    std::string lower = utils::toLower(name);
    if (lower == "create") return EventType::Create;
    if (lower == "update") return EventType::Update;
    if (lower == "delete") return EventType::Delete;
    return std::nullopt;
}

} // namespace lolc::lcu

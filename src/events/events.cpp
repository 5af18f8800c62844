#include "stowage/events.hpp"

namespace stowage {

std::vector<Event> EventCollector::of_kind(EventKind kind) const {
    std::vector<Event> result;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            result.push_back(event);
        }
    }
    return result;
}

} // namespace stowage

#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stowage {

// ============================================================================
// Progress Events
// ============================================================================
//
// The core reports progress as structured events. Formatting them for a
// terminal or a JSON document is left to the presentation layer.

enum class EventKind {
    service_pinning,    // service, image
    service_pinned,     // service, image, platforms, pinned
    pattern_ignored,    // pattern (once per pattern per archive build)
    blob_uploaded,      // digest, media_type, size
    manifest_pushed,    // digest, tag, reference
};

inline const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::service_pinning: return "service_pinning";
        case EventKind::service_pinned: return "service_pinned";
        case EventKind::pattern_ignored: return "pattern_ignored";
        case EventKind::blob_uploaded: return "blob_uploaded";
        case EventKind::manifest_pushed: return "manifest_pushed";
        default: return "unknown";
    }
}

using EventFields = std::unordered_map<std::string, std::string>;

struct Event {
    EventKind kind;
    EventFields fields;

    std::string field(const std::string& key) const {
        auto it = fields.find(key);
        return it == fields.end() ? std::string() : it->second;
    }
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;
};

// Emit through a possibly-null sink
inline void emit_event(EventSink* sink, EventKind kind, EventFields fields) {
    if (sink) {
        sink->emit(Event{kind, std::move(fields)});
    }
}

// ============================================================================
// Event Collector
// ============================================================================

// Records events in emission order
class EventCollector : public EventSink {
public:
    void emit(const Event& event) override { events_.push_back(event); }

    const std::vector<Event>& events() const { return events_; }

    std::vector<Event> of_kind(EventKind kind) const;

    size_t count(EventKind kind) const { return of_kind(kind).size(); }

    void clear() { events_.clear(); }

private:
    std::vector<Event> events_;
};

} // namespace stowage

#include "event_classifier.h"
#include <nlohmann/json.hpp>

namespace bridge::protocol {

    const char *to_string(EventKind kind) {
        switch (kind) {
            case EventKind::ENDPOINT_DISCOVERY:
                return "endpoint";
            case EventKind::SUPPRESSED:
                return "suppressed";
            case EventKind::PASS_THROUGH:
                return "pass-through";
        }
        return "unknown";
    }

    std::vector<std::string> EventClassifier::default_suppressed_methods() {
        return {"connection/ready", "server/capabilities"};
    }

    EventClassifier::EventClassifier()
        : EventClassifier(default_suppressed_methods()) {
    }

    EventClassifier::EventClassifier(const std::vector<std::string> &suppressed_methods)
        : suppressed_(suppressed_methods.begin(), suppressed_methods.end()) {
    }

    bool EventClassifier::is_suppressed_method(const std::string &method) const {
        return suppressed_.count(method) != 0;
    }

    EventKind EventClassifier::classify(const SseEvent &event) const {
        if (event.name && *event.name == ENDPOINT_EVENT) {
            return EventKind::ENDPOINT_DISCOVERY;
        }

        // parse without exceptions, malformed data is forwarded as-is
        auto payload = nlohmann::json::parse(event.data, nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            return EventKind::PASS_THROUGH;
        }

        auto method = payload.find("method");
        if (method != payload.end() && method->is_string() &&
            is_suppressed_method(method->get<std::string>())) {
            return EventKind::SUPPRESSED;
        }
        return EventKind::PASS_THROUGH;
    }

}// namespace bridge::protocol

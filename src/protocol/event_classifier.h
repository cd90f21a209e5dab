#pragma once

#include "event_framer.h"
#include <string>
#include <unordered_set>
#include <vector>

namespace bridge::protocol {

    /// reserved event name announcing the POST target
    constexpr const char *ENDPOINT_EVENT = "endpoint";

    enum class EventKind {
        ENDPOINT_DISCOVERY,///< updates the outbound target, never forwarded
        SUPPRESSED,        ///< transport bookkeeping, dropped
        PASS_THROUGH       ///< forwarded verbatim to the local peer
    };

    const char *to_string(EventKind kind);

    /**
     * @brief Decides what happens to each event read from the SSE channel.
     *
     * Data that is not JSON, or JSON whose "method" is not in the suppressed
     * set, passes through unchanged.
     */
    class EventClassifier {
    public:
        EventClassifier();
        explicit EventClassifier(const std::vector<std::string> &suppressed_methods);

        EventKind classify(const SseEvent &event) const;

        bool is_suppressed_method(const std::string &method) const;
        const std::unordered_set<std::string> &suppressed_methods() const { return suppressed_; }

        static std::vector<std::string> default_suppressed_methods();

    private:
        std::unordered_set<std::string> suppressed_;
    };

}// namespace bridge::protocol

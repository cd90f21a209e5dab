#include "endpoint_router.h"
#include "core/logger.h"

namespace bridge::core {

    EndpointRouter::EndpointRouter(const std::string &sse_url,
                                   const std::string &sse_suffix,
                                   const std::string &post_suffix)
        : sse_url_(sse_url),
          origin_(utils::Url::parse(sse_url).origin()),
          target_(utils::derive_post_url(sse_url, sse_suffix, post_suffix)) {
        BRIDGE_DEBUG("Initial POST target: {}", target_);
    }

    std::string EndpointRouter::resolve(std::string_view data) const {
        if (utils::has_http_scheme(data)) {
            return std::string(data);
        }
        if (!data.empty() && data.front() == '/') {
            return origin_ + std::string(data);
        }
        return std::string(data);
    }

    std::string EndpointRouter::update(std::string_view data) {
        if (data.substr(0, 2) == "//") {
            BRIDGE_WARN("Endpoint event looks protocol-relative, resolving it as a path: {}", data);
        }
        auto resolved = resolve(data);
        if (!utils::has_http_scheme(resolved)) {
            BRIDGE_WARN("Endpoint event carried a non-URL value, using it verbatim: {}", resolved);
        }
        ++generation_;
        if (resolved != target_) {
            BRIDGE_INFO("POST target changed: {} -> {}", target_, resolved);
        }
        target_ = std::move(resolved);
        return target_;
    }

}// namespace bridge::core

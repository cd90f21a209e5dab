#include "url.h"
#include "string_utils.h"
#include <cctype>

namespace bridge::utils {

    namespace {

        std::string default_port(const std::string &scheme) {
            return scheme == "https" ? "443" : "80";
        }

        bool is_valid_port(std::string_view port) {
            if (port.empty() || port.size() > 5) return false;
            unsigned long value = 0;
            for (char c: port) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
                value = value * 10 + static_cast<unsigned long>(c - '0');
            }
            return value > 0 && value <= 65535;
        }

    }// namespace

    Url Url::parse(std::string_view text) {
        text = trim(text);
        auto scheme_end = text.find("://");
        if (scheme_end == std::string_view::npos) {
            throw UrlError("missing scheme in URL: " + std::string(text));
        }

        Url url;
        url.scheme = to_lower(text.substr(0, scheme_end));
        if (url.scheme != "http" && url.scheme != "https") {
            throw UrlError("unsupported URL scheme: " + url.scheme);
        }

        auto rest = text.substr(scheme_end + 3);
        auto authority_end = rest.find_first_of("/?#");
        auto authority = rest.substr(0, authority_end);
        auto target = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

        if (authority.find('@') != std::string_view::npos) {
            throw UrlError("credentials in URL are not supported");
        }

        std::string_view host;
        std::string_view port;
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                throw UrlError("unterminated IPv6 address in URL: " + std::string(text));
            }
            host = authority.substr(1, close - 1);
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    throw UrlError("malformed authority in URL: " + std::string(text));
                }
                port = after.substr(1);
            }
        } else {
            auto colon = authority.rfind(':');
            host = authority.substr(0, colon);
            if (colon != std::string_view::npos) {
                port = authority.substr(colon + 1);
            }
        }

        if (host.empty()) {
            throw UrlError("missing host in URL: " + std::string(text));
        }
        url.host = to_lower(host);

        if (port.empty()) {
            url.port = default_port(url.scheme);
        } else {
            if (!is_valid_port(port)) {
                throw UrlError("invalid port in URL: " + std::string(port));
            }
            url.port = std::string(port);
            url.explicit_port = url.port != default_port(url.scheme);
        }

        auto fragment = target.find('#');
        if (fragment != std::string_view::npos) {
            target = target.substr(0, fragment);
        }
        if (target.empty() || target.front() != '/') {
            url.target = "/" + std::string(target);
        } else {
            url.target = std::string(target);
        }
        return url;
    }

    std::string Url::host_header() const {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (explicit_port) {
            h += ":" + port;
        }
        return h;
    }

    std::string Url::origin() const {
        return scheme + "://" + host_header();
    }

    bool has_http_scheme(std::string_view text) {
        return istarts_with(text, "http://") || istarts_with(text, "https://");
    }

    std::string derive_post_url(const std::string &sse_url,
                                const std::string &sse_suffix,
                                const std::string &post_suffix) {
        if (sse_suffix.empty() || !ends_with(sse_url, sse_suffix)) {
            return sse_url;
        }
        return sse_url.substr(0, sse_url.size() - sse_suffix.size()) + post_suffix;
    }

}// namespace bridge::utils

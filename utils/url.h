#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace bridge::utils {

    /**
     * @brief Raised when a string cannot be interpreted as an http(s) URL.
     */
    class UrlError : public std::runtime_error {
    public:
        explicit UrlError(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief Minimal absolute http/https URL.
     *
     * Only what an HTTP/1.1 client needs: where to connect and what to put
     * on the request line. Userinfo is rejected, fragments are dropped.
     */
    struct Url {
        std::string scheme;///< "http" or "https", lower case
        std::string host;  ///< host name or address, IPv6 without brackets
        std::string port;  ///< explicit port, or the scheme default
        std::string target;///< path and query, never empty ("/" at least)
        bool explicit_port = false;

        /**
         * @brief Parse an absolute URL.
         * @throws UrlError if the scheme is not http/https or the authority is malformed
         */
        static Url parse(std::string_view text);

        bool is_tls() const { return scheme == "https"; }

        /// scheme://host[:port], port omitted when it is the scheme default
        std::string origin() const;

        /// value for the Host request header
        std::string host_header() const;

        std::string str() const { return origin() + target; }
    };

    /// true for "http://" and "https://" prefixes, case-insensitive
    bool has_http_scheme(std::string_view text);

    /**
     * @brief Replace a trailing path suffix of the SSE URL to obtain the POST URL.
     *
     * "https://host/sse" with suffixes "/sse" and "/mcp" gives "https://host/mcp".
     * URLs that do not end with @p sse_suffix are returned unchanged.
     */
    std::string derive_post_url(const std::string &sse_url,
                                const std::string &sse_suffix = "/sse",
                                const std::string &post_suffix = "/mcp");

}// namespace bridge::utils

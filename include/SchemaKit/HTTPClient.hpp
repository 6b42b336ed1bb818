#pragma once

#include <string>
#include <tuple>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace SchemaKit {

/**
 * \brief Blocking HTTP/HTTPS GET used to download OpenAPI documents.
 *
 * Network, DNS and TLS failures are thrown (boost::system::system_error),
 * malformed URLs raise std::invalid_argument. HTTP error statuses are
 * returned to the caller, not thrown.
 */
class HTTPClient {
public:
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    struct ParsedUrl { bool https; std::string host; std::string port; std::string target; };

    // Single request for a basic http(s)://host[:port][/path?query] URL
    static std::tuple<unsigned, Response>
    Get(const std::string& url);

    /// GET following up to max_redirects 3xx responses carrying a Location header.
    static std::tuple<unsigned, Response>
    Fetch(const std::string& url, unsigned max_redirects = 5);

    /// True for URLs with an http:// or https:// scheme (case-insensitive).
    static bool isHttpUrl(const std::string& url);

    static ParsedUrl parseUrl(const std::string& url);

    /// Resolve a Location header against the URL that produced it.
    static std::string resolveLocation(const std::string& base_url, const std::string& location);

private:
    using tcp = boost::asio::ip::tcp;

    static std::tuple<unsigned, Response>
    request(bool https,
            const std::string& host,
            const std::string& port,
            const std::string& target);
};

} // namespace SchemaKit

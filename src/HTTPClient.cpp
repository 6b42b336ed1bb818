#include "SchemaKit/HTTPClient.hpp"

#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

using tcp = boost::asio::ip::tcp;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace http = beast::http;

namespace SchemaKit {

bool HTTPClient::isHttpUrl(const std::string& url) {
    static const std::regex re(R"(^[Hh][Tt][Tt][Pp][Ss]?://.*)");
    return std::regex_match(url, re);
}

HTTPClient::ParsedUrl HTTPClient::parseUrl(const std::string& url) {
    // Supports: http(s)://host[:port][/path?query]
    static const std::regex re(R"(^([Hh][Tt][Tt][Pp][Ss]?)://([^/:]+)(?::(\d+))?(\/.*)?$)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw std::invalid_argument("Unsupported or invalid URL: " + url);
    }
    ParsedUrl p;
    const auto scheme = m[1].str();
    p.https = (scheme.size() == 5);
    p.host = m[2].str();
    p.port = m[3].matched ? m[3].str() : (p.https ? "443" : "80");
    p.target = m[4].matched ? m[4].str() : std::string("/");
    return p;
}

std::string HTTPClient::resolveLocation(const std::string& base_url, const std::string& location) {
    if (isHttpUrl(location)) return location;
    const auto base = parseUrl(base_url);
    const std::string origin = std::string(base.https ? "https" : "http") + "://" + base.host + ":" + base.port;
    if (location.rfind("//", 0) == 0) {
        return std::string(base.https ? "https:" : "http:") + location;
    }
    if (!location.empty() && location.front() == '/') {
        return origin + location;
    }
    // Relative to the directory of the current target
    auto path = base.target.substr(0, base.target.find('?'));
    path = path.substr(0, path.rfind('/') + 1);
    return origin + path + location;
}

std::tuple<unsigned, HTTPClient::Response>
HTTPClient::Get(const std::string& url) {
    auto p = parseUrl(url);
    return request(p.https, p.host, p.port, p.target);
}

std::tuple<unsigned, HTTPClient::Response>
HTTPClient::Fetch(const std::string& url, unsigned max_redirects) {
    std::string current = url;
    for (unsigned hop = 0;; ++hop) {
        auto [status, res] = Get(current);
        const bool redirect = status >= 300 && status < 400 && res.find(http::field::location) != res.end();
        if (!redirect || hop >= max_redirects) {
            return {status, std::move(res)};
        }
        const auto location = res[http::field::location];
        current = resolveLocation(current, std::string(location.data(), location.size()));
    }
}

std::tuple<unsigned, HTTPClient::Response>
HTTPClient::request(bool https,
                    const std::string& host,
                    const std::string& port,
                    const std::string& target) {
    net::io_context ioc;

    tcp::resolver resolver{ioc};
    auto const results = resolver.resolve(host, port);

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, std::string{"openapi2jsonschema (Boost.Beast)"});
    req.set(http::field::accept, std::string{"application/json, application/yaml, */*"});

    // Full Kubernetes specs are larger than Beast's default body limit
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    beast::flat_buffer buffer;

    if (!https) {
        beast::tcp_stream stream{ioc};
        stream.connect(results);

        http::write(stream, req);
        http::read(stream, buffer, parser);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        // ignore shutdown errors
    } else {
        ssl::context ctx{ssl::context::tls_client};
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};

        // SNI
        if(! SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }

        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        http::write(stream, req);
        http::read(stream, buffer, parser);

        beast::error_code ec;
        // Servers commonly skip close_notify; the body is complete at this point
        stream.shutdown(ec);
    }

    Response res = parser.release();
    return {res.result_int(), std::move(res)};
}

} // namespace SchemaKit

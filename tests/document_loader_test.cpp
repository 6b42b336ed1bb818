#define BOOST_TEST_MODULE DocumentLoaderSuite
#include <boost/test/included/unit_test.hpp>

#include <csignal>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "SchemaKit/DocumentLoader.hpp"
#include "SchemaKit/Errors.hpp"
#include "SchemaKit/HTTPClient.hpp"
#include "SchemaKit/Naming.hpp"
#include "test_support.hpp"

using SchemaKit::DocumentError;
using SchemaKit::Node;
using test_support::at;

namespace {

// Answers one connection per canned response, in order, then exits.
class CannedServer {
public:
    explicit CannedServer(std::vector<std::string> responses)
        : CannedServer(std::move(responses), test_support::find_free_port()) {}

    // Setup failures (e.g. the port is taken) are rethrown here.
    CannedServer(std::vector<std::string> responses, unsigned short port)
        : port_(port) {
        std::signal(SIGPIPE, SIG_IGN);
        std::promise<void> ready;
        auto ready_future = ready.get_future();
        thread_ = std::thread([this, responses = std::move(responses), ready = std::move(ready)]() mutable {
            namespace asio = boost::asio;
            using tcp = asio::ip::tcp;
            asio::io_context ioc;
            std::optional<tcp::acceptor> acceptor;
            try {
                acceptor.emplace(ioc, tcp::endpoint{asio::ip::make_address("127.0.0.1"), port_});
            } catch (...) {
                ready.set_exception(std::current_exception());
                return;
            }
            ready.set_value();
            for (const auto& response : responses) {
                tcp::socket socket(ioc);
                boost::system::error_code ec;
                acceptor->accept(socket, ec);
                if (ec) return;

                asio::streambuf request;
                asio::read_until(socket, request, "\r\n\r\n", ec);
                asio::write(socket, asio::buffer(response), ec);
                socket.shutdown(tcp::socket::shutdown_both, ec);
            }
        });
        try {
            ready_future.get();
        } catch (...) {
            thread_.join();
            throw;
        }
    }

    ~CannedServer() {
        if (thread_.joinable()) thread_.join();
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

private:
    unsigned short port_;
    std::thread thread_;
};

std::string http_response(const std::string& status, const std::string& body, const std::string& extra = {}) {
    return "HTTP/1.1 " + status + "\r\n"
           "Content-Type: application/yaml\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n" + extra + "\r\n" + body;
}

} // namespace

BOOST_AUTO_TEST_SUITE(Parsing)

BOOST_AUTO_TEST_CASE(json_keeps_key_order) {
    const Node doc = SchemaKit::parse_document(R"({"swagger": "2.0", "b": 1, "a": 2})");
    BOOST_TEST(doc.dump() == R"({"swagger":"2.0","b":1,"a":2})");
}

BOOST_AUTO_TEST_CASE(yaml_scalars_are_typed) {
    const Node doc = SchemaKit::parse_document(
        "swagger: \"2.0\"\n"
        "quoted: '3'\n"
        "count: 3\n"
        "negative: -4\n"
        "ratio: 1.5\n"
        "flag: true\n"
        "nothing: ~\n"
        "empty:\n"
        "word: int-or-string\n"
        "flow: {a: b, list: [1, x]}\n"
        "block:\n"
        "  - name: one\n"
        "    required: [name]\n"
        "  - two\n");
    BOOST_TEST(doc["swagger"] == "2.0");
    BOOST_TEST(doc["quoted"] == "3");
    BOOST_TEST(doc["count"] == 3);
    BOOST_TEST(doc["negative"] == -4);
    BOOST_TEST(doc["ratio"] == 1.5);
    BOOST_TEST(doc["flag"] == true);
    BOOST_TEST(doc["nothing"].is_null());
    BOOST_TEST(doc["empty"].is_null());
    BOOST_TEST(doc["word"] == "int-or-string");
    BOOST_TEST(doc["flow"] == Node::parse(R"({"a": "b", "list": [1, "x"]})"));
    BOOST_TEST(at(doc, "/block/0/required/0") == "name");
    BOOST_TEST(at(doc, "/block/1") == "two");
}

BOOST_AUTO_TEST_CASE(yaml_keeps_key_order) {
    const Node doc = SchemaKit::parse_document("openapi: 3.0.0\nz: 1\na: 2\n");
    BOOST_TEST(doc.dump() == R"({"openapi":"3.0.0","z":1,"a":2})");
}

BOOST_AUTO_TEST_CASE(flow_style_yaml_document) {
    const Node doc = SchemaKit::parse_document("{swagger: '2.0', definitions: {core.v1.Pod: {type: object}}}");
    BOOST_TEST(doc.is_object());
    BOOST_TEST(doc["swagger"] == "2.0");
    BOOST_TEST(doc["definitions"]["core.v1.Pod"]["type"] == "object");
    BOOST_TEST(SchemaKit::detect_version(doc) == "2.0");

    const Node list = SchemaKit::parse_document("[a, 1, {b: c}]");
    BOOST_TEST(list == Node::parse(R"(["a", 1, {"b": "c"}])"));
}

BOOST_AUTO_TEST_CASE(yaml_1_1_booleans_stay_strings) {
    const Node doc = SchemaKit::parse_document("a: yes\nb: no\nc: on\nd: off\ne: 0755\nf: 0x1F\n");
    BOOST_TEST(doc["a"] == "yes");
    BOOST_TEST(doc["b"] == "no");
    BOOST_TEST(doc["c"] == "on");
    BOOST_TEST(doc["d"] == "off");
    BOOST_TEST(doc["e"] == 755);
    BOOST_TEST(doc["f"] == 31);
}

BOOST_AUTO_TEST_CASE(syntax_errors_raise_document_error) {
    BOOST_CHECK_THROW(SchemaKit::parse_document("{\"swagger\": "), DocumentError);
    BOOST_CHECK_THROW(SchemaKit::parse_document("a: [1, 2\n"), DocumentError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Versions)

BOOST_AUTO_TEST_CASE(version_fields) {
    BOOST_TEST(SchemaKit::detect_version(Node::parse(R"({"swagger": "2.0"})")) == "2.0");
    BOOST_TEST(SchemaKit::detect_version(Node::parse(R"({"openapi": "3.0.1"})")) == "3.0.1");
    BOOST_TEST(SchemaKit::detect_version(SchemaKit::parse_document("swagger: 2.0\n")) == "2.0");
    BOOST_CHECK_THROW(SchemaKit::detect_version(Node::parse(R"({"info": {}})")), DocumentError);
    BOOST_CHECK_THROW(SchemaKit::detect_version(Node::parse(R"([1])")), DocumentError);
}

BOOST_AUTO_TEST_CASE(declared_types_by_version) {
    const Node v2 = Node::parse(R"({"swagger": "2.0", "definitions": {"core.v1.Pod": {}}})");
    BOOST_TEST(SchemaKit::declared_types(v2, "2.0").contains("core.v1.Pod"));

    const Node v3 = Node::parse(R"({"openapi": "3.0.0", "components": {"schemas": {"Pet": {}}}})");
    BOOST_TEST(SchemaKit::declared_types(v3, "3.0.0").contains("Pet"));

    BOOST_CHECK_THROW(SchemaKit::declared_types(v3, "2.0"), DocumentError);
    BOOST_CHECK_THROW(SchemaKit::declared_types(v2, "3.0.0"), DocumentError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Fetching)

BOOST_AUTO_TEST_CASE(local_paths_and_file_urls) {
    test_support::TempDir dir;
    const auto path = dir.path / "spec with space.yaml";
    test_support::write_file(path, "swagger: '2.0'\ndefinitions: {}\n");

    auto doc = SchemaKit::load_document(path.string());
    BOOST_TEST(doc.version == "2.0");

    auto via_url = SchemaKit::load_document("file://" + SchemaKit::replace_all(path.string(), " ", "%20"));
    BOOST_TEST(via_url.tree == doc.tree);

    BOOST_TEST(SchemaKit::canonical_location(path.string()).rfind("file:///", 0) == 0u);
    BOOST_TEST(SchemaKit::canonical_location("http://example.com/a.json") == "http://example.com/a.json");
}

BOOST_AUTO_TEST_CASE(missing_file_raises_document_error) {
    BOOST_CHECK_THROW(SchemaKit::fetch_text("/nonexistent/schemakit/spec.json"), DocumentError);
}

BOOST_AUTO_TEST_CASE(http_download) {
    CannedServer server({http_response("200 OK", "openapi: 3.0.0\ncomponents:\n  schemas: {}\n")});
    auto doc = SchemaKit::load_document(server.url("/openapi.yaml"));
    BOOST_TEST(doc.version == "3.0.0");
    BOOST_TEST(at(doc.tree, "/components/schemas").is_object());
}

BOOST_AUTO_TEST_CASE(http_redirects_are_followed) {
    CannedServer server({
        http_response("302 Found", "", "Location: /real/swagger.json\r\n"),
        http_response("200 OK", R"({"swagger": "2.0", "definitions": {}})"),
    });
    auto doc = SchemaKit::load_document(server.url("/swagger.json"));
    BOOST_TEST(doc.version == "2.0");
}

BOOST_AUTO_TEST_CASE(redirect_limit_returns_last_response) {
    CannedServer server({http_response("302 Found", "", "Location: /elsewhere.json\r\n")});
    auto [status, res] = SchemaKit::HTTPClient::Fetch(server.url("/swagger.json"), 0);
    BOOST_TEST(status == 302u);
    BOOST_TEST(res[boost::beast::http::field::location] == "/elsewhere.json");
}

BOOST_AUTO_TEST_CASE(canned_server_reports_busy_port) {
    namespace asio = boost::asio;
    asio::io_context ioc;
    asio::ip::tcp::acceptor taken(ioc, {asio::ip::make_address("127.0.0.1"), 0});
    const auto port = taken.local_endpoint().port();
    BOOST_CHECK_THROW(CannedServer({http_response("200 OK", "")}, port), boost::system::system_error);
}

BOOST_AUTO_TEST_CASE(http_error_status_raises_document_error) {
    CannedServer server({http_response("404 Not Found", "missing")});
    BOOST_CHECK_THROW(SchemaKit::fetch_text(server.url("/nope.json")), DocumentError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Urls)

BOOST_AUTO_TEST_CASE(parse_url_defaults) {
    auto p = SchemaKit::HTTPClient::parseUrl("https://raw.example.com/k8s/swagger.json");
    BOOST_TEST(p.https);
    BOOST_TEST(p.host == "raw.example.com");
    BOOST_TEST(p.port == "443");
    BOOST_TEST(p.target == "/k8s/swagger.json");

    auto q = SchemaKit::HTTPClient::parseUrl("http://localhost:8080");
    BOOST_TEST(!q.https);
    BOOST_TEST(q.port == "8080");
    BOOST_TEST(q.target == "/");

    BOOST_CHECK_THROW(SchemaKit::HTTPClient::parseUrl("ftp://host/x"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(redirect_locations) {
    using SchemaKit::HTTPClient;
    BOOST_TEST(HTTPClient::resolveLocation("http://h:81/a/b.json", "/c.json") == "http://h:81/c.json");
    BOOST_TEST(HTTPClient::resolveLocation("http://h/a/b.json?x=1", "c.json") == "http://h:80/a/c.json");
    BOOST_TEST(HTTPClient::resolveLocation("http://h/a", "https://other/z") == "https://other/z");
    BOOST_TEST(HTTPClient::resolveLocation("https://h/a", "//cdn/z") == "https://cdn/z");
}

BOOST_AUTO_TEST_SUITE_END()

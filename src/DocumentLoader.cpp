#include "SchemaKit/DocumentLoader.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <regex>
#include <sstream>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "SchemaKit/Console.hpp"
#include "SchemaKit/Errors.hpp"
#include "SchemaKit/HTTPClient.hpp"
#include "SchemaKit/Naming.hpp"

namespace fs = std::filesystem;

namespace {

using SchemaKit::DocumentError;
using SchemaKit::Node;

constexpr std::string_view kFileScheme = "file://";

std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::in | std::ios::binary);
    if (!ifs) throw DocumentError("Failed to read input: " + p.string());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

bool looks_like_json(const std::string& text) {
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '{' || c == '[';
    }
    return false;
}

// Plain (unquoted) scalars are typed following the YAML 1.2 core schema.
Node plain_scalar(const std::string& v) {
    static const std::regex re_int(R"(^[-+]?[0-9]+$)");
    static const std::regex re_hex(R"(^0x[0-9a-fA-F]+$)");
    static const std::regex re_oct(R"(^0o[0-7]+$)");
    static const std::regex re_float(R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)");

    if (v == "true" || v == "True" || v == "TRUE") return true;
    if (v == "false" || v == "False" || v == "FALSE") return false;
    if (v.empty() || v == "~" || v == "null" || v == "Null" || v == "NULL") return nullptr;
    try {
        if (std::regex_match(v, re_int)) {
            if (v.front() == '-') return std::stoll(v);
            return static_cast<std::uint64_t>(std::stoull(v.front() == '+' ? v.substr(1) : v));
        }
        if (std::regex_match(v, re_hex)) return static_cast<std::uint64_t>(std::stoull(v.substr(2), nullptr, 16));
        if (std::regex_match(v, re_oct)) return static_cast<std::uint64_t>(std::stoull(v.substr(2), nullptr, 8));
        if (std::regex_match(v, re_float)) return std::stod(v);
    } catch (const std::out_of_range&) {
        // Too large for a JSON number type: keep the text
    }
    return v;
}

Node from_yaml(const YAML::Node& y) {
    switch (y.Type()) {
    case YAML::NodeType::Map: {
        Node out = Node::object();
        for (auto it = y.begin(); it != y.end(); ++it) {
            out[it->first.as<std::string>()] = from_yaml(it->second);
        }
        return out;
    }
    case YAML::NodeType::Sequence: {
        Node out = Node::array();
        for (const auto& item : y) {
            out.push_back(from_yaml(item));
        }
        return out;
    }
    case YAML::NodeType::Scalar:
        // Quoted scalars carry the "!" tag and are always strings
        if (y.Tag() == "!") return y.Scalar();
        return plain_scalar(y.Scalar());
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
        return nullptr;
    }
}

} // namespace

namespace SchemaKit {

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string fetch_text(const std::string& location) {
    if (HTTPClient::isHttpUrl(location)) {
        auto [status, res] = HTTPClient::Fetch(location);
        if (status < 200 || status >= 300) {
            throw DocumentError("HTTP " + std::to_string(status) + " fetching " + location);
        }
        return std::move(res.body());
    }
    if (location.rfind(kFileScheme.data(), 0) == 0) {
        return read_file(percent_decode(location.substr(kFileScheme.size())));
    }
    return read_file(location);
}

std::string canonical_location(const std::string& location) {
    if (HTTPClient::isHttpUrl(location) || location.rfind(kFileScheme.data(), 0) == 0) {
        return location;
    }
    std::error_code ec;
    if (!fs::is_regular_file(location, ec)) return location;
    auto real = fs::canonical(location, ec);
    if (ec) return location;
    return std::string(kFileScheme) + real.string();
}

Node parse_document(const std::string& text) {
    std::string json_error;
    if (looks_like_json(text)) {
        try {
            return Node::parse(text);
        } catch (const nlohmann::json::parse_error& ex) {
            // Flow-style YAML starts with '{' or '[' too
            json_error = ex.what();
        }
    }
    try {
        return from_yaml(YAML::Load(text));
    } catch (const YAML::Exception& ex) {
        if (!json_error.empty()) {
            throw DocumentError("Invalid JSON: " + json_error + "; invalid YAML: " + ex.what());
        }
        throw DocumentError(std::string("Invalid YAML: ") + ex.what());
    }
}

Node parse_document_file(const fs::path& path) {
    return parse_document(read_file(path));
}

std::string detect_version(const Node& tree) {
    if (!tree.is_object()) throw DocumentError("Document root is not a mapping");
    for (const char* field : {"swagger", "openapi"}) {
        auto it = tree.find(field);
        if (it == tree.end()) continue;
        if (it->is_string()) return it->get<std::string>();
        if (it->is_number()) return it->dump();
        throw DocumentError(std::string("Unsupported value for '") + field + "': " + it->dump());
    }
    throw DocumentError("Document has neither a 'swagger' nor an 'openapi' version field");
}

const Node& declared_types(const Node& tree, const std::string& version) {
    if (is_legacy_version(version)) {
        auto it = tree.find("definitions");
        if (it == tree.end() || !it->is_object()) {
            throw DocumentError("Swagger " + version + " document has no 'definitions' map");
        }
        return *it;
    }
    auto components = tree.find("components");
    if (components != tree.end() && components->is_object()) {
        auto schemas = components->find("schemas");
        if (schemas != components->end() && schemas->is_object()) return *schemas;
    }
    throw DocumentError("OpenAPI " + version + " document has no 'components.schemas' map");
}

Document load_document(const std::string& location) {
    Console::info("Downloading schema " + location);
    const auto text = fetch_text(location);

    Console::info("Parsing schema " + canonical_location(location));
    Document doc;
    doc.tree = parse_document(text);
    doc.version = detect_version(doc.tree);
    return doc;
}

} // namespace SchemaKit

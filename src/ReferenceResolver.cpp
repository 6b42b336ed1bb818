#include "SchemaKit/ReferenceResolver.hpp"

#include <regex>
#include <utility>

#include "SchemaKit/DocumentLoader.hpp"
#include "SchemaKit/Errors.hpp"
#include "SchemaKit/Transforms.hpp"

namespace fs = std::filesystem;

namespace {

using SchemaKit::Node;
using SchemaKit::ReferenceError;

constexpr const char* kFileScheme = "file://";

std::string document_key(const fs::path& p) {
    return p.lexically_normal().string();
}

bool has_scheme(const std::string& s) {
    static const std::regex re(R"(^[A-Za-z][A-Za-z0-9+.\-]*://.*)");
    return std::regex_match(s, re);
}

const Node& locate(const Node& root, const std::string& pointer, const std::string& ref) {
    if (pointer.empty()) return root;
    if (pointer.front() != '/') {
        throw ReferenceError("Unsupported fragment in reference '" + ref + "'");
    }
    try {
        return root.at(Node::json_pointer(pointer));
    } catch (const nlohmann::json::exception& ex) {
        throw ReferenceError("Unresolvable reference '" + ref + "': " + ex.what());
    }
}

} // namespace

namespace SchemaKit {

ReferenceResolver::ReferenceResolver(std::size_t max_depth)
    : max_depth_(max_depth) {}

void ReferenceResolver::add_document(const fs::path& location, Node document) {
    documents_[document_key(location)] = std::move(document);
}

void ReferenceResolver::clear() {
    documents_.clear();
    expanded_.clear();
    in_progress_.clear();
}

Node ReferenceResolver::dereference(const Node& node, const fs::path& base) {
    // Left over by a previous call that threw
    in_progress_.clear();
    Scope scope{fs::path{}, base, &node};
    return resolve_node(node, scope, 0);
}

Node ReferenceResolver::resolve_node(const Node& node, const Scope& scope, std::size_t depth) {
    if (node.is_object()) {
        auto ref = node.find("$ref");
        if (ref != node.end() && ref->is_string()) {
            return resolve_ref(ref->get<std::string>(), scope, depth);
        }
    }
    return transform_children(node, [&](const std::string*, const Node& child) {
        return resolve_node(child, scope, depth);
    });
}

Node ReferenceResolver::resolve_ref(const std::string& ref, const Scope& scope, std::size_t depth) {
    if (depth >= max_depth_) {
        throw ReferenceError("Reference nesting deeper than " + std::to_string(max_depth_) + " at '" + ref + "'");
    }

    const auto hash = ref.find('#');
    const std::string document_part = ref.substr(0, hash);
    const std::string pointer = hash == std::string::npos ? std::string{} : percent_decode(ref.substr(hash + 1));

    Scope target_scope = scope_for(document_part, scope);
    // References into the node being dereferenced are not cached across calls
    const bool cacheable = !target_scope.document.empty();
    const std::string id = (cacheable ? document_key(target_scope.document) : std::string{"<root>"}) + "#" + pointer;

    if (cacheable) {
        auto hit = expanded_.find(id);
        if (hit != expanded_.end()) return hit->second;
    }
    if (!in_progress_.insert(id).second) {
        throw CyclicReferenceError("Cyclic reference '" + ref + "'");
    }

    const Node& target = locate(*target_scope.root, pointer, ref);
    Node out = resolve_node(target, target_scope, depth + 1);

    in_progress_.erase(id);
    if (cacheable) expanded_.emplace(id, out);
    return out;
}

ReferenceResolver::Scope ReferenceResolver::scope_for(const std::string& document_part, const Scope& from) {
    if (document_part.empty()) return from;

    fs::path location;
    if (document_part.rfind(kFileScheme, 0) == 0) {
        location = percent_decode(document_part.substr(std::string(kFileScheme).size()));
    } else if (has_scheme(document_part)) {
        throw ReferenceError("External reference not supported: " + document_part);
    } else {
        location = percent_decode(document_part);
        if (location.is_relative()) location = from.directory / location;
    }
    location = location.lexically_normal();

    const Node& root = load(location);
    return Scope{location, location.parent_path(), &root};
}

const Node& ReferenceResolver::load(const fs::path& location) {
    const auto key = document_key(location);
    auto it = documents_.find(key);
    if (it != documents_.end()) return it->second;

    std::error_code ec;
    if (!fs::is_regular_file(location, ec)) {
        throw ReferenceError("Referenced document not found: " + location.string());
    }
    Node doc;
    try {
        doc = parse_document_file(location);
    } catch (const DocumentError& ex) {
        throw ReferenceError("Failed to load " + location.string() + ": " + ex.what());
    }
    return documents_.emplace(key, std::move(doc)).first->second;
}

} // namespace SchemaKit

#include "SchemaKit/Transforms.hpp"

#include <algorithm>
#include <cstdint>

#include "SchemaKit/Naming.hpp"

namespace {

using SchemaKit::Node;

constexpr const char* kComponentsSchemas = "#/components/schemas/";

bool declares_properties(const Node& node) {
    if (!node.is_object()) return false;
    auto it = node.find("properties");
    return it != node.end() && it->is_object();
}

bool is_int_or_string(const Node& node) {
    if (!node.is_object()) return false;
    auto it = node.find("format");
    return it != node.end() && it->is_string() && it->get_ref<const std::string&>() == "int-or-string";
}

bool is_required(const Node* grandparent, const std::string* key) {
    if (!grandparent || !key || !grandparent->is_object()) return false;
    auto it = grandparent->find("required");
    if (it == grandparent->end() || !it->is_array()) return false;
    return std::any_of(it->begin(), it->end(), [&](const Node& name){
        return name.is_string() && name.get_ref<const std::string&>() == *key;
    });
}

bool is_nullable_type(const Node& value) {
    if (!value.is_string()) return false;
    const auto& s = value.get_ref<const std::string&>();
    return s == "array" || s == "string";
}

} // namespace

namespace SchemaKit {

Node rewrite_refs(const Node& node, const std::string& prefix, const std::string& version) {
    return transform_children(node, [&](const std::string* key, const Node& child) -> Node {
        if (key && *key == "$ref" && child.is_string()) {
            const auto& ref = child.get_ref<const std::string&>();
            if (is_legacy_version(version)) {
                return prefix + ref;
            }
            return replace_all(ref, kComponentsSchemas, "") + ".json";
        }
        return rewrite_refs(child, prefix, version);
    });
}

Node add_additional_properties(const Node& node) {
    return transform_children(node, [](const std::string*, const Node& child) -> Node {
        Node out = add_additional_properties(child);
        if (declares_properties(child) && !child.contains("additionalProperties")) {
            out["additionalProperties"] = false;
        }
        return out;
    });
}

Node int_or_string_schema() {
    return Node{{"oneOf", Node::array({Node{{"type", "string"}}, Node{{"type", "integer"}}})}};
}

Node replace_int_or_string(const Node& node) {
    if (is_int_or_string(node)) return int_or_string_schema();
    return transform_children(node, [](const std::string*, const Node& child) {
        return replace_int_or_string(child);
    });
}

Node allow_null_optional_fields(const Node& node,
                                const Node* parent,
                                const Node* grandparent,
                                const std::string* key) {
    if (!node.is_object()) return node;
    return transform_children(node, [&](const std::string* k, const Node& child) -> Node {
        switch (child.type()) {
        case Node::value_t::object:
            return allow_null_optional_fields(child, &node, parent, k);
        case Node::value_t::array:
            return transform_children(child, [&](const std::string*, const Node& element) {
                return allow_null_optional_fields(element, &node, parent, k);
            });
        case Node::value_t::string:
            if (*k == "type" && is_nullable_type(child) && !is_required(grandparent, key)) {
                return Node::array({child, "null"});
            }
            return child;
        default:
            return child;
        }
    });
}

bool is_truthy(const Node& node) {
    switch (node.type()) {
    case Node::value_t::null:
        return false;
    case Node::value_t::boolean:
        return node.get<bool>();
    case Node::value_t::number_integer:
        return node.get<std::int64_t>() != 0;
    case Node::value_t::number_unsigned:
        return node.get<std::uint64_t>() != 0;
    case Node::value_t::number_float:
        return node.get<double>() != 0.0;
    case Node::value_t::string:
        return !node.get_ref<const std::string&>().empty();
    case Node::value_t::array:
    case Node::value_t::object:
        return !node.empty();
    default:
        return true;
    }
}

} // namespace SchemaKit

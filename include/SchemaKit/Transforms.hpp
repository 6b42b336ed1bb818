#pragma once

/**
 * \file Transforms.hpp
 * \brief Recursive rewriting passes over OpenAPI schema trees.
 *
 * Every pass takes a const tree and returns a freshly built one; the input is
 * never modified, so passes compose freely. All of them are built on
 * transform_children(), which rebuilds one level of a container and leaves
 * scalars alone. A pass given a node of a shape it does not act on (a scalar
 * where it expects a mapping, for instance) returns that node unchanged.
 */

#include <string>
#include <utility>

#include "SchemaKit/Node.hpp"

namespace SchemaKit {

/**
 * \brief Rebuild one level of a container node.
 *
 * `fn(key, child)` is called for every child and returns its replacement.
 * `key` points at the mapping key, or is nullptr for sequence elements.
 * Mappings keep their key order. Scalars and null are returned as-is.
 */
template <typename Fn>
Node transform_children(const Node& node, Fn&& fn) {
    switch (node.type()) {
    case Node::value_t::object: {
        Node out = Node::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            out[it.key()] = fn(&it.key(), it.value());
        }
        return out;
    }
    case Node::value_t::array: {
        Node out = Node::array();
        for (const auto& child : node) {
            out.push_back(fn(static_cast<const std::string*>(nullptr), child));
        }
        return out;
    }
    default:
        return node;
    }
}

/**
 * \brief Rewrite every string "$ref" for the emitted file layout.
 *
 * For legacy (Swagger 2) documents the prefix is prepended
 * ("#/definitions/X" -> "_definitions.json#/definitions/X"). For OpenAPI 3
 * the "#/components/schemas/" part is removed and ".json" appended
 * ("#/components/schemas/X" -> "X.json").
 */
Node rewrite_refs(const Node& node, const std::string& prefix, const std::string& version);

/**
 * \brief Add "additionalProperties": false to every object schema below `node`.
 *
 * A mapping qualifies when it has a mapping-valued "properties" and no
 * "additionalProperties" of its own. `node` itself is treated as a container
 * (a definitions or properties map) and only its descendants are inspected.
 * Applying the pass twice gives the same tree as applying it once.
 */
Node add_additional_properties(const Node& node);

/// Replace every {"format": "int-or-string"} schema with a string/integer oneOf.
Node replace_int_or_string(const Node& node);

/// The schema int-or-string fields are rewritten into.
Node int_or_string_schema();

/**
 * \brief Allow null on optional "array" and "string" typed fields.
 *
 * `node` sits under `key` in `parent`, which itself sits in `grandparent`.
 * A "type": "array"/"string" entry of `node` becomes [type, "null"] unless
 * `key` is listed in grandparent["required"]. Any context may be nullptr.
 */
Node allow_null_optional_fields(const Node& node,
                                const Node* parent = nullptr,
                                const Node* grandparent = nullptr,
                                const std::string* key = nullptr);

/// Python-style truthiness: false for null, false, 0, "", [] and {}.
bool is_truthy(const Node& node);

} // namespace SchemaKit

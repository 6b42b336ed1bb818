#pragma once

/**
 * \file ReferenceResolver.hpp
 * \brief Inline JSON references to produce self-contained schemas.
 *
 * A "$ref" is "<document>#<json pointer>". The document part is resolved
 * against the directory of the document holding the reference; an empty
 * document part means that same document. Documents are read from disk once
 * and cached, or registered up front with add_document(). Remote (http,
 * https, ...) references are rejected.
 *
 * A mapping with a string "$ref" is replaced as a whole by its dereferenced
 * target; sibling keys are dropped. Reference graphs may be shared (the same
 * target is expanded once and copied) but not cyclic: a cycle raises
 * CyclicReferenceError instead of recursing forever.
 */

#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>

#include "SchemaKit/Node.hpp"

namespace SchemaKit {

class ReferenceResolver {
public:
    /// Default bound on nested reference expansion.
    static constexpr std::size_t kDefaultMaxDepth = 256;

    explicit ReferenceResolver(std::size_t max_depth = kDefaultMaxDepth);

    /// Serve `document` for references to `location` instead of reading the file.
    void add_document(const std::filesystem::path& location, Node document);

    /// Drop cached documents and expansions (registered documents included).
    void clear();

    /**
     * Return `node` with every reference inlined. Relative references in
     * `node` are resolved against the directory `base`.
     * Throws ReferenceError / CyclicReferenceError.
     */
    Node dereference(const Node& node, const std::filesystem::path& base);

private:
    struct Scope {
        std::filesystem::path document;   ///< Empty for the node being dereferenced.
        std::filesystem::path directory;  ///< Base for relative document parts.
        const Node* root;                 ///< Target of "#..." references.
    };

    Node resolve_node(const Node& node, const Scope& scope, std::size_t depth);
    Node resolve_ref(const std::string& ref, const Scope& scope, std::size_t depth);
    Scope scope_for(const std::string& document_part, const Scope& from);
    const Node& load(const std::filesystem::path& location);

    std::size_t max_depth_;
    std::map<std::string, Node> documents_;
    std::map<std::string, Node> expanded_;
    std::set<std::string> in_progress_;
};

} // namespace SchemaKit

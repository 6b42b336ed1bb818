#pragma once

/**
 * \file DocumentLoader.hpp
 * \brief Fetch an OpenAPI document and read it into a SchemaKit::Node tree.
 *
 * Locations may be local paths, file:// URLs or http(s):// URLs. Content is
 * JSON or YAML; since JSON is YAML the two are told apart only to pick the
 * faster parser.
 */

#include <filesystem>
#include <string>

#include "SchemaKit/Node.hpp"

namespace SchemaKit {

/// A parsed OpenAPI document and its "swagger"/"openapi" version string.
struct Document {
    Node tree;
    std::string version;
};

/// Decode %XX escapes in a URI component.
std::string percent_decode(const std::string& s);

/// Read the raw text behind a location. Throws DocumentError on failure.
std::string fetch_text(const std::string& location);

/// "file://<absolute path>" for existing local files, other locations unchanged.
std::string canonical_location(const std::string& location);

/// Parse JSON or YAML text. Throws DocumentError on syntax errors.
Node parse_document(const std::string& text);

/// Read and parse a file on disk.
Node parse_document_file(const std::filesystem::path& path);

/**
 * The value of the top-level "swagger" key, else of "openapi". Numbers are
 * returned in their textual form. Throws DocumentError when neither exists.
 */
std::string detect_version(const Node& tree);

/**
 * The map of declared types: "definitions" for legacy documents,
 * "components"/"schemas" otherwise. Throws DocumentError when absent.
 */
const Node& declared_types(const Node& tree, const std::string& version);

/// fetch_text + parse_document + detect_version, reporting each stage on the console.
Document load_document(const std::string& location);

} // namespace SchemaKit

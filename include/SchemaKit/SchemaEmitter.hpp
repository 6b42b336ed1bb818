#pragma once

/**
 * \file SchemaEmitter.hpp
 * \brief Writes one JSON schema file per declared OpenAPI type.
 *
 * For every entry of "definitions" (Swagger 2) or "components.schemas"
 * (OpenAPI 3) the emitter writes either a small stub pointing into the shared
 * _definitions.json file, or, in stand-alone mode, the fully dereferenced
 * schema. It also writes all.json, a oneOf over every emitted type.
 *
 * A failure while handling one type is logged and the run moves on to the
 * next type; only problems with the document as a whole or with the output
 * directory are thrown to the caller.
 */

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "SchemaKit/DocumentLoader.hpp"
#include "SchemaKit/Naming.hpp"
#include "SchemaKit/Node.hpp"
#include "SchemaKit/Options.hpp"
#include "SchemaKit/ReferenceResolver.hpp"

namespace SchemaKit {

/// Outcome counts of one SchemaEmitter::run().
struct EmitSummary {
    std::size_t written{0};
    std::size_t skipped{0};
    std::vector<std::string> failed;   ///< Kinds that could not be emitted.
};

class SchemaEmitter {
public:
    explicit SchemaEmitter(Options options);

    /// Emit every declared type of `document` into the configured output directory.
    EmitSummary run(const Document& document);

    /// The shared definitions map as written to _definitions.json.
    Node shared_definitions(const Node& definitions) const;

    /// Serialize with 2-space indentation, non-ASCII characters escaped.
    static void write_json(const std::filesystem::path& path, const Node& value);

private:
    Node build_schema(const std::string& title,
                      const GroupVersionKind& gvk,
                      const Node& declared,
                      const std::string& version);

    Node union_entry(const std::string& title,
                     const GroupVersionKind& gvk,
                     const std::string& version) const;

    void register_components(const Node& components, const std::string& version);

    std::filesystem::path base_directory() const;

    Options options_;
    ReferenceResolver resolver_;
};

} // namespace SchemaKit

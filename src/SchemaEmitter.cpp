#include "SchemaKit/SchemaEmitter.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

#include "SchemaKit/Console.hpp"
#include "SchemaKit/Errors.hpp"
#include "SchemaKit/Transforms.hpp"

namespace fs = std::filesystem;

namespace {

using SchemaKit::Node;

constexpr const char* kIntOrStringTitle = "io.k8s.apimachinery.pkg.util.intstr.IntOrString";
constexpr const char* kQuantityTitle = "io.k8s.apimachinery.pkg.api.resource.Quantity";
constexpr const char* kComponentsSchemas = "#/components/schemas/";

} // namespace

namespace SchemaKit {

SchemaEmitter::SchemaEmitter(Options options)
    : options_(std::move(options)) {}

void SchemaEmitter::write_json(const fs::path& path, const Node& value) {
    std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::error_code ec(errno, std::generic_category());
        throw std::system_error(ec, "Failed to open file for write: " + path.string());
    }
    ofs << value.dump(2, ' ', true);
    if (!ofs) {
        std::error_code ec(errno, std::generic_category());
        throw std::system_error(ec, "Failed to write file: " + path.string());
    }
}

fs::path SchemaEmitter::base_directory() const {
    return fs::absolute(options_.output).lexically_normal();
}

Node SchemaEmitter::shared_definitions(const Node& definitions) const {
    Node shared = definitions;
    if (options_.kubernetes) {
        shared[kIntOrStringTitle] = int_or_string_schema();
        shared[kQuantityTitle] = int_or_string_schema();
    }
    if (options_.strict) {
        shared = add_additional_properties(shared);
    }
    return shared;
}

void SchemaEmitter::register_components(const Node& components, const std::string& version) {
    const auto base = base_directory();
    for (auto it = components.begin(); it != components.end(); ++it) {
        const auto file = replace_all(it.key(), kComponentsSchemas, "") + ".json";
        resolver_.add_document(base / file, rewrite_refs(it.value(), options_.prefix, version));
    }
}

Node SchemaEmitter::build_schema(const std::string& title,
                                 const GroupVersionKind& gvk,
                                 const Node& declared,
                                 const std::string& version) {
    if (!declared.is_object()) {
        throw DocumentError("Schema for " + title + " is not a mapping");
    }
    Node specification = declared;
    specification["$schema"] = kSchemaDialect;
    if (!specification.contains("type")) specification["type"] = "object";

    specification = rewrite_refs(specification, options_.prefix, version);

    if (options_.kubernetes && options_.stand_alone && is_unsupported_kubernetes_kind(gvk.kind)) {
        throw UnsupportedError(gvk.kind + " not currently supported");
    }

    if (!options_.stand_alone) {
        auto description = specification.find("description");
        return Node{
            {"$schema", specification["$schema"]},
            {"$ref", std::string(kDefinitionsFile) + "#/definitions/" + title},
            {"description", description != specification.end() ? *description : Node(nullptr)},
            {"type", specification["type"]},
        };
    }

    specification = resolver_.dereference(specification, base_directory());

    auto additional = specification.find("additionalProperties");
    if (additional != specification.end() && is_truthy(*additional)) {
        *additional = rewrite_refs(*additional, options_.prefix, version);
    }

    auto properties = specification.find("properties");
    if (properties != specification.end()) {
        if (options_.strict) {
            *properties = add_additional_properties(*properties);
            // The type itself is closed too, as it is in _definitions.json
            if (properties->is_object() && !specification.contains("additionalProperties")) {
                specification["additionalProperties"] = false;
                properties = specification.find("properties");
            }
        }
        if (options_.kubernetes) {
            const Node owner = specification;
            *properties = allow_null_optional_fields(replace_int_or_string(*properties), &owner);
        }
    }
    return specification;
}

Node SchemaEmitter::union_entry(const std::string& title,
                                const GroupVersionKind& gvk,
                                const std::string& version) const {
    if (!is_legacy_version(version)) {
        return Node{{"$ref", replace_all(title, kComponentsSchemas, "") + ".json"}};
    }
    if (options_.stand_alone) {
        return Node{{"$ref", replace_all(options_.prefix, kDefinitionsFile, output_filename(gvk)) + "#/" + title}};
    }
    return Node{{"$ref", options_.prefix + "#/definitions/" + title}};
}

EmitSummary SchemaEmitter::run(const Document& document) {
    EmitSummary summary;
    resolver_.clear();

    fs::create_directories(options_.output);

    const bool legacy = is_legacy_version(document.version);
    const Node& components = declared_types(document.tree, document.version);
    const fs::path definitions_path = options_.output / kDefinitionsFile;

    if (legacy) {
        Console::info("Generating shared definitions");
        write_json(definitions_path, Node{{"definitions", shared_definitions(components)}});
    } else if (options_.stand_alone) {
        register_components(components, document.version);
    }

    Console::info("Generating individual schemas");
    Node all{{"oneOf", Node::array()}};

    for (auto it = components.begin(); it != components.end(); ++it) {
        const std::string& title = it.key();
        auto gvk = group_version_kind(title);
        if (!gvk || is_skipped_title(title)) {
            ++summary.skipped;
            continue;
        }

        try {
            Console::debug("Processing " + gvk->kind + ", " + gvk->version);

            Node schema = build_schema(title, *gvk, it.value(), document.version);

            const auto file_name = output_filename(*gvk);
            Console::debug("Generating " + file_name);
            write_json(options_.output / file_name, schema);

            all["oneOf"].push_back(union_entry(title, *gvk, document.version));
            ++summary.written;
        } catch (const std::exception& ex) {
            Console::error("An error occured processing " + gvk->kind + ": " + ex.what());
            summary.failed.push_back(gvk->kind);
        }
    }

    Console::info("Generating schema for all types");
    write_json(options_.output / kAllTypesFile, all);

    if (options_.stand_alone && legacy) {
        // Only needed while dereferencing
        fs::remove(definitions_path);
    }
    return summary;
}

} // namespace SchemaKit

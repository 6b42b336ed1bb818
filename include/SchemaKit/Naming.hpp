#pragma once

#include <optional>
#include <string>

namespace SchemaKit {

/// The last three dot-separated segments of a declared type title.
struct GroupVersionKind {
    std::string group;
    std::string version;
    std::string kind;
};

/// Name of the shared definitions file written next to the per-type schemas.
inline constexpr const char* kDefinitionsFile = "_definitions.json";
/// Name of the aggregate union schema.
inline constexpr const char* kAllTypesFile = "all.json";
/// Value written to "$schema" on every emitted type.
inline constexpr const char* kSchemaDialect = "http://json-schema.org/schema#";

/**
 * Split a title such as "io.k8s.api.apps.v1.Deployment" into
 * group/version/kind ("apps", "v1", "Deployment"). Returns std::nullopt when
 * the title has fewer than three segments.
 */
std::optional<GroupVersionKind> group_version_kind(const std::string& title);

/// True for titles that never produce an output file.
bool is_skipped_title(const std::string& title);

/// "<kind>-<version>.json" for the core group, "<kind>-<group>-<version>.json" otherwise.
std::string output_filename(const GroupVersionKind& gvk);

/**
 * True for Swagger 2.x style documents. The comparison is lexical on the raw
 * version string ("2.0" < "3", "3.0.0" is not), and stays that way.
 */
bool is_legacy_version(const std::string& version);

/// Kubernetes kinds embedding JSON schema themselves; refused in stand-alone mode.
bool is_unsupported_kubernetes_kind(const std::string& kind);

/// Replace every occurrence of `from` in `s` with `to`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

} // namespace SchemaKit

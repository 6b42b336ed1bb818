#pragma once

#include <filesystem>
#include <string>

namespace SchemaKit {

/// Run configuration, filled from the command line and passed explicitly.
struct Options {
    std::string schema_url;                         ///< Local path, file:// or http(s):// URL.
    std::filesystem::path output{"schemas"};        ///< Output directory, created if absent.
    std::string prefix{"_definitions.json"};        ///< $ref prefix for OpenAPI < 3.
    bool stand_alone{false};                        ///< Inline every reference.
    bool kubernetes{false};                         ///< Enable Kubernetes specific processors.
    bool strict{false};                             ///< additionalProperties: false everywhere.
};

} // namespace SchemaKit

#include "SchemaKit/Naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace {

// Internal Kubernetes packages duplicate the public API types.
constexpr const char* kInternalPackagePrefix = "io.k8s.kubernetes.pkg.apis";

const std::array<const char*, 9> kKindsWithJsonSchema = {
    "jsonschemaprops",
    "jsonschemapropsorarray",
    "customresourcevalidation",
    "customresourcedefinition",
    "customresourcedefinitionspec",
    "customresourcedefinitionlist",
    "customresourcedefinitionversion",
    "jsonschemapropsorstringarray",
    "jsonschemapropsorbool",
};

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

} // namespace

namespace SchemaKit {

std::optional<GroupVersionKind> group_version_kind(const std::string& title) {
    auto parts = split(title, '.');
    if (parts.size() < 3) return std::nullopt;
    const auto n = parts.size();
    return GroupVersionKind{parts[n - 3], parts[n - 2], parts[n - 1]};
}

bool is_skipped_title(const std::string& title) {
    if (title.rfind(kInternalPackagePrefix, 0) == 0) return true;
    auto gvk = group_version_kind(title);
    if (!gvk) return true;
    return to_lower(gvk->group) == "api";
}

std::string output_filename(const GroupVersionKind& gvk) {
    if (to_lower(gvk.group) == "core") {
        return gvk.kind + "-" + gvk.version + ".json";
    }
    return gvk.kind + "-" + gvk.group + "-" + gvk.version + ".json";
}

bool is_legacy_version(const std::string& version) {
    return version < std::string("3");
}

bool is_unsupported_kubernetes_kind(const std::string& kind) {
    const auto lowered = to_lower(kind);
    return std::any_of(kKindsWithJsonSchema.begin(), kKindsWithJsonSchema.end(),
                       [&](const char* k){ return lowered == k; });
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace SchemaKit

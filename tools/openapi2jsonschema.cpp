#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "SchemaKit/Console.hpp"
#include "SchemaKit/DocumentLoader.hpp"
#include "SchemaKit/Options.hpp"
#include "SchemaKit/SchemaEmitter.hpp"

namespace {

using SchemaKit::Console;
using SchemaKit::Options;

enum class ParseStatus { Ok, Help, Error };

struct ParsedArgs {
    ParseStatus status{ParseStatus::Error};
    Options options;
};

ParsedArgs parse_args(int argc, char** argv) {
    ParsedArgs out;
    Options& o = out.options;
    bool have_url = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        std::optional<std::string_view> inline_value;
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }
        auto value = [&]() -> std::optional<std::string> {
            if (inline_value) return std::string(*inline_value);
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--output" || arg == "-o") {
            auto v = value(); if (!v || v->empty()) return out; o.output = *v;
        } else if (arg == "--prefix" || arg == "-p") {
            auto v = value(); if (!v) return out; o.prefix = *v;
        } else if (inline_value) {
            std::cerr << "Option does not take a value: " << arg << "\n";
            return out;
        } else if (arg == "--stand-alone") {
            o.stand_alone = true;
        } else if (arg == "--kubernetes") {
            o.kubernetes = true;
        } else if (arg == "--strict") {
            o.strict = true;
        } else if (arg == "--help" || arg == "-h") {
            out.status = ParseStatus::Help;
            return out;
        } else if (!arg.empty() && arg.front() == '-' && arg != "-") {
            std::cerr << "Unknown argument: " << arg << "\n";
            return out;
        } else if (!have_url) {
            o.schema_url = std::string(arg);
            have_url = true;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return out;
        }
    }
    if (!have_url) return out;
    out.status = ParseStatus::Ok;
    return out;
}

void print_usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [OPTIONS] SCHEMA_URL\n";
    os << "\n  Converts a valid OpenAPI specification into a set of JSON Schema files\n";
    os << "\nOptions:\n";
    os << "  -o, --output PATH    Directory to store schema files (default: schemas)\n";
    os << "  -p, --prefix TEXT    Prefix for JSON references (only for OpenAPI versions\n";
    os << "                       before 3.0, default: _definitions.json)\n";
    os << "  --stand-alone        Whether or not to de-reference JSON schemas\n";
    os << "  --kubernetes         Enable Kubernetes specific processors\n";
    os << "  --strict             Prohibits properties not in the schema\n";
    os << "                       (additionalProperties: false)\n";
    os << "  -h, --help           Show this message and exit\n";
    os << "\nSCHEMA_URL is a local file, a file:// URL or an http(s):// URL.\n";
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_args(argc, argv);
    if (parsed.status == ParseStatus::Help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    if (parsed.status != ParseStatus::Ok) {
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    const Options& options = parsed.options;

    try {
        const auto document = SchemaKit::load_document(options.schema_url);

        SchemaKit::SchemaEmitter emitter(options);
        auto summary = emitter.run(document);

        Console::info("Wrote " + std::to_string(summary.written) + " schemas to " + options.output.string() +
                      " (" + std::to_string(summary.skipped) + " skipped, " +
                      std::to_string(summary.failed.size()) + " failed)");
    } catch (const std::exception& ex) {
        Console::error("Conversion failed: " + std::string(ex.what()));
        return 2;
    }
    return 0;
}

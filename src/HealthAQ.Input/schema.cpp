#include "schema.h"

#include "HealthAQ.Core/exception.h"
#include "HealthAQ/program_dirs.h"

#include <fmt/color.h>
#include <fmt/format.h>
#include <jsoncons/json.hpp>
#include <jsoncons_ext/jsonschema/jsonschema.hpp>

#include <fstream>
#include <sstream>
#include <string_view>

namespace {

constexpr std::string_view PublishedSchemaRoot = "https://healthaq.github.io/schemas/";

std::filesystem::path installed_schema(const std::string &schema_file_name, int schema_version) {
    return haq::get_schema_root() / fmt::format("v{}", schema_version) / schema_file_name;
}

jsoncons::json read_schema(const std::filesystem::path &schema_path) {
    auto stream = std::ifstream{schema_path};
    if (!stream) {
        throw haq::core::HaqException{
            fmt::format("JSON schema not installed: {}", schema_path.string())};
    }

    return jsoncons::json::parse(stream);
}

/// @brief Maps a published schema reference onto the installed copy
jsoncons::json resolve_reference(const jsoncons::uri &reference) {
    const auto &url = reference.string();
    if (!url.starts_with(PublishedSchemaRoot)) {
        throw haq::core::HaqException{fmt::format("Schema reference outside HealthAQ: {}", url)};
    }

    return read_schema(haq::get_schema_root() / url.substr(PublishedSchemaRoot.size()));
}

void check_schema_property(const nlohmann::json &document, const std::filesystem::path &file_path,
                           const std::string &expected_url, bool required) {
    auto it = document.find("$schema");
    if (it == document.end()) {
        auto message = fmt::format("{} has no $schema property", file_path.string());
        if (required) {
            throw haq::core::HaqException{message};
        }

        fmt::print(fmt::fg(fmt::color::dark_salmon), "{}, expected {}\n", message, expected_url);
        return;
    }

    auto declared = it->get<std::string>();
    if (declared != expected_url) {
        throw haq::core::HaqException{fmt::format("{} declares schema {}, this version reads {}",
                                                  file_path.string(), declared, expected_url)};
    }
}

} // anonymous namespace

namespace haq::input {

std::string schema_url(const std::string &schema_file_name, int schema_version) {
    return fmt::format("{}v{}/{}", PublishedSchemaRoot, schema_version, schema_file_name);
}

void validate_json(std::istream &is, const std::string &schema_file_name, int schema_version) {
    const auto document = jsoncons::json::parse(is);
    const auto schema = jsoncons::jsonschema::make_json_schema(
        read_schema(installed_schema(schema_file_name, schema_version)),
        [](const auto &reference) { return resolve_reference(reference); });

    try {
        schema.validate(document);
    } catch (const jsoncons::jsonschema::validation_error &ex) {
        throw core::HaqException{
            fmt::format("Document does not conform to {}: {}",
                        schema_url(schema_file_name, schema_version), ex.what())};
    }
}

nlohmann::json load_and_validate_json(const std::filesystem::path &file_path,
                                      const std::string &schema_file_name, int schema_version,
                                      bool require_schema_property) {
    auto stream = std::ifstream{file_path};
    if (!stream) {
        throw core::HaqException{fmt::format("JSON file not found: {}", file_path.string())};
    }

    auto document = nlohmann::json::parse(stream);
    check_schema_property(document, file_path, schema_url(schema_file_name, schema_version),
                          require_schema_property);

    // The validator reads its own document model
    auto text = std::istringstream{document.dump()};
    validate_json(text, schema_file_name, schema_version);
    return document;
}

} // namespace haq::input

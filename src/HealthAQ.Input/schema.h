#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <istream>
#include <string>

namespace haq::input {

/// @brief Gets the published URL of a HealthAQ schema, the expected `$schema` value
/// @param schema_file_name The schema file name, e.g. config.json
/// @param schema_version The schema version folder, v1 for 1
/// @return The schema URL
std::string schema_url(const std::string &schema_file_name, int schema_version);

/// @brief Checks a JSON document against a HealthAQ schema installed with the program
///
/// References to other HealthAQ schemas are read from the same installation.
/// @throws haq::core::HaqException for a missing schema or a document that does not conform.
void validate_json(std::istream &is, const std::string &schema_file_name, int schema_version);

/// @brief Reads a JSON file, checks its `$schema` property and validates its content
/// @param file_path The file to read
/// @param schema_file_name The schema file name
/// @param schema_version The schema version
/// @param require_schema_property Fail on a missing `$schema` instead of warning
/// @return The parsed document
nlohmann::json load_and_validate_json(const std::filesystem::path &file_path,
                                      const std::string &schema_file_name, int schema_version,
                                      bool require_schema_property = true);

} // namespace haq::input

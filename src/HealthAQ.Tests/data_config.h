#pragma once

#include <string>

/// @brief The data store path given on the command line, if any
extern std::string test_datastore_path;

/// @brief Finds a relative path in the working directory or any of its parents
/// @throws std::runtime_error if the path is not found.
std::string resolve_path(const std::string &relative_path);

/// @brief Gets the sample data store path
std::string default_datastore_path();

/// @brief Gets the sample configuration file path
std::string default_config_path();

/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the main functions required to load the JSON-formatted
 * configuration file and the reference data it points to from disk.
 */
#pragma once

#include "datamanager.h"
#include "poco.h"
#include "version.h"

#include "HealthAQ.Core/api.h"
#include "HealthAQ/executive_analytics.h"
#include "HealthAQ/reference_data.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>

namespace haq::input {

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The root path for configuration files
    std::filesystem::path root_path;

    /// @brief Reference data store folder, containing index.json
    std::filesystem::path data_source;

    /// @brief Reference year for relative year phrases
    int current_year{};

    /// @brief Optional age stratified baseline deaths file
    std::optional<std::filesystem::path> extended_detail;

    /// @brief Executive analytics defaults
    AnalysisInfo analysis;

    /// @brief Application logging verbosity mode
    haq::core::VerboseMode verbosity{};

    /// @brief Application name
    const char *app_name = PROJECT_NAME;

    /// @brief Application version
    const char *app_version = PROJECT_VERSION;
};

/// @brief Represents an error that occurred with the format of a config file
class ConfigurationError : public std::runtime_error {
  public:
    ConfigurationError(const std::string &msg);
};

/// @brief Loads the input configuration file, *.json, information
/// @param config_file Path to config file
/// @param verbose Set log verbosity
/// @return The configuration file information
/// @throws ConfigurationError for missing or invalid configuration entries.
Configuration get_configuration(const std::filesystem::path &config_file, bool verbose);

/// @brief Creates the executive analytics defaults from the configuration
/// @param config User configuration file instance
/// @return The analytics defaults
/// @throws ConfigurationError for an invalid analysis window.
haq::AnalyticsOptions create_analytics_options(const Configuration &config);

/// @brief Loads the immutable reference data from the configured data store
/// @param data_api The back-end data store instance to be used
/// @param config User configuration file instance
/// @return The reference data instance
std::unique_ptr<haq::ReferenceData> load_reference_data(const DataManager &data_api,
                                                        const Configuration &config);

} // namespace haq::input

/**
 * @file
 * @brief Functionality for parsing console application's command-line arguments
 */
#pragma once

#include <cxxopts.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace haq {
/// @brief Defines the Command Line Interface (CLI) arguments options
struct CommandOptions {
    /// @brief The configuration file
    std::filesystem::path config_file;

    /// @brief The reference data store folder, overrides the configuration
    std::optional<std::filesystem::path> storage_folder;

    /// @brief The reference year, overrides the configuration
    std::optional<int> current_year;

    /// @brief A single message to answer
    std::optional<std::string> query;

    /// @brief Country of the --predict or --health actions
    std::optional<std::string> predict_country;
    std::optional<std::string> health_country;

    /// @brief Target year of the --predict or --health actions
    std::optional<int> target_year;

    /// @brief Whether to print the known countries
    bool list_countries{};

    /// @brief Whether to print the service status
    bool status{};

    /// @brief Indicates whether the application logging is verbose
    bool verbose{};

    /// @brief The maximum number of threads to use (0: no limit).
    size_t num_threads{};
};

/// @brief Creates the command-line interface (CLI) options
/// @return HealthAQ CLI options
cxxopts::Options create_options();

/// @brief Parses the command-line interface (CLI) arguments
/// @param options The valid CLI options
/// @param argc Number of input arguments
/// @param argv List of input arguments
/// @return User command-line options or std::nullopt if program should exit
std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv);

} // namespace haq

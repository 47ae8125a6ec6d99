#include "command_options.h"
#include "version.h"

#include <fmt/color.h>

#include <iostream>

namespace haq {

cxxopts::Options create_options() {
    cxxopts::Options options("HealthAQ.Console",
                             "HealthAQ PM2.5 exposure and health burden analytics.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("s,storage", "Path to root folder of the data storage.", cxxopts::value<std::string>())
        ("y,year", "Reference year for relative year phrases.", cxxopts::value<int>())
        ("q,query", "Answer a single question and exit.", cxxopts::value<std::string>())
        ("predict", "Print the PM2.5 forecast of a country.", cxxopts::value<std::string>())
        ("health", "Print the health burden of a country.", cxxopts::value<std::string>())
        ("t,target", "Target year of the --predict and --health actions.",
            cxxopts::value<int>())
        ("countries", "Print the known countries.")
        ("status", "Print the reference data status.")
        ("T,threads", "The maximum number of threads to create (0: no limit, default).",
            cxxopts::value<size_t>())
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}\n\n", PROJECT_VERSION);
        return std::nullopt;
    }

    cmd.verbose = result["verbose"].as<bool>();
    if (cmd.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (!result.count("config")) {
        throw std::runtime_error("The -c/--config option is required.");
    }

    cmd.config_file = result["config"].as<std::string>();
    if (cmd.verbose) {
        fmt::print("Configuration file: {}\n", cmd.config_file.string());
    }

    if (result.count("storage")) {
        cmd.storage_folder = result["storage"].as<std::string>();
    }

    if (result.count("year")) {
        cmd.current_year = result["year"].as<int>();
    }

    if (result.count("query")) {
        cmd.query = result["query"].as<std::string>();
    }

    if (result.count("predict")) {
        cmd.predict_country = result["predict"].as<std::string>();
    }

    if (result.count("health")) {
        cmd.health_country = result["health"].as<std::string>();
    }

    if (result.count("target")) {
        cmd.target_year = result["target"].as<int>();
    }

    cmd.list_countries = result.count("countries") > 0;
    cmd.status = result.count("status") > 0;

    if (result.count("threads")) {
        cmd.num_threads = result["threads"].as<size_t>();
    }

    return cmd;
}
} // namespace haq

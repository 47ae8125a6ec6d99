#include "configuration.h"
#include "jsonparser.h"
#include "schema.h"

#include "HealthAQ.Core/scoped_timer.h"

#include <fmt/color.h>

#include <utility>

namespace {
constexpr const char *ConfigSchemaFileName = "config.json";
constexpr int ConfigSchemaVersion = 1;

std::filesystem::path resolve_path(const std::filesystem::path &path,
                                   const std::filesystem::path &root_path) {
    if (path.is_absolute()) {
        return path.lexically_normal();
    }

    return (root_path / path).lexically_normal();
}
} // anonymous namespace

namespace haq::input {
using json = nlohmann::json;

ConfigurationError::ConfigurationError(const std::string &msg) : std::runtime_error{msg} {}

Configuration get_configuration(const std::filesystem::path &config_file, bool verbose) {
    MEASURE_FUNCTION();
    bool success = true;

    Configuration config;
    config.verbosity = core::VerboseMode::none;
    if (verbose) {
        config.verbosity = core::VerboseMode::verbose;
    }

    const auto opt = load_and_validate_json(config_file, ConfigSchemaFileName, ConfigSchemaVersion,
                                            /*require_schema_property=*/false);

    // Base dir for relative paths
    config.root_path = config_file.parent_path();

    try {
        auto source = opt.at("data").at("source").get<std::string>();
        config.data_source = resolve_path(source, config.root_path);
        fmt::print("Reference data store: {}\n", config.data_source.string());
    } catch (const json::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load data source: {}\n", e.what());
    }

    try {
        opt.at("current_year").get_to(config.current_year);
    } catch (const json::exception &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load current year: {}\n", e.what());
    }

    if (opt.contains("extended_detail")) {
        config.extended_detail =
            resolve_path(opt["extended_detail"].get<std::string>(), config.root_path);
    }

    if (opt.contains("analysis")) {
        try {
            opt["analysis"].get_to(config.analysis);
        } catch (const json::exception &e) {
            success = false;
            fmt::print(fg(fmt::color::red), "Could not load analysis info: {}\n", e.what());
        }
    }

    if (!success) {
        throw ConfigurationError{"Error loading config file"};
    }

    return config;
}

haq::AnalyticsOptions create_analytics_options(const Configuration &config) {
    const auto &info = config.analysis;
    if (info.window.size() != 2 || info.window.front() >= info.window.back()) {
        throw ConfigurationError{fmt::format("Invalid analysis window, expected [start, end] "
                                             "with start before end, got {} values",
                                             info.window.size())};
    }

    return haq::AnalyticsOptions{
        .window = core::YearInterval{info.window.front(), info.window.back()},
        .sensitivity_percent = info.sensitivity_percent,
        .default_scenario_percent = info.default_scenario_percent,
        .who_guideline = info.who_guideline};
}

std::unique_ptr<haq::ReferenceData> load_reference_data(const DataManager &data_api,
                                                        const Configuration &config) {
    MEASURE_FUNCTION();
    auto age_detail = std::vector<core::AgeDeathItem>{};
    if (config.extended_detail.has_value()) {
        age_detail = data_api.get_age_detail(config.extended_detail.value());
    }

    auto data = std::make_unique<haq::ReferenceData>(data_api, config.current_year,
                                                     std::move(age_detail));
    if (config.verbosity == core::VerboseMode::verbose) {
        fmt::print(fg(fmt::color::cyan),
                   "Loaded {} countries, {} diseases, observed years {}, age detail: {}\n",
                   data->countries().size(), data->diseases().size(),
                   data->observed_years().to_string(), data->has_age_detail());
    }

    return data;
}

} // namespace haq::input

#include "datamanager.h"
#include "jsonparser.h"
#include "schema.h"

#include "HealthAQ.Core/string_util.h"

#include <fmt/color.h>
#include <rapidcsv.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

namespace {
//! The name of the index file
constexpr const char *IndexFileName = "index.json";

//! The name of the index.json schema file
constexpr const char *DataIndexSchemaFileName = "data_index.json";

//! The version of the index.json schema file
constexpr int DataIndexSchemaVersion = 1;

nlohmann::json read_input_files_from_directory(const std::filesystem::path &data_path) {
    return haq::input::load_and_validate_json(data_path / IndexFileName, DataIndexSchemaFileName,
                                              DataIndexSchemaVersion);
}

std::optional<double> parse_optional_number(const std::string &text) {
    auto value = haq::core::trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    return std::stod(value);
}
} // anonymous namespace

namespace haq::input {
DataManager::DataManager(std::filesystem::path data_path, VerboseMode verbosity)
    : root_(std::move(data_path)), verbosity_(verbosity),
      index_(read_input_files_from_directory(root_)) {}

std::filesystem::path DataManager::resolve_file(const std::string &node,
                                                std::string_view what) const {
    auto filepath = index_[node]["path"].get<std::string>();
    auto filename = index_[node]["file_name"].get<std::string>();
    auto fullpath = root_ / filepath / filename;
    if (!std::filesystem::exists(fullpath)) {
        throw std::runtime_error(fmt::format("{} file: '{}' not found.", what, fullpath.string()));
    }

    return fullpath;
}

std::vector<Country> DataManager::get_countries() const {
    auto results = std::vector<Country>();
    auto filename = resolve_file("country", "countries");

    rapidcsv::Document doc(filename.string());
    auto mapping =
        create_fields_index_mapping(doc.GetColumnNames(), {"Name", "Alpha3", "Population"});
    for (size_t i = 0; i < doc.GetRowCount(); i++) {
        auto row = doc.GetRow<std::string>(i);
        results.push_back(Country{.name = core::trim(row[mapping["Name"]]),
                                  .alpha3 = core::trim(row[mapping["Alpha3"]]),
                                  .population = parse_optional_number(row[mapping["Population"]])});
    }

    std::sort(results.begin(), results.end());

    return results;
}

Country DataManager::get_country(const std::string &name_or_alpha) const {
    auto c = get_countries();
    auto is_target = [&name_or_alpha](const haq::core::Country &c) {
        return core::case_insensitive::equals(c.name, name_or_alpha) ||
               core::case_insensitive::equals(c.alpha3, name_or_alpha);
    };

    auto country = std::find_if(c.begin(), c.end(), is_target);
    if (country == c.end()) {
        throw std::runtime_error(fmt::format("Target country: '{}' not found.", name_or_alpha));
    }

    return *country;
}

std::vector<DiseaseInfo> DataManager::get_diseases() const {
    auto result = std::vector<DiseaseInfo>();

    const auto &registry = index_["diseases"]["registry"];
    for (const auto &item : registry) {
        auto info = DiseaseInfo{};
        item["name"].get_to(info.name);
        item["category"].get_to(info.category);
        item["alpha"].get_to(info.alpha);
        item["gamma"].get_to(info.gamma);
        info.delta = item.value("delta", 1.0);
        result.emplace_back(info);
    }

    std::sort(result.begin(), result.end());

    return result;
}

std::vector<PM25Item> DataManager::get_pm25_history() const {
    auto results = std::vector<PM25Item>();
    auto filename = resolve_file("pm25", "PM2.5 history");

    rapidcsv::Document doc(filename.string());
    auto mapping = create_fields_index_mapping(doc.GetColumnNames(), {"Country", "Year", "PM25"});
    for (size_t i = 0; i < doc.GetRowCount(); i++) {
        auto row = doc.GetRow<std::string>(i);
        auto value = parse_optional_number(row[mapping["PM25"]]);
        if (!value.has_value()) {
            notify_warning(fmt::format("PM2.5 row {} without value, skipped.", i + 1));
            continue;
        }

        results.push_back(PM25Item{.country = core::trim(row[mapping["Country"]]),
                                   .year = std::stoi(row[mapping["Year"]]),
                                   .value = value.value()});
    }

    return results;
}

std::vector<BaselineDeathItem> DataManager::get_baseline_deaths() const {
    auto results = std::vector<BaselineDeathItem>();
    auto filename = resolve_file("baseline", "baseline deaths");

    rapidcsv::Document doc(filename.string());
    auto mapping = create_fields_index_mapping(doc.GetColumnNames(),
                                               {"Country", "Year", "Disease", "Deaths"});
    for (size_t i = 0; i < doc.GetRowCount(); i++) {
        auto row = doc.GetRow<std::string>(i);
        results.push_back(BaselineDeathItem{.country = core::trim(row[mapping["Country"]]),
                                            .year = std::stoi(row[mapping["Year"]]),
                                            .disease = core::trim(row[mapping["Disease"]]),
                                            .deaths = std::stod(row[mapping["Deaths"]])});
    }

    return results;
}

LinearModelData DataManager::get_forecast_model() const {
    auto filename = resolve_file("model", "forecast model");
    auto ifs = std::ifstream{filename};
    if (!ifs) {
        throw std::runtime_error(
            fmt::format("Failed to read forecast model file: '{}'.", filename.string()));
    }

    auto info = nlohmann::json::parse(ifs).get<ForecastModelInfo>();
    auto result = LinearModelData{
        .name = info.name, .formula = info.formula, .intercept = info.intercept};
    for (const auto &[feature, coefficient] : info.coefficients) {
        result.coefficients.emplace_back(feature, coefficient.value);
    }

    return result;
}

std::vector<AgeDeathItem>
DataManager::get_age_detail(const std::filesystem::path &file_path) const {
    auto results = std::vector<AgeDeathItem>();
    auto filename = file_path.is_absolute() ? file_path : root_ / file_path;
    if (!std::filesystem::exists(filename)) {
        notify_warning(fmt::format("age detail file: '{}' not found, using aggregated baseline.",
                                   filename.string()));
        return results;
    }

    try {
        rapidcsv::Document doc(filename.string());
        auto mapping = create_fields_index_mapping(
            doc.GetColumnNames(),
            {"Country", "Year", "Disease", "Age", "Deaths", "Lower", "Upper"});
        for (size_t i = 0; i < doc.GetRowCount(); i++) {
            auto row = doc.GetRow<std::string>(i);
            auto deaths = std::stod(row[mapping["Deaths"]]);
            results.push_back(AgeDeathItem{
                .country = core::trim(row[mapping["Country"]]),
                .year = std::stoi(row[mapping["Year"]]),
                .disease = core::trim(row[mapping["Disease"]]),
                .age_band = core::trim(row[mapping["Age"]]),
                .deaths = deaths,
                .lower = parse_optional_number(row[mapping["Lower"]]).value_or(deaths),
                .upper = parse_optional_number(row[mapping["Upper"]]).value_or(deaths)});
        }
    } catch (const std::exception &ex) {
        notify_warning(fmt::format("age detail file: '{}' unreadable, using aggregated "
                                   "baseline. {}",
                                   filename.string(), ex.what()));
        results.clear();
    }

    return results;
}

std::map<std::string, std::size_t>
DataManager::create_fields_index_mapping(const std::vector<std::string> &column_names,
                                         const std::vector<std::string> &fields) {
    auto mapping = std::map<std::string, std::size_t>();
    for (const auto &field : fields) {
        auto field_index = core::case_insensitive::index_of(column_names, field);
        if (field_index < 0) {
            throw std::out_of_range(
                fmt::format("File-based store, required field {} not found", field));
        }

        mapping.emplace(field, field_index);
    }

    return mapping;
}

void DataManager::notify_warning(std::string_view message) const {
    if (verbosity_ == VerboseMode::none) {
        return;
    }

    fmt::print(fg(fmt::color::dark_salmon), "File-based store, {}\n", message);
}

} // namespace haq::input

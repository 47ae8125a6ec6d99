#pragma once

#include "linear_forecast_model.h"

#include "HealthAQ.Core/datastore.h"
#include "HealthAQ.Core/interval.h"
#include "HealthAQ.Core/string_util.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace haq {

/// @brief Annual PM2.5 series, year to concentration
using WorkingHistory = std::map<int, double>;

/// @brief Baseline deaths by disease for the year nearest to a request
struct BaselineLookup {
    /// @brief The year the baseline was recorded for
    int year{};

    /// @brief All-ages deaths by disease name
    std::map<std::string, double> deaths;
};

/// @brief Age band stratified baseline records for the year nearest to a request
struct AgeDetailLookup {
    int year{};
    std::vector<core::AgeDeathItem> records;
};

/// @brief Process-wide immutable reference data.
///
/// Loaded once at start-up from a core::Datastore and handed to every component by
/// const reference; no request path mutates it. The country vocabulary holds the
/// countries with an observed PM2.5 series.
class ReferenceData {
  public:
    ReferenceData() = delete;

    /// @brief Initialises a new instance of the ReferenceData class
    /// @param store The back-end data store to read from
    /// @param current_year Reference year for relative year phrases
    /// @param age_detail Optional age stratified baseline deaths
    /// @throws std::runtime_error for inconsistent reference data.
    ReferenceData(const core::Datastore &store, int current_year,
                  std::vector<core::AgeDeathItem> age_detail = {});

    int current_year() const noexcept { return current_year_; }

    /// @brief Gets the country vocabulary, ordered by name
    const std::vector<std::string> &countries() const noexcept { return countries_; }

    /// @brief Determines whether a country is in the vocabulary, case-insensitive
    bool contains_country(std::string_view name) const;

    /// @brief Gets the canonical spelling of a country name
    /// @param name The country name, case-insensitive
    /// @return The canonical country name
    /// @throws UnknownCountryError if the country is not in the vocabulary.
    const std::string &canonical_country(std::string_view name) const;

    /// @brief Gets the recorded population of a country
    std::optional<double> population(std::string_view country) const;

    /// @brief Gets the observed PM2.5 series of a country
    /// @throws UnknownCountryError if the country is not in the vocabulary.
    const WorkingHistory &pm25_history(std::string_view country) const;

    /// @brief Gets the range of observed years across all countries
    core::YearInterval observed_years() const noexcept { return observed_years_; }

    /// @brief Gets the diseases definitions, ordered by canonical name
    const std::vector<core::DiseaseInfo> &diseases() const noexcept { return diseases_; }

    /// @brief Gets the diseases canonical names, ordered
    std::vector<std::string> disease_names() const;

    /// @brief Gets a disease definition by canonical name
    /// @throws std::out_of_range for unknown disease names.
    const core::DiseaseInfo &disease(std::string_view name) const;

    /// @brief Gets the baseline deaths for the exact year, else the nearest year
    /// @param country The canonical country name
    /// @param year The requested year
    /// @return The baseline, or std::nullopt if the country has no baseline rows
    std::optional<BaselineLookup> baseline_deaths(const std::string &country, int year) const;

    /// @brief Gets the age stratified records for the exact year, else the nearest year
    /// @return The records, or std::nullopt if no detail was loaded for the country
    std::optional<AgeDetailLookup> age_detail(const std::string &country, int year) const;

    /// @brief Indicates whether the extended age stratified detail is loaded
    bool has_age_detail() const noexcept { return !age_detail_.empty(); }

    /// @brief Gets the PM2.5 forecasting model
    const LinearForecastModel &model() const noexcept { return model_; }

  private:
    int current_year_;
    std::vector<std::string> countries_;
    std::map<std::string, std::string, core::case_insensitive::comparator> canonical_;
    std::unordered_map<std::string, double> population_;
    std::unordered_map<std::string, WorkingHistory> history_;
    core::YearInterval observed_years_;
    std::vector<core::DiseaseInfo> diseases_;
    std::map<std::string, std::map<int, std::map<std::string, double>>> baseline_;
    std::map<std::string, std::map<int, std::vector<core::AgeDeathItem>>> age_detail_;
    LinearForecastModel model_;
};

} // namespace haq

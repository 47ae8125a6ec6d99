#pragma once

#include "country.h"
#include "disease.h"
#include "poco.h"

#include <string>
#include <vector>

namespace haq::core {

/// @brief Defines the HealthAQ back-end reference data store interface for all implementations.
///
/// The store is read once at start-up; the resulting tables are treated as immutable
/// for the lifetime of the process.
class Datastore {
  public:
    /// @brief Destroys a Datastore instance
    virtual ~Datastore() = default;

    /// @brief Gets the full collection of countries in the store
    /// @return The list of countries, ordered by name
    virtual std::vector<Country> get_countries() const = 0;

    /// @brief Gets a single country by name or alpha 3 code
    /// @param name_or_alpha The country name or alpha 3 code to search, case-insensitive
    /// @return The country's definition
    virtual Country get_country(const std::string &name_or_alpha) const = 0;

    /// @brief Gets the collection of diseases exposure-response definitions
    /// @return The list of diseases defined
    virtual std::vector<DiseaseInfo> get_diseases() const = 0;

    /// @brief Gets the observed annual PM2.5 history for all countries
    /// @return The list of observations
    virtual std::vector<PM25Item> get_pm25_history() const = 0;

    /// @brief Gets the all-ages baseline deaths by country, year and disease
    /// @return The list of baseline deaths items
    virtual std::vector<BaselineDeathItem> get_baseline_deaths() const = 0;

    /// @brief Gets the trained PM2.5 forecasting model definition
    /// @return The model definition
    virtual LinearModelData get_forecast_model() const = 0;
};

} // namespace haq::core

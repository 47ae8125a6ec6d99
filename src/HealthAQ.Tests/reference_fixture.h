#pragma once

#include "HealthAQ.Core/datastore.h"
#include "HealthAQ/reference_data.h"

#include <optional>
#include <string>
#include <vector>

namespace haq::testing {

/// @brief Reference year of the in-memory fixture
constexpr int TestCurrentYear = 2025;

/// @brief In-memory data store with a small, hand-checkable reference data set.
///
/// | Country  | PM2.5 years | Last value | Population | Baseline years |
/// |----------|-------------|------------|------------|----------------|
/// | Cambodia | 2018 - 2020 | 26.0       | 16 000 000 | 2019           |
/// | Germany  | 2015 - 2020 | 9.5        | 80 000 000 | none           |
/// | India    | 2015 - 2020 | 90.0       | none       | 2019           |
/// | Thailand | 2010 - 2019 | 20.0       | 70 000 000 | 2015, 2019     |
/// | Vietnam  | 2012 - 2020 | 32.0       | 100 000 000| 2019           |
///
/// The forecasting model is pure persistence: `pm25(Y) = lag_1y`.
class InMemoryDatastore final : public core::Datastore {
  public:
    InMemoryDatastore() = default;

    /// @brief Initialises a new instance with fixture variations
    /// @param model Replaces the persistence model when set
    /// @param clean_air Adds Iceland, observed below the TMREL from 2018
    InMemoryDatastore(std::optional<core::LinearModelData> model, bool clean_air);

    std::vector<core::Country> get_countries() const override;
    core::Country get_country(const std::string &name_or_alpha) const override;
    std::vector<core::DiseaseInfo> get_diseases() const override;
    std::vector<core::PM25Item> get_pm25_history() const override;
    std::vector<core::BaselineDeathItem> get_baseline_deaths() const override;
    core::LinearModelData get_forecast_model() const override;

  private:
    std::optional<core::LinearModelData> model_;
    bool clean_air_{false};
};

/// @brief Trend model of the fixture variation: `pm25(Y) = 1 + 0.9 lag_1y + 0.5 yoy_change`
core::LinearModelData test_trend_model();

/// @brief Age stratified detail for Thailand 2019, Ischemic heart disease only
std::vector<core::AgeDeathItem> thailand_age_detail();

/// @brief Gets the shared fixture reference data, aggregated baseline only
const ReferenceData &test_reference_data();

/// @brief Gets the shared fixture reference data with the Thailand age detail
const ReferenceData &test_reference_data_with_detail();

/// @brief Gets the fixture reference data forecast with the trend model
const ReferenceData &test_reference_data_trend_model();

/// @brief Gets the fixture reference data with Iceland, 2016 - 2020: 6.0, 5.5, 4.8, 4.2, 3.9
const ReferenceData &test_reference_data_clean_air();

} // namespace haq::testing

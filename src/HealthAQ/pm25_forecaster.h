#pragma once

#include "linear_forecast_model.h"
#include "reference_data.h"
#include "uncertainty.h"

#include "HealthAQ.Core/interval.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haq {

/// @brief Annual PM2.5 value of a country, observed or model-produced
struct ForecastPoint {
    std::string country;
    int year{};

    /// @brief Concentration, µg/m³, never below the TMREL
    double pm25{};

    /// @brief Whether the value is model-produced
    bool is_predicted{};

    ConfidenceTier confidence;
};

/// @brief PM2.5 change between two years
struct PM25Change {
    std::string country;
    int from_year{};
    int to_year{};
    double from_pm25{};
    double to_pm25{};
    double abs_change{};

    /// @brief Percentage change, 0 when the first value is not positive
    double pct_change{};

    /// @brief Direction arrow: ↑, ↓ or → within ±0.5%
    std::string arrow;
};

/// @brief Twelve monthly PM2.5 values of one year
struct MonthlyForecast {
    std::string country;
    int year{};
    double annual_pm25{};

    /// @brief The seasonal pattern used, Default for the neutral pattern
    std::string seasonal_region;

    std::array<double, 12> factors{};
    std::array<double, 12> values{};
    ConfidenceTier confidence;
};

/// @brief One month PM2.5 value
struct MonthlyPoint {
    std::string country;
    int year{};
    int month{};
    std::string month_name;
    double pm25{};
    double annual_pm25{};
    double seasonal_factor{};
    std::string seasonal_region;
    ConfidenceTier confidence;
};

/// @brief Recursive multi-step annual PM2.5 forecaster.
///
/// Beyond the last observed year of a country the model predicts one year at a time, in
/// increasing order, and appends each clamped prediction to a request-local working
/// history before the features of the next year are computed. The shared reference
/// data is never mutated.
class PM25Forecaster {
  public:
    /// @brief Persistence value for an empty history, µg/m³
    static constexpr double EmptyHistoryValue = 25.0;

    PM25Forecaster() = delete;

    /// @brief Initialises a new instance of the PM25Forecaster class
    /// @param data The reference data
    explicit PM25Forecaster(const ReferenceData &data);

    /// @brief Computes the features for a year from the working history ending before it
    /// @param history The working history
    /// @param year The target year
    /// @return The features, or std::nullopt for fewer than 3 points or missing lag_1y
    static std::optional<ForecastFeatures> compute_features(const WorkingHistory &history,
                                                            int year);

    /// @brief Predicts one year, model output or persistence, clamped to the TMREL
    double predict_step(const WorkingHistory &history, int year) const;

    /// @brief Runs the recursion from the end of a working history up to a target year
    /// @param history The request-local working history
    /// @param target_year The last year to predict
    /// @return The history extended with one prediction per year
    WorkingHistory predict_from(WorkingHistory history, int target_year) const;

    /// @brief Gets the PM2.5 value of a country in a year
    ///
    /// Years up to the last observed year return the observed value, or the nearest earlier
    /// observation when the series has a gap.
    /// @throws UnknownCountryError for unknown countries.
    /// @throws YearOutOfRangeError for years before the first observation.
    ForecastPoint forecast(std::string_view country, int year) const;

    /// @brief Gets every predicted year from the last observed year + 1 to a target year
    std::vector<ForecastPoint> path(std::string_view country, int target_year) const;

    /// @brief Gets the values of a country for every year in an interval
    std::vector<ForecastPoint> range(std::string_view country, core::YearInterval years) const;

    /// @brief Gets the observed points of a country, ordered by year, clamped to the TMREL
    std::vector<ForecastPoint> history(std::string_view country) const;

    int last_observed_year(std::string_view country) const;

    /// @brief Gets the PM2.5 change of a country between two years
    PM25Change change(std::string_view country, int from_year, int to_year) const;

    /// @brief Gets the PM2.5 change of a country versus the previous year
    PM25Change yoy_change(std::string_view country, int year) const;

    /// @brief Gets the monthly seasonal decomposition of a year
    MonthlyForecast monthly(std::string_view country, int year) const;

    /// @brief Gets one month of the seasonal decomposition
    /// @throws std::out_of_range for month outside 1 - 12.
    MonthlyPoint monthly(std::string_view country, int year, int month) const;

    /// @brief Gets the seasonal factors of a region, neutral 1.0 for regions without a table
    static const std::array<double, 12> &seasonal_factors(std::string_view region);

    /// @brief Gets the English name of a month, 1 - 12
    static std::string month_name(int month);

    const ReferenceData &data() const noexcept { return data_; }

  private:
    const ReferenceData &data_;

    ForecastPoint make_point(const std::string &country, const WorkingHistory &working,
                             int last_observed, int year) const;
};

} // namespace haq

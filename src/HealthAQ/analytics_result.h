#pragma once

#include "health_risk_engine.h"
#include "pm25_forecaster.h"
#include "risk_scoring.h"
#include "uncertainty.h"

#include "HealthAQ.Core/forward_type.h"
#include "HealthAQ.Core/interval.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace haq {

/// @brief Set of countries a ranking runs over
struct AnalysisScope {
    /// @brief Scope label: Global, a region name, or Custom for explicit lists
    std::string label;

    std::vector<std::string> countries;
};

/// @brief Baseline versus scenario PM2.5 and attributable deaths
struct ScenarioResult {
    std::string country;
    int year{};

    /// @brief Signed percent change applied to the baseline
    double percent_change{};

    bool is_increase{};
    double baseline_pm25{};
    double scenario_pm25{};

    /// @brief The target concentration, only for target scenarios
    std::optional<double> target_pm25;

    double baseline_deaths{};
    double scenario_deaths{};

    /// @brief Baseline minus scenario deaths, negative when the scenario adds deaths
    double prevented_deaths{};

    double baseline_rate{};
    double scenario_rate{};
    std::optional<core::AgeGroup> age_group;
    ConfidenceTier confidence;

    /// @brief Top three diseases of the scenario
    std::vector<std::string> top_diseases;
};

/// @brief Direction and stability of a PM2.5 series over a window
struct TrendResult {
    std::string country;
    core::YearInterval window;
    std::vector<ForecastPoint> series;
    double start_pm25{};
    double end_pm25{};
    double pct_change{};

    /// @brief Increasing, Decreasing or Stable within ±2%
    std::string direction;

    std::string arrow;
    double mean_pm25{};

    /// @brief Population standard deviation
    double std_pm25{};

    /// @brief Coefficient of variation, percent
    double cv{};

    /// @brief Stable below 5% CV, else Volatile
    std::string stability;

    std::string health_impact;
};

/// @brief Composite risk assessment of a country and year
struct RiskProfile {
    std::string country;
    int year{};
    double pm25{};
    bool is_predicted{};
    double yoy_pct{};
    std::string arrow;
    PM25Interval interval;
    ConfidenceTier confidence;
    RiskScore risk;
};

/// @brief PM2.5 ranking entry
struct PM25RankEntry {
    std::string country;
    double pm25{};
    bool is_predicted{};
};

/// @brief Volatility ranking entry
struct StabilityEntry {
    std::string country;
    double mean_pm25{};
    double std_pm25{};
    double cv{};
    std::string label;
};

/// @brief PM2.5 change over a window ranking entry
struct ImprovementEntry {
    std::string country;
    double start_pm25{};
    double end_pm25{};
    double pct_change{};

    /// @brief Improving for a falling concentration, else Worsening
    std::string direction;
};

/// @brief Health burden ranking entry
struct BurdenEntry {
    std::string country;
    double pm25{};
    double deaths{};

    /// @brief The ranked value, deaths or DALYs
    double value{};

    std::string metric;
};

/// @brief Deaths sensitivity to a PM2.5 change of one country
struct SensitivityEntry {
    std::string country;
    double baseline_pm25{};
    double baseline_deaths{};
    double scenario_deaths{};
    double prevented{};
    double prevented_per_1pct{};
};

/// @brief Deaths sensitivity to a PM2.5 change across a scope
struct SensitivityResult {
    std::string scope;
    int year{};
    double delta_percent{};

    /// @brief Entries ordered by prevented deaths per 1% descending
    std::vector<SensitivityEntry> per_country;

    double avg_prevented_per_1pct{};
    std::vector<SensitivityEntry> top_sensitive;
};

/// @brief Attributable deaths versus the nearest earlier year with deaths
struct DeathsChange {
    std::string country;
    int year{};
    double deaths_current{};
    std::optional<int> previous_year;
    std::optional<double> deaths_previous;
    std::optional<double> delta;
    std::optional<double> pct_change;

    /// @brief Increased, Decreased or Unchanged, empty without a previous year
    std::string direction;

    std::optional<std::string> note;
};

/// @brief Ordered ranking over a scope, ties broken by country name
template <typename Entry> struct Ranking {
    std::string scope;

    /// @brief The years the metric was computed for
    core::YearInterval years;

    std::string metric;
    bool ascending{};
    std::vector<Entry> entries;
};

/// @brief Forecasting model input with a documented influence
struct ForecastDriver {
    std::string feature;
    std::string label;
    std::optional<double> coefficient;
};

/// @brief Fixed drivers of the PM2.5 forecast and the health burden
struct Explanation {
    std::optional<std::string> country;
    int year{};
    std::string model;
    std::optional<ForecastPoint> forecast;
    std::vector<ForecastDriver> drivers;

    /// @brief Top two diseases by attributed deaths
    std::vector<DiseaseImpact> top_diseases;
};

/// @brief One month of a seasonal ranking
struct MonthValue {
    int month{};
    std::string name;
    double pm25{};
    double seasonal_factor{};
};

/// @brief Months of a year ordered by PM2.5
struct MonthRanking {
    std::string country;
    int year{};
    std::string seasonal_region;

    /// @brief Whether the cleanest month comes first
    bool ascending{};

    std::vector<MonthValue> months;
};

/// @brief Forecast PM2.5 of a country and the attributable health burden at that level
struct ForecastHealth {
    ForecastPoint forecast;
    HealthResult health;
};

/// @brief Loaded state of the service reference data
struct ServiceStatus {
    bool model_loaded{};
    std::string model_name;
    std::size_t country_count{};
    std::size_t disease_count{};
    bool extended_detail{};

    /// @brief Range of the last observed years across countries
    core::YearInterval last_observed_years;

    int current_year{};
};

/// @brief Health burden of two countries side by side
struct CompareResult {
    ForecastPoint first_forecast;
    ForecastPoint second_forecast;
    HealthComparison health;
};

} // namespace haq

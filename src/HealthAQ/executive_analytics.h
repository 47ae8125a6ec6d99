#pragma once

#include "analytics_result.h"
#include "health_risk_engine.h"
#include "pm25_forecaster.h"

#include "HealthAQ.Core/interval.h"

#include <optional>
#include <string>
#include <string_view>

namespace haq {

/// @brief Executive analytics defaults
struct AnalyticsOptions {
    /// @brief Default window of the stability and improvement rankings
    core::YearInterval window{2020, 2030};

    /// @brief Signed percent change of the sensitivity ranking
    double sensitivity_percent{-5.0};

    /// @brief Percent change of scenarios that do not give one
    double default_scenario_percent{15.0};

    /// @brief WHO annual PM2.5 guideline, µg/m³
    double who_guideline{5.0};
};

/// @brief Scenario, trend, risk, ranking and explainability analytics.
///
/// Composes the forecaster and the health engine outputs, none of the forecasting or
/// disease math is re-implemented here. The per-country metrics of the rankings are
/// computed in parallel into pre-sized slots, countries without a metric are skipped.
class ExecutiveAnalytics {
  public:
    ExecutiveAnalytics() = delete;

    /// @brief Initialises a new instance of the ExecutiveAnalytics class
    /// @param forecaster The PM2.5 forecaster
    /// @param engine The health risk engine
    /// @param options The analytics defaults
    ExecutiveAnalytics(const PM25Forecaster &forecaster, const HealthRiskEngine &engine,
                       AnalyticsOptions options = {});

    const AnalyticsOptions &options() const noexcept { return options_; }

    /// @brief Compares baseline and scenario deaths for a signed PM2.5 change
    /// @param country The country name
    /// @param year The analysis year
    /// @param percent The change magnitude, percent
    /// @param sign The change direction: +1 increase, -1 decrease
    /// @param age_group Optional age group weighting
    /// @return The scenario comparison
    ScenarioResult scenario(std::string_view country, int year, double percent, int sign,
                            std::optional<core::AgeGroup> age_group = {}) const;

    /// @brief Compares baseline and scenario deaths for PM2.5 reduced to a target
    ScenarioResult scenario_to_target(std::string_view country, int year, double target_pm25,
                                      std::optional<core::AgeGroup> age_group = {}) const;

    /// @brief Computes the direction and stability of a country series over a window
    /// @throws YearOutOfRangeError for windows shorter than two years.
    TrendResult trend(std::string_view country, core::YearInterval window) const;

    RiskProfile risk_profile(std::string_view country, int year) const;

    /// @brief Ranks a scope by PM2.5, highest first unless ascending
    Ranking<PM25RankEntry> rank_pm25(const AnalysisScope &scope, int year, bool ascending = false,
                                     std::optional<int> top_n = {}) const;

    /// @brief Ranks a scope by the coefficient of variation, most stable first unless descending
    Ranking<StabilityEntry> rank_stability(const AnalysisScope &scope,
                                           std::optional<core::YearInterval> window = {},
                                           bool ascending = true) const;

    /// @brief Ranks a scope by the PM2.5 change over a window, most improving first
    Ranking<ImprovementEntry> fastest_improving(const AnalysisScope &scope,
                                                std::optional<core::YearInterval> window = {},
                                                bool ascending = true) const;

    /// @brief Ranks a scope by attributable deaths or DALYs, lowest first unless descending
    /// @param metric deaths or dalys, case-insensitive
    Ranking<BurdenEntry> lowest_health_burden(const AnalysisScope &scope, int year,
                                              std::string_view metric = "deaths",
                                              bool ascending = true) const;

    /// @brief Computes the deaths prevented per 1% PM2.5 change across a scope
    SensitivityResult sensitivity(const AnalysisScope &scope, int year,
                                  std::optional<double> delta_percent = {}) const;

    /// @brief Compares attributable deaths with the nearest earlier year with deaths
    ///
    /// Searches back up to five years for a non-zero previous value.
    DeathsChange deaths_change_yoy(std::string_view country, int year) const;

    /// @brief Ranks a scope by deaths change percent, largest increase first
    Ranking<DeathsChange> rank_deaths_change(const AnalysisScope &scope, int year) const;

    /// @brief Ranks a scope by composite risk score, highest first unless ascending
    Ranking<RiskProfile> rank_risk(const AnalysisScope &scope, int year,
                                   bool ascending = false) const;

    /// @brief Gets the fixed forecast drivers and, for a country, the top two diseases
    Explanation explain(std::optional<std::string> country, int year) const;

    /// @brief Compares the health burden of two countries at their forecast PM2.5
    CompareResult compare_health(std::string_view first, std::string_view second, int year,
                                 std::optional<core::AgeGroup> age_group = {}) const;

    /// @brief Orders the months of a year, cleanest first
    MonthRanking best_months(std::string_view country, int year) const;

    /// @brief Orders the months of a year, most polluted first
    MonthRanking worst_months(std::string_view country, int year) const;

    const PM25Forecaster &forecaster() const noexcept { return forecaster_; }

    const HealthRiskEngine &engine() const noexcept { return engine_; }

  private:
    const PM25Forecaster &forecaster_;
    const HealthRiskEngine &engine_;
    AnalyticsOptions options_;

    double deaths_at(const std::string &country, int year) const;
    MonthRanking month_ranking(std::string_view country, int year, bool ascending) const;
};

} // namespace haq

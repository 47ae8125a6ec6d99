#include "pch.h"
#include "reference_fixture.h"

#include "HealthAQ/errors.h"
#include "HealthAQ/executive_analytics.h"
#include "HealthAQ/exposure.h"

namespace {

class ExecutiveAnalyticsTest : public ::testing::Test {
  protected:
    ExecutiveAnalyticsTest()
        : forecaster{haq::testing::test_reference_data()},
          engine{haq::testing::test_reference_data()}, analytics{forecaster, engine} {}

    haq::AnalysisScope global_scope() const {
        return haq::AnalysisScope{.label = "Global",
                                  .countries = forecaster.data().countries()};
    }

    haq::PM25Forecaster forecaster;
    haq::HealthRiskEngine engine;
    haq::ExecutiveAnalytics analytics;
};

std::vector<std::string> countries_of(const auto &ranking) {
    auto result = std::vector<std::string>{};
    for (const auto &entry : ranking.entries) {
        result.emplace_back(entry.country);
    }

    return result;
}

} // anonymous namespace

TEST_F(ExecutiveAnalyticsTest, DefaultOptions) {
    const auto &options = analytics.options();

    ASSERT_EQ(haq::core::YearInterval(2020, 2030), options.window);
    ASSERT_DOUBLE_EQ(-5.0, options.sensitivity_percent);
    ASSERT_DOUBLE_EQ(15.0, options.default_scenario_percent);
    ASSERT_DOUBLE_EQ(5.0, options.who_guideline);
}

TEST_F(ExecutiveAnalyticsTest, ScenarioReduction) {
    auto result = analytics.scenario("Thailand", 2025, 20.0, -1);

    ASSERT_EQ("Thailand", result.country);
    ASSERT_DOUBLE_EQ(-20.0, result.percent_change);
    ASSERT_FALSE(result.is_increase);
    ASSERT_DOUBLE_EQ(20.0, result.baseline_pm25);
    ASSERT_DOUBLE_EQ(16.0, result.scenario_pm25);
    ASSERT_NEAR(979.6971, result.baseline_deaths, 1e-3);
    ASSERT_NEAR(744.1601, result.scenario_deaths, 1e-3);
    ASSERT_NEAR(235.5370, result.prevented_deaths, 1e-3);
    ASSERT_NEAR(1.06309, result.scenario_rate, 1e-4);
    ASSERT_EQ("Moderate", result.confidence.level);
    ASSERT_FALSE(result.target_pm25.has_value());
    ASSERT_EQ(2u, result.top_diseases.size());
    ASSERT_EQ("Ischemic heart disease", result.top_diseases.front());
}

TEST_F(ExecutiveAnalyticsTest, ScenarioIncreaseAddsDeaths) {
    auto result = analytics.scenario("India", 2025, 10.0, +1);

    ASSERT_TRUE(result.is_increase);
    ASSERT_DOUBLE_EQ(10.0, result.percent_change);
    ASSERT_NEAR(99.0, result.scenario_pm25, 1e-9);
    ASSERT_NEAR(-1398.6198, result.prevented_deaths, 1e-3);
}

TEST_F(ExecutiveAnalyticsTest, ScenarioClampedToTmrel) {
    auto result = analytics.scenario("Thailand", 2025, 90.0, -1);

    ASSERT_DOUBLE_EQ(haq::TMREL, result.scenario_pm25);
    ASSERT_DOUBLE_EQ(0.0, result.scenario_deaths);
    ASSERT_DOUBLE_EQ(result.baseline_deaths, result.prevented_deaths);
}

TEST_F(ExecutiveAnalyticsTest, ScenarioWithoutChange) {
    auto result = analytics.scenario("Thailand", 2025, 0.0, -1);

    ASSERT_DOUBLE_EQ(0.0, result.percent_change);
    ASSERT_DOUBLE_EQ(result.baseline_pm25, result.scenario_pm25);
    ASSERT_DOUBLE_EQ(result.baseline_deaths, result.scenario_deaths);
    ASSERT_DOUBLE_EQ(0.0, result.prevented_deaths);
}

TEST_F(ExecutiveAnalyticsTest, ScenarioToTarget) {
    auto who = analytics.scenario_to_target("Thailand", 2025, 5.0);
    ASSERT_DOUBLE_EQ(5.0, who.target_pm25.value());
    ASSERT_NEAR(-75.0, who.percent_change, 1e-9);
    ASSERT_NEAR(0.0, who.scenario_deaths, 1e-9);

    auto above = analytics.scenario_to_target("Cambodia", 2025, 30.0);
    ASSERT_DOUBLE_EQ(0.0, above.percent_change);
    ASSERT_DOUBLE_EQ(above.baseline_pm25, above.scenario_pm25);
    ASSERT_DOUBLE_EQ(0.0, above.prevented_deaths);
}

TEST_F(ExecutiveAnalyticsTest, TrendOverObservedWindow) {
    auto result = analytics.trend("Thailand", haq::core::YearInterval{2010, 2019});

    ASSERT_EQ(10u, result.series.size());
    ASSERT_DOUBLE_EQ(30.0, result.start_pm25);
    ASSERT_DOUBLE_EQ(20.0, result.end_pm25);
    ASSERT_NEAR(-33.3333, result.pct_change, 1e-4);
    ASSERT_EQ("Decreasing", result.direction);
    ASSERT_EQ("↓", result.arrow);
    ASSERT_NEAR(25.4, result.mean_pm25, 1e-9);
    ASSERT_NEAR(3.03974, result.std_pm25, 1e-5);
    ASSERT_NEAR(11.96747, result.cv, 1e-5);
    ASSERT_EQ("Volatile", result.stability);
    ASSERT_FALSE(result.health_impact.empty());
}

TEST_F(ExecutiveAnalyticsTest, TrendStableForecast) {
    auto result = analytics.trend("Vietnam", haq::core::YearInterval{2020, 2030});

    ASSERT_EQ(11u, result.series.size());
    ASSERT_EQ("Stable", result.direction);
    ASSERT_EQ("→", result.arrow);
    ASSERT_DOUBLE_EQ(0.0, result.cv);
    ASSERT_EQ("Stable", result.stability);
}

TEST_F(ExecutiveAnalyticsTest, TrendSingleYearThrows) {
    ASSERT_THROW(analytics.trend("Vietnam", haq::core::YearInterval(2025, 2025)),
                 haq::YearOutOfRangeError);
}

TEST_F(ExecutiveAnalyticsTest, RiskProfile) {
    auto result = analytics.risk_profile("Thailand", 2019);

    ASSERT_DOUBLE_EQ(20.0, result.pm25);
    ASSERT_FALSE(result.is_predicted);
    ASSERT_NEAR(-9.0909, result.yoy_pct, 1e-4);
    ASSERT_EQ("↓", result.arrow);
    ASSERT_NEAR(1.0, result.interval.half_width, 1e-9);
    ASSERT_NEAR(0.167919, result.risk.score, 1e-6);
    ASSERT_EQ("Moderate", result.risk.tier);

    auto first = analytics.risk_profile("Thailand", 2010);
    ASSERT_DOUBLE_EQ(0.0, first.yoy_pct);
    ASSERT_EQ("→", first.arrow);
}

TEST_F(ExecutiveAnalyticsTest, RankPM25) {
    auto ranking = analytics.rank_pm25(global_scope(), 2020);

    ASSERT_EQ("Global", ranking.scope);
    ASSERT_EQ("pm25", ranking.metric);
    ASSERT_FALSE(ranking.ascending);
    ASSERT_EQ((std::vector<std::string>{"India", "Vietnam", "Cambodia", "Thailand", "Germany"}),
              countries_of(ranking));
    ASSERT_TRUE(ranking.entries[3].is_predicted);

    auto cleanest = analytics.rank_pm25(global_scope(), 2020, true, 2);
    ASSERT_EQ((std::vector<std::string>{"Germany", "Thailand"}), countries_of(cleanest));
}

TEST_F(ExecutiveAnalyticsTest, RankSkipsCountriesWithoutCoverage) {
    auto ranking = analytics.rank_pm25(global_scope(), 2016);

    ASSERT_EQ(4u, ranking.entries.size());
    ASSERT_EQ("India", ranking.entries.front().country);
}

TEST_F(ExecutiveAnalyticsTest, RankStability) {
    auto ranking = analytics.rank_stability(global_scope(), haq::core::YearInterval{2015, 2020});

    ASSERT_EQ("cv", ranking.metric);
    ASSERT_EQ((std::vector<std::string>{"Vietnam", "India", "Germany", "Thailand"}),
              countries_of(ranking));
    ASSERT_NEAR(2.77695, ranking.entries[0].cv, 1e-5);
    ASSERT_EQ("Stable", ranking.entries[1].label);
    ASSERT_EQ("Volatile", ranking.entries[2].label);

    auto volatile_first =
        analytics.rank_stability(global_scope(), haq::core::YearInterval{2015, 2020}, false);
    ASSERT_EQ("Thailand", volatile_first.entries.front().country);
}

TEST_F(ExecutiveAnalyticsTest, FastestImproving) {
    auto ranking = analytics.fastest_improving(global_scope(), haq::core::YearInterval{2015, 2020});

    ASSERT_EQ((std::vector<std::string>{"Germany", "Thailand", "Vietnam", "India"}),
              countries_of(ranking));
    ASSERT_EQ("Improving", ranking.entries[0].direction);
    ASSERT_NEAR(-20.0, ranking.entries[1].pct_change, 1e-9);
    ASSERT_EQ("Worsening", ranking.entries[3].direction);
    ASSERT_NEAR(12.5, ranking.entries[3].pct_change, 1e-9);
}

TEST_F(ExecutiveAnalyticsTest, LowestHealthBurden) {
    auto ranking = analytics.lowest_health_burden(global_scope(), 2019);

    ASSERT_EQ("DEATHS", ranking.metric);
    ASSERT_TRUE(ranking.ascending);
    ASSERT_EQ((std::vector<std::string>{"Cambodia", "Thailand", "Vietnam", "India"}),
              countries_of(ranking));
    ASSERT_NEAR(299.7635, ranking.entries[0].deaths, 1e-3);

    auto dalys = analytics.lowest_health_burden(global_scope(), 2019, "DALYs", false);
    ASSERT_EQ("DALYS", dalys.metric);
    ASSERT_EQ("India", dalys.entries.front().country);
    ASSERT_NEAR(dalys.entries.front().deaths * 12.5, dalys.entries.front().value, 1e-9);
}

TEST_F(ExecutiveAnalyticsTest, Sensitivity) {
    auto result = analytics.sensitivity(global_scope(), 2019);

    ASSERT_DOUBLE_EQ(-5.0, result.delta_percent);
    ASSERT_EQ(4u, result.per_country.size());
    ASSERT_EQ("India", result.per_country[0].country);
    ASSERT_NEAR(154.18883, result.per_country[0].prevented_per_1pct, 1e-4);
    ASSERT_EQ("Cambodia", result.per_country[3].country);
    ASSERT_EQ(3u, result.top_sensitive.size());
    ASSERT_EQ("Vietnam", result.top_sensitive[1].country);
    ASSERT_NEAR((154.18883 + 18.43807 + 11.46370 + 3.14707) / 4.0, result.avg_prevented_per_1pct,
                1e-4);
}

TEST_F(ExecutiveAnalyticsTest, DeathsChangeYearOverYear) {
    auto result = analytics.deaths_change_yoy("Thailand", 2019);

    ASSERT_EQ(2018, result.previous_year.value());
    ASSERT_NEAR(1091.3433, result.deaths_previous.value(), 1e-3);
    ASSERT_NEAR(-10.23016, result.pct_change.value(), 1e-4);
    ASSERT_EQ("Decreased", result.direction);
    ASSERT_FALSE(result.note.has_value());

    auto flat = analytics.deaths_change_yoy("Thailand", 2020);
    ASSERT_EQ("Unchanged", flat.direction);
}

TEST_F(ExecutiveAnalyticsTest, DeathsChangeWithoutPreviousYear) {
    auto first = analytics.deaths_change_yoy("Cambodia", 2018);
    ASSERT_GT(first.deaths_current, 0.0);
    ASSERT_FALSE(first.previous_year.has_value());
    ASSERT_TRUE(first.note.has_value());
    ASSERT_TRUE(first.direction.empty());

    auto none = analytics.deaths_change_yoy("Germany", 2020);
    ASSERT_DOUBLE_EQ(0.0, none.deaths_current);
    ASSERT_FALSE(none.pct_change.has_value());
}

TEST_F(ExecutiveAnalyticsTest, RankDeathsChange) {
    auto ranking = analytics.rank_deaths_change(global_scope(), 2020);

    ASSERT_EQ((std::vector<std::string>{"Cambodia", "Vietnam", "India", "Thailand"}),
              countries_of(ranking));
    ASSERT_NEAR(4.11809, ranking.entries[0].pct_change.value(), 1e-4);
}

TEST_F(ExecutiveAnalyticsTest, RankRisk) {
    auto ranking = analytics.rank_risk(global_scope(), 2020);

    ASSERT_EQ("risk_score", ranking.metric);
    ASSERT_EQ((std::vector<std::string>{"India", "Vietnam", "Cambodia", "Thailand", "Germany"}),
              countries_of(ranking));
    ASSERT_EQ("Very High", ranking.entries[0].risk.tier);
}

TEST_F(ExecutiveAnalyticsTest, ExplainModelDrivers) {
    auto general = analytics.explain(std::nullopt, 2025);

    ASSERT_EQ("persistence", general.model);
    ASSERT_FALSE(general.country.has_value());
    ASSERT_EQ(3u, general.drivers.size());
    ASSERT_EQ("lag_1y", general.drivers[0].feature);
    ASSERT_DOUBLE_EQ(1.0, general.drivers[0].coefficient.value());
    ASSERT_FALSE(general.drivers[1].coefficient.has_value());
    ASSERT_TRUE(general.top_diseases.empty());

    auto thailand = analytics.explain("thailand", 2025);
    ASSERT_EQ("Thailand", thailand.country.value());
    ASSERT_DOUBLE_EQ(20.0, thailand.forecast->pm25);
    ASSERT_EQ(2u, thailand.top_diseases.size());
}

TEST_F(ExecutiveAnalyticsTest, CompareHealth) {
    auto result = analytics.compare_health("Thailand", "India", 2025);

    ASSERT_DOUBLE_EQ(20.0, result.first_forecast.pm25);
    ASSERT_DOUBLE_EQ(90.0, result.second_forecast.pm25);
    ASSERT_EQ("India", result.health.second.country);
    ASSERT_NEAR(979.6971, result.health.first.total_deaths, 1e-3);
}

TEST_F(ExecutiveAnalyticsTest, MonthRankings) {
    auto best = analytics.best_months("Thailand", 2025);
    ASSERT_TRUE(best.ascending);
    ASSERT_EQ(12u, best.months.size());
    ASSERT_EQ("July", best.months.front().name);
    ASSERT_NEAR(15.0, best.months.front().pm25, 1e-9);

    auto worst = analytics.worst_months("Thailand", 2025);
    ASSERT_EQ("February", worst.months.front().name);
    ASSERT_EQ("January", worst.months[1].name);
    ASSERT_EQ("Southeast Asia", worst.seasonal_region);
}

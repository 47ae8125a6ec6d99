#include "pch.h"
#include "reference_fixture.h"

#include "HealthAQ/errors.h"
#include "HealthAQ/exposure.h"
#include "HealthAQ/pm25_forecaster.h"

#include <stdexcept>

namespace {

class PM25ForecasterTest : public ::testing::Test {
  protected:
    PM25ForecasterTest() : forecaster{haq::testing::test_reference_data()} {}

    haq::PM25Forecaster forecaster;
};

} // anonymous namespace

TEST(TestHealthAQ_Uncertainty, ConfidenceTiers) {
    using namespace haq;

    ASSERT_EQ("High", forecast_confidence(-5).level);
    ASSERT_EQ("High", forecast_confidence(3).level);
    ASSERT_EQ("Moderate", forecast_confidence(4).level);
    ASSERT_DOUBLE_EQ(0.70, forecast_confidence(7).score);
    ASSERT_EQ("Low", forecast_confidence(12).level);
    ASSERT_EQ("Speculative", forecast_confidence(13).level);
    ASSERT_DOUBLE_EQ(0.30, forecast_confidence(40).score);
}

TEST(TestHealthAQ_Uncertainty, PM25IntervalClampedToTmrel) {
    using namespace haq;

    auto interval = pm25_interval(20.0, 0.90);
    ASSERT_NEAR(1.0, interval.half_width, 1e-9);
    ASSERT_NEAR(19.0, interval.lower, 1e-9);
    ASSERT_NEAR(21.0, interval.upper, 1e-9);

    auto clamped = pm25_interval(6.0, 0.30);
    ASSERT_NEAR(2.1, clamped.half_width, 1e-9);
    ASSERT_DOUBLE_EQ(TMREL, clamped.lower);
    ASSERT_NEAR(8.1, clamped.upper, 1e-9);
}

TEST_F(PM25ForecasterTest, ComputeFeatures) {
    const auto &series = forecaster.data().pm25_history("Thailand");
    auto features = haq::PM25Forecaster::compute_features(series, 2020);

    ASSERT_TRUE(features.has_value());
    ASSERT_DOUBLE_EQ(20.0, features->lag_1y);
    ASSERT_DOUBLE_EQ(23.0, features->lag_3y);
    ASSERT_DOUBLE_EQ(-2.0, features->yoy_change);
    ASSERT_NEAR(-2.0 / 22.0, features->yoy_pct_change, 1e-12);
    ASSERT_NEAR(65.0 / 3.0, features->rolling_mean_3y, 1e-12);
    ASSERT_NEAR(22.8, features->rolling_mean_5y, 1e-12);
    ASSERT_DOUBLE_EQ(2020.0, features->year);
}

TEST_F(PM25ForecasterTest, ComputeFeaturesNeedsHistory) {
    using haq::PM25Forecaster;

    ASSERT_FALSE(PM25Forecaster::compute_features({{2019, 20.0}, {2020, 21.0}}, 2021));
    ASSERT_FALSE(PM25Forecaster::compute_features(
        {{2017, 20.0}, {2018, 21.0}, {2019, 22.0}}, 2021));
}

TEST_F(PM25ForecasterTest, PredictStepPersistence) {
    ASSERT_DOUBLE_EQ(haq::PM25Forecaster::EmptyHistoryValue, forecaster.predict_step({}, 2021));
    ASSERT_DOUBLE_EQ(18.0, forecaster.predict_step({{2020, 18.0}}, 2021));
    ASSERT_DOUBLE_EQ(haq::TMREL, forecaster.predict_step({{2020, 3.0}}, 2021));
    ASSERT_THROW(forecaster.predict_from({}, 2025), std::invalid_argument);
}

TEST_F(PM25ForecasterTest, PredictFromExtendsHistory) {
    auto working = forecaster.predict_from({{2018, 10.0}, {2019, 11.0}, {2020, 12.0}}, 2023);

    ASSERT_EQ(6u, working.size());
    ASSERT_DOUBLE_EQ(12.0, working.at(2023));
}

TEST_F(PM25ForecasterTest, ForecastObservedYear) {
    auto point = forecaster.forecast("Thailand", 2015);

    ASSERT_EQ("Thailand", point.country);
    ASSERT_EQ(2015, point.year);
    ASSERT_DOUBLE_EQ(25.0, point.pm25);
    ASSERT_FALSE(point.is_predicted);
    ASSERT_EQ("High", point.confidence.level);
}

TEST_F(PM25ForecasterTest, ForecastFutureYear) {
    auto point = forecaster.forecast("thailand", 2025);

    ASSERT_EQ("Thailand", point.country);
    ASSERT_DOUBLE_EQ(20.0, point.pm25);
    ASSERT_TRUE(point.is_predicted);
    ASSERT_EQ("Moderate", point.confidence.level);
    ASSERT_DOUBLE_EQ(0.70, point.confidence.score);
}

TEST_F(PM25ForecasterTest, ForecastInvalidRequestThrows) {
    ASSERT_THROW(forecaster.forecast("Thailand", 2005), haq::YearOutOfRangeError);
    ASSERT_THROW(forecaster.forecast("Atlantis", 2025), haq::UnknownCountryError);
}

TEST_F(PM25ForecasterTest, ForecastPath) {
    auto path = forecaster.path("Vietnam", 2024);

    ASSERT_EQ(4u, path.size());
    ASSERT_EQ(2021, path.front().year);
    ASSERT_EQ(2024, path.back().year);
    for (const auto &point : path) {
        ASSERT_TRUE(point.is_predicted);
        ASSERT_DOUBLE_EQ(32.0, point.pm25);
    }

    ASSERT_TRUE(forecaster.path("Vietnam", 2020).empty());
}

TEST_F(PM25ForecasterTest, ForecastRangeMixesObservedAndPredicted) {
    auto points = forecaster.range("Cambodia", haq::core::YearInterval{2018, 2022});

    ASSERT_EQ(5u, points.size());
    ASSERT_DOUBLE_EQ(24.0, points[0].pm25);
    ASSERT_DOUBLE_EQ(26.0, points[2].pm25);
    ASSERT_FALSE(points[2].is_predicted);
    ASSERT_DOUBLE_EQ(26.0, points[4].pm25);
    ASSERT_TRUE(points[3].is_predicted);
}

TEST_F(PM25ForecasterTest, ObservedHistory) {
    auto history = forecaster.history("Germany");

    ASSERT_EQ(6u, history.size());
    ASSERT_EQ(2015, history.front().year);
    ASSERT_DOUBLE_EQ(9.5, history.back().pm25);
    ASSERT_EQ(2019, forecaster.last_observed_year("Thailand"));
}

TEST_F(PM25ForecasterTest, ChangeBetweenYears) {
    auto rise = forecaster.change("India", 2015, 2020);
    ASSERT_DOUBLE_EQ(80.0, rise.from_pm25);
    ASSERT_DOUBLE_EQ(90.0, rise.to_pm25);
    ASSERT_DOUBLE_EQ(10.0, rise.abs_change);
    ASSERT_DOUBLE_EQ(12.5, rise.pct_change);
    ASSERT_EQ("↑", rise.arrow);

    auto fall = forecaster.change("Germany", 2015, 2020);
    ASSERT_NEAR(-20.8333, fall.pct_change, 1e-4);
    ASSERT_EQ("↓", fall.arrow);

    auto flat = forecaster.yoy_change("Vietnam", 2025);
    ASSERT_EQ(2024, flat.from_year);
    ASSERT_DOUBLE_EQ(0.0, flat.pct_change);
    ASSERT_EQ("→", flat.arrow);
}

TEST_F(PM25ForecasterTest, MonthlySeasonalDecomposition) {
    auto monthly = forecaster.monthly("Thailand", 2019);

    ASSERT_EQ("Southeast Asia", monthly.seasonal_region);
    ASSERT_DOUBLE_EQ(20.0, monthly.annual_pm25);
    ASSERT_NEAR(24.0, monthly.values[0], 1e-9);
    ASSERT_NEAR(15.0, monthly.values[6], 1e-9);

    auto neutral = forecaster.monthly("Germany", 2020);
    ASSERT_EQ("Default", neutral.seasonal_region);
    for (auto value : neutral.values) {
        ASSERT_DOUBLE_EQ(9.5, value);
    }
}

TEST_F(PM25ForecasterTest, MonthlySinglePoint) {
    auto point = forecaster.monthly("India", 2020, 1);

    ASSERT_EQ("January", point.month_name);
    ASSERT_EQ("South Asia", point.seasonal_region);
    ASSERT_DOUBLE_EQ(1.30, point.seasonal_factor);
    ASSERT_NEAR(117.0, point.pm25, 1e-9);
    ASSERT_DOUBLE_EQ(90.0, point.annual_pm25);

    ASSERT_THROW(forecaster.monthly("India", 2020, 13), std::out_of_range);
    ASSERT_THROW(haq::PM25Forecaster::month_name(0), std::out_of_range);
    ASSERT_EQ("December", haq::PM25Forecaster::month_name(12));
}

TEST_F(PM25ForecasterTest, NeutralSeasonalFactors) {
    const auto &factors = haq::PM25Forecaster::seasonal_factors("Narnia");
    for (auto factor : factors) {
        ASSERT_DOUBLE_EQ(1.0, factor);
    }
}

TEST(TestHealthAQ_PM25Forecaster, NextYearFollowsWorkingHistory) {
    auto forecaster = haq::PM25Forecaster{haq::testing::test_reference_data_trend_model()};
    auto working = forecaster.data().pm25_history("Thailand");

    // 1 + 0.9 * 20 + 0.5 * (20 - 22)
    ASSERT_NEAR(18.0, forecaster.predict_from(working, 2020).at(2020), 1e-9);

    working[2019] = 25.0;
    ASSERT_NEAR(25.0, forecaster.predict_from(working, 2020).at(2020), 1e-9);

    // Outside the model features
    working[2019] = 20.0;
    working[2016] = 60.0;
    ASSERT_NEAR(18.0, forecaster.predict_from(working, 2020).at(2020), 1e-9);
}

TEST(TestHealthAQ_PM25Forecaster, PathFeedsPredictionsForward) {
    auto forecaster = haq::PM25Forecaster{haq::testing::test_reference_data_trend_model()};
    auto path = forecaster.path("Thailand", 2027);

    ASSERT_EQ(8u, path.size());
    ASSERT_EQ(2020, path.front().year);
    ASSERT_EQ(2027, path.back().year);
    ASSERT_NEAR(18.0, path[0].pm25, 1e-9);
    ASSERT_NEAR(16.2, path[1].pm25, 1e-9);
    ASSERT_NEAR(14.68, path[2].pm25, 1e-9);

    // Without the 2020 prediction the 2021 step falls back to persistence
    const auto &observed = forecaster.data().pm25_history("Thailand");
    ASSERT_DOUBLE_EQ(20.0, forecaster.predict_step(observed, 2021));

    for (auto i = 1u; i < path.size(); i++) {
        ASSERT_TRUE(path[i].is_predicted);
        ASSERT_LT(path[i].pm25, path[i - 1].pm25);
    }

    ASSERT_NEAR(path.back().pm25, forecaster.forecast("Thailand", 2027).pm25, 1e-9);
}

TEST(TestHealthAQ_PM25Forecaster, ObservedHistoryClampedToTmrel) {
    auto forecaster = haq::PM25Forecaster{haq::testing::test_reference_data_clean_air()};
    auto history = forecaster.history("Iceland");

    ASSERT_EQ(5u, history.size());
    ASSERT_DOUBLE_EQ(6.0, history[0].pm25);
    ASSERT_DOUBLE_EQ(5.5, history[1].pm25);
    for (auto i = 2u; i < history.size(); i++) {
        ASSERT_DOUBLE_EQ(haq::TMREL, history[i].pm25);
        ASSERT_FALSE(history[i].is_predicted);
    }

    ASSERT_DOUBLE_EQ(haq::TMREL, forecaster.forecast("Iceland", 2018).pm25);
}

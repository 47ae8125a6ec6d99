#include "pch.h"

#include "HealthAQ/linear_forecast_model.h"

#include <stdexcept>

TEST(TestHealthAQ_LinearForecastModel, CreateFromCoefficients) {
    using namespace haq;
    auto model = LinearForecastModel{"test", 1.0, {{"lag_1y", 0.8}, {"rolling_mean_3y", 0.2}}};

    ASSERT_EQ("test", model.name());
    ASSERT_DOUBLE_EQ(1.0, model.intercept());
    ASSERT_EQ(2u, model.features().size());
    ASSERT_EQ("lag_1y", model.features().front());
    ASSERT_DOUBLE_EQ(0.8, model.coefficient("lag_1y").value());
    ASSERT_DOUBLE_EQ(0.2, model.coefficient("rolling_mean_3y").value());
    ASSERT_FALSE(model.coefficient("year").has_value());
}

TEST(TestHealthAQ_LinearForecastModel, CreateFromDefinition) {
    using namespace haq;
    auto definition = core::LinearModelData{.name = "pm25_linear",
                                            .formula = "pm25 ~ lag_1y + year",
                                            .intercept = -10.0,
                                            .coefficients = {{"lag_1y", 0.9}, {"year", 0.005}}};
    auto model = LinearForecastModel{definition};

    ASSERT_EQ("pm25_linear", model.name());
    ASSERT_DOUBLE_EQ(-10.0, model.intercept());
    ASSERT_DOUBLE_EQ(0.005, model.coefficient("year").value());
}

TEST(TestHealthAQ_LinearForecastModel, CreateInvalidThrows) {
    using namespace haq;
    using Coefficients = std::vector<std::pair<std::string, double>>;

    ASSERT_THROW(LinearForecastModel("empty", 0.0, Coefficients{}), std::invalid_argument);
    ASSERT_THROW(LinearForecastModel("bad", 0.0, Coefficients{{"lag_9y", 1.0}}),
                 std::invalid_argument);
}

TEST(TestHealthAQ_LinearForecastModel, PredictWeightedSum) {
    using namespace haq;
    auto model = LinearForecastModel{"test", 1.0, {{"lag_1y", 0.8}, {"rolling_mean_3y", 0.2}}};
    auto features = ForecastFeatures{.lag_1y = 20.0, .rolling_mean_3y = 25.0, .year = 2026.0};

    ASSERT_DOUBLE_EQ(22.0, model.predict(features));
}

TEST(TestHealthAQ_LinearForecastModel, PredictIsUnclamped) {
    using namespace haq;
    auto model = LinearForecastModel{"negative", -50.0, {{"lag_1y", 1.0}}};

    ASSERT_DOUBLE_EQ(-40.0, model.predict(ForecastFeatures{.lag_1y = 10.0}));
}

TEST(TestHealthAQ_LinearForecastModel, FeatureValuesByName) {
    using namespace haq;
    auto features = ForecastFeatures{.lag_1y = 1.0,
                                     .lag_3y = 2.0,
                                     .yoy_change = 3.0,
                                     .yoy_pct_change = 4.0,
                                     .rolling_mean_3y = 5.0,
                                     .rolling_mean_5y = 6.0,
                                     .year = 7.0};

    const auto &names = ForecastFeatures::names();
    ASSERT_EQ(7u, names.size());
    auto expected = 1.0;
    for (const auto &name : names) {
        ASSERT_DOUBLE_EQ(expected, features.value(name));
        expected += 1.0;
    }

    ASSERT_THROW(features.value("lag_2y"), std::out_of_range);
}
